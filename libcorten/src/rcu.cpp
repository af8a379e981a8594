#include <corten/debug.hpp>
#include <corten/rcu.hpp>
#include <frg/mutex.hpp>

namespace corten {

RcuReclaimer::RcuReclaimer(NodeArena *arena, bool logReclaim)
: _arena{arena}, _logReclaim{logReclaim} {
	_readers[0].store(0, std::memory_order_relaxed);
	_readers[1].store(0, std::memory_order_relaxed);
}

RcuReclaimer::~RcuReclaimer() {
	assert(_pending.empty() && "reclaimer destroyed with pending nodes");
}

uint64_t RcuReclaimer::enterReadSide() {
	while(true) {
		auto e = _epoch.load(std::memory_order_seq_cst);
		_readers[e & 1].fetch_add(1, std::memory_order_seq_cst);
		// If the epoch moved on in the meantime, the advancing thread might have
		// missed our registration.
		if(_epoch.load(std::memory_order_seq_cst) == e)
			return e;
		_readers[e & 1].fetch_sub(1, std::memory_order_seq_cst);
	}
}

void RcuReclaimer::exitReadSide(uint64_t ticket) {
	auto previous = _readers[ticket & 1].fetch_sub(1, std::memory_order_release);
	assert(previous);
	(void)previous;
}

void RcuReclaimer::deferFree(PageTableNode *node) {
	assert(node->isStale());

	auto lock = frg::guard(&_mutex);
	node->_removalEpoch = _epoch.load(std::memory_order_relaxed);
	_pending.push_back(node);
	_numPending.fetch_add(1, std::memory_order_relaxed);
}

size_t RcuReclaimer::tryReclaim() {
	NodeList collected;
	uint64_t e;
	{
		auto lock = frg::guard(&_mutex);

		e = _epoch.load(std::memory_order_relaxed);
		// Readers of epoch e - 1 share their counter with epoch e + 1.
		if(!_readers[(e + 1) & 1].load(std::memory_order_seq_cst)) {
			e++;
			_epoch.store(e, std::memory_order_seq_cst);
		}

		while(!_pending.empty()) {
			auto node = _pending.front();
			if(node->_removalEpoch + 2 > e)
				break;
			_pending.pop_front();
			collected.push_back(node);
		}
	}

	auto n = _free(collected);
	if(_logReclaim && n)
		infoLogger() << "corten: Reclaimed " << n << " page tables at epoch " << e
				<< frg::endlog;
	return n;
}

size_t RcuReclaimer::drain() {
	assert(!numReaders());

	NodeList collected;
	{
		auto lock = frg::guard(&_mutex);
		collected.splice(collected.end(), _pending);
	}

	return _free(collected);
}

size_t RcuReclaimer::_free(NodeList &list) {
	size_t n = 0;
	while(!list.empty()) {
		auto node = list.pop_front();
		_arena->free(node);
		n++;
	}
	_numPending.fetch_sub(n, std::memory_order_relaxed);
	_numReclaimed.fetch_add(n, std::memory_order_relaxed);
	return n;
}

} // namespace corten
