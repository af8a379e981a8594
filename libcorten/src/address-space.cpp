#include <corten/address-space.hpp>
#include <corten/debug.hpp>

namespace corten {

namespace {
	constexpr bool logLocking = false;
} // anonymous namespace

frg::expected<Error, std::shared_ptr<AddressSpace>>
AddressSpace::create(std::shared_ptr<FrameAllocator> frames, const Options &options) {
	auto space = std::make_shared<AddressSpace>(std::move(frames), options);
	FRG_TRY(space->_initialize());
	return space;
}

AddressSpace::AddressSpace(std::shared_ptr<FrameAllocator> frames, const Options &options)
: _options{options}, _frames{std::move(frames)}, _arena{options.maxTables},
		_reclaimer{&_arena, options.logReclaim} { }

AddressSpace::~AddressSpace() {
	if(!_root)
		return;

	_reclaimer.drain();

	// Drop the references of all frames that are still mapped.
	// The tables themselves are freed together with the arena.
	auto cursor = lock(0, kSpaceLimit);
	cursor.forEach([&] (VirtualAddr, Pte &pte, PteMetadata &md) {
		if(pte.frame)
			_frames->release(*pte.frame);
		pte = Pte{};
		md = PteMetadata{};
	});
}

frg::expected<Error> AddressSpace::_initialize() {
	_root = FRG_TRY(_arena.allocate(rootLevel));
	return {};
}

RangeCursor AddressSpace::lock(VirtualAddr lo, VirtualAddr hi) {
	assert(lo < hi);
	assert(hi <= kSpaceLimit);
	assert(isPageAligned(lo) && isPageAligned(hi));

	while(true) {
		RcuReadGuard guard{&_reclaimer};

		// Find the covering node without holding any locks across the descent.
		// Stop above a child whose span equals the range, such that the child
		// can be removed while holding its parent.
		auto node = _root;
		VirtualAddr base = 0;
		bool retry = false;
		while(!node->isLeaf()) {
			auto span = entrySpan(node->level());
			auto i = indexAt(node->level(), lo);
			auto childBase = base + i * span;
			if(hi > childBase + span)
				break;
			if(lo == childBase && hi == childBase + span)
				break;

			PageTableNode *child;
			if(auto index = node->child(i); index != noNode) {
				child = _arena.get(index);
			}else{
				// Missing tables are created up front. Otherwise, the parent would
				// become the covering node and serialize unrelated ranges below it.
				auto outcome = _createChild(node, i, lo);
				if(!outcome)
					break; // Out of tables; cursor operations report noMemory.
				child = outcome.value();
				if(!child) {
					retry = true;
					break;
				}
			}
			node = child;
			base = childBase;
		}

		if(!retry) {
			node->lock();
			if(!node->isStale()) {
				// Locked tables that are not stale cannot be retired by anybody else.
				// All other tables are reached through locked parents.
				guard.unlock();

				std::vector<PageTableNode *> held;
				held.push_back(node);
				_lockSubtree(node, base, lo, hi, held);

				if(logLocking)
					infoLogger() << "corten: Locked " << held.size() << " tables for "
							<< "0x" << frg::hex_fmt(lo) << " - 0x" << frg::hex_fmt(hi) << frg::endlog;
				return RangeCursor{this, lo, hi, node, base, std::move(held)};
			}
			node->unlock();
		}

		_lockRetries.fetch_add(1, std::memory_order_relaxed);
		if(logLocking)
			infoLogger() << "corten: Table on the path to 0x" << frg::hex_fmt(lo)
					<< " - 0x" << frg::hex_fmt(hi) << " went stale, retrying" << frg::endlog;
	}
}

frg::expected<Error, PageTableNode *>
AddressSpace::_createChild(PageTableNode *parent, size_t i, VirtualAddr va) {
	parent->lock();
	if(parent->isStale()) {
		parent->unlock();
		return static_cast<PageTableNode *>(nullptr);
	}

	// Another thread may have linked the table in the meantime.
	if(auto index = parent->child(i); index != noNode) {
		parent->unlock();
		return _arena.get(index);
	}

	auto child = _arena.allocate(parent->level() - 1);
	if(child)
		parent->setChild(i, child.value()->index());
	parent->unlock();
	if(!child)
		return child.error();

	_tablesCreated.fetch_add(1, std::memory_order_relaxed);
	if(_options.logTables)
		infoLogger() << "corten: Created level " << child.value()->level() << " table #"
				<< child.value()->index() << " for 0x" << frg::hex_fmt(va) << frg::endlog;
	return child.value();
}

void AddressSpace::_lockSubtree(PageTableNode *node, VirtualAddr base,
		VirtualAddr lo, VirtualAddr hi, std::vector<PageTableNode *> &held) {
	if(node->isLeaf())
		return;

	auto span = entrySpan(node->level());
	for(size_t i = 0; i < entriesPerTable; i++) {
		auto childBase = base + i * span;
		if(childBase + span <= lo)
			continue;
		if(childBase >= hi)
			break;

		auto index = node->child(i);
		if(index == noNode)
			continue;
		auto child = _arena.get(index);
		child->lock();
		held.push_back(child);
		_lockSubtree(child, childBase, lo, hi, held);
	}
}

} // namespace corten
