#include <algorithm>
#include <utility>

#include <corten/address-space.hpp>
#include <corten/cursor.hpp>
#include <corten/debug.hpp>

namespace corten {

PageTableNode *resolveChild(AddressSpace *space, PageTableNode *node, size_t i) {
	auto index = node->child(i);
	if(index == noNode)
		return nullptr;
	return space->arena().get(index);
}

RangeCursor::RangeCursor(AddressSpace *space, VirtualAddr lo, VirtualAddr hi,
		PageTableNode *covering, VirtualAddr coveringBase,
		std::vector<PageTableNode *> held)
: _space{space}, _lo{lo}, _hi{hi}, _covering{covering}, _coveringBase{coveringBase},
		_held{std::move(held)} { }

RangeCursor::RangeCursor(RangeCursor &&other)
: _space{other._space}, _lo{other._lo}, _hi{other._hi},
		_covering{std::exchange(other._covering, nullptr)}, _coveringBase{other._coveringBase},
		_held{std::move(other._held)}, _retired{std::move(other._retired)} {
	other._held.clear();
	other._retired.clear();
}

RangeCursor &RangeCursor::operator= (RangeCursor &&other) {
	if(this == &other)
		return *this;
	release();
	_space = other._space;
	_lo = other._lo;
	_hi = other._hi;
	_covering = std::exchange(other._covering, nullptr);
	_coveringBase = other._coveringBase;
	_held = std::move(other._held);
	_retired = std::move(other._retired);
	other._held.clear();
	other._retired.clear();
	return *this;
}

frg::expected<Error, PageTableNode *> RangeCursor::_walk(VirtualAddr va, bool create) {
	assert(_covering);
	assert(_inRange(va));

	auto node = _covering;
	while(!node->isLeaf()) {
		auto i = indexAt(node->level(), va);
		auto child = resolveChild(_space, node, i);
		if(!child) {
			if(!create)
				return static_cast<PageTableNode *>(nullptr);

			// New tables are invisible to other cursors until they are linked.
			child = FRG_TRY(_space->_arena.allocate(node->level() - 1));
			child->lock();
			_held.push_back(child);
			node->setChild(i, child->index());
			_space->_tablesCreated.fetch_add(1, std::memory_order_relaxed);

			if(_space->_options.logTables)
				infoLogger() << "corten: Created level " << child->level() << " table #"
						<< child->index() << " for 0x" << frg::hex_fmt(va) << frg::endlog;
		}
		node = child;
	}
	return node;
}

Status RangeCursor::query(VirtualAddr va) {
	auto leaf = _walk(va, false).value();
	if(!leaf)
		return Status::unmapped;
	return leaf->readMetadata(indexAt(0, va)).status;
}

frg::expected<Error> RangeCursor::map(VirtualAddr va, FrameNumber frame, PageFlags flags) {
	assert(isPageAligned(va));
	auto leaf = FRG_TRY(_walk(va, true));
	auto i = indexAt(0, va);

	leaf->entry(i) = Pte{frame, flags, true};
	leaf->writeMetadata(i, PteMetadata{Status::mapped, flags, _currentRefcount(frame)});
	return {};
}

std::optional<FrameNumber> RangeCursor::unmap(VirtualAddr va) {
	auto leaf = _walk(va, false).value();
	if(!leaf)
		return std::nullopt;
	auto i = indexAt(0, va);

	auto frame = leaf->entry(i).frame;
	leaf->entry(i) = Pte{};
	leaf->writeMetadata(i, PteMetadata{});
	return frame;
}

frg::expected<Error> RangeCursor::populate(VirtualAddr base, size_t length) {
	assert(isPageAligned(base) && isPageAligned(length));
	assert(base >= _lo && base + length <= _hi);

	auto end = base + length;
	for(auto va = base; va < end; va = (va & ~(tableSpan(0) - 1)) + tableSpan(0))
		FRG_TRY(_walk(va, true));
	return {};
}

frg::expected<Error> RangeCursor::mark(VirtualAddr base, size_t length, Status status,
		PageFlags softPermissions) {
	assert(isPageAligned(base) && isPageAligned(length));
	assert(base >= _lo && base + length <= _hi);

	// Resetting pages to unmapped never needs new tables.
	bool create;
	switch(status) {
	case Status::unmapped:
		create = false;
		break;
	case Status::privateAnon:
	case Status::mapped:
	case Status::cowShared:
		create = true;
		break;
	}

	auto va = base;
	auto end = base + length;
	while(va < end) {
		auto leaf = FRG_TRY(_walk(va, create));
		auto tableEnd = std::min(end, (va & ~(tableSpan(0) - 1)) + tableSpan(0));
		if(leaf) {
			for(; va < tableEnd; va += kPageSize)
				leaf->writeMetadata(indexAt(0, va), PteMetadata{status, softPermissions, 0});
		}
		va = tableEnd;
	}
	return {};
}

Pte *RangeCursor::entry(VirtualAddr va) {
	auto leaf = _walk(va, false).value();
	if(!leaf)
		return nullptr;
	return &leaf->entry(indexAt(0, va));
}

PteMetadata RangeCursor::metadata(VirtualAddr va) {
	auto leaf = _walk(va, false).value();
	if(!leaf)
		return PteMetadata{};
	auto i = indexAt(0, va);
	auto md = leaf->readMetadata(i);
	auto &pte = leaf->entry(i);
	if(pte.present && pte.frame)
		md.refcount = _currentRefcount(*pte.frame);
	return md;
}

frg::expected<Error> RangeCursor::setMetadata(VirtualAddr va, PteMetadata md) {
	auto leaf = FRG_TRY(_walk(va, true));
	leaf->writeMetadata(indexAt(0, va), md);
	return {};
}

uint32_t RangeCursor::_currentRefcount(FrameNumber frame) {
	return static_cast<uint32_t>(_space->frameAllocator()->referenceCount(frame));
}

void RangeCursor::writeProtect(VirtualAddr va) {
	auto pte = entry(va);
	assert(pte && pte->present);
	pte->flags &= ~page_access::write;
}

void RangeCursor::removeTables() {
	assert(_covering);
	auto before = _retired.size();
	_removeIn(_covering, _coveringBase);

	auto n = _retired.size() - before;
	_space->_tablesRetired.fetch_add(n, std::memory_order_relaxed);
	if(_space->_options.logTables && n)
		infoLogger() << "corten: Retired " << n << " tables in "
				<< "0x" << frg::hex_fmt(_lo) << " - 0x" << frg::hex_fmt(_hi) << frg::endlog;
}

void RangeCursor::_removeIn(PageTableNode *node, VirtualAddr base) {
	if(node->isLeaf())
		return;

	auto span = entrySpan(node->level());
	for(size_t i = 0; i < entriesPerTable; i++) {
		auto childBase = base + i * span;
		if(childBase + span <= _lo)
			continue;
		if(childBase >= _hi)
			break;

		auto child = resolveChild(_space, node, i);
		if(!child)
			continue;

		if(childBase >= _lo && childBase + span <= _hi) {
			node->setChild(i, noNode);
			_retireSubtree(child);
		}else{
			_removeIn(child, childBase);
		}
	}
}

void RangeCursor::_retireSubtree(PageTableNode *node) {
	// Every table below the covering node that intersects the range is locked by us.
	assert(node->heldByCurrentThread());
	node->markStale();
	_retired.push_back(node);

	if(node->isLeaf())
		return;
	for(size_t i = 0; i < entriesPerTable; i++) {
		auto child = resolveChild(_space, node, i);
		if(child)
			_retireSubtree(child);
	}
}

void RangeCursor::release() {
	if(!_covering)
		return;

	for(auto it = _held.rbegin(); it != _held.rend(); ++it)
		(*it)->unlock();
	_held.clear();
	_covering = nullptr;

	auto &reclaimer = _space->_reclaimer;
	for(auto node : _retired)
		reclaimer.deferFree(node);
	_retired.clear();

	if(reclaimer.numPending())
		reclaimer.tryReclaim();
}

} // namespace corten
