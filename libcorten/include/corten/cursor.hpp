#pragma once

#include <assert.h>

#include <optional>
#include <vector>

#include <frg/expected.hpp>

#include <corten/error.hpp>
#include <corten/page-table.hpp>
#include <corten/types.hpp>

namespace corten {

struct AddressSpace;

// Handle on a locked and validated part of the translation tree that covers [lo, hi).
// All operations require va to lie inside the range.
// The locks are held until release() is called or the cursor is destructed.
struct RangeCursor {
	friend struct AddressSpace;

	RangeCursor()
	: _space{nullptr}, _lo{0}, _hi{0}, _covering{nullptr}, _coveringBase{0} { }

	RangeCursor(const RangeCursor &) = delete;

	RangeCursor(RangeCursor &&other);

	RangeCursor &operator= (const RangeCursor &) = delete;

	RangeCursor &operator= (RangeCursor &&other);

	~RangeCursor() {
		release();
	}

	explicit operator bool () {
		return _covering;
	}

	VirtualAddr lo() {
		return _lo;
	}

	VirtualAddr hi() {
		return _hi;
	}

	// Deepest node whose span covers the range.
	PageTableNode *coveringNode() {
		return _covering;
	}

	size_t numLockedTables() {
		return _held.size();
	}

	Status query(VirtualAddr va);

	// Installs a present entry. Creates missing tables.
	frg::expected<Error> map(VirtualAddr va, FrameNumber frame, PageFlags flags);

	// Clears the entry and its metadata. Returns the frame that was mapped (if any).
	std::optional<FrameNumber> unmap(VirtualAddr va);

	// Creates all leaf tables that back [base, base + length).
	// Fails without touching any entry if the tables run out.
	frg::expected<Error> populate(VirtualAddr base, size_t length);

	// Sets the metadata of all pages in [base, base + length). Leaves the PTEs alone.
	frg::expected<Error> mark(VirtualAddr base, size_t length, Status status,
			PageFlags softPermissions);

	// Returns nullptr if no leaf table covers va.
	Pte *entry(VirtualAddr va);

	// The reference count is read from the frame allocator for present entries.
	PteMetadata metadata(VirtualAddr va);

	frg::expected<Error> setMetadata(VirtualAddr va, PteMetadata md);

	void writeProtect(VirtualAddr va);

	// Calls fn(va, pte, md) for every populated entry in the range, in address order.
	template<typename F>
	void forEach(F fn) {
		assert(_covering);
		_forEachIn(_covering, _coveringBase, fn);
	}

	// Unlinks all tables whose span lies completely inside the range.
	// The tables are handed to the reclaimer on release().
	void removeTables();

	void release();

private:
	RangeCursor(AddressSpace *space, VirtualAddr lo, VirtualAddr hi,
			PageTableNode *covering, VirtualAddr coveringBase,
			std::vector<PageTableNode *> held);

	bool _inRange(VirtualAddr va) {
		return va >= _lo && va < _hi;
	}

	// Returns the leaf table for va, or nullptr if it does not exist and create is false.
	frg::expected<Error, PageTableNode *> _walk(VirtualAddr va, bool create);

	uint32_t _currentRefcount(FrameNumber frame);

	void _removeIn(PageTableNode *node, VirtualAddr base);
	void _retireSubtree(PageTableNode *node);

	template<typename F>
	void _forEachIn(PageTableNode *node, VirtualAddr base, F &fn);

	AddressSpace *_space;
	VirtualAddr _lo;
	VirtualAddr _hi;
	PageTableNode *_covering;
	VirtualAddr _coveringBase;

	// In acquisition order.
	std::vector<PageTableNode *> _held;
	std::vector<PageTableNode *> _retired;
};

// Returns nullptr if the entry has no child table.
PageTableNode *resolveChild(AddressSpace *space, PageTableNode *node, size_t i);

template<typename F>
void RangeCursor::_forEachIn(PageTableNode *node, VirtualAddr base, F &fn) {
	auto span = entrySpan(node->level());
	for(size_t i = 0; i < entriesPerTable; i++) {
		auto va = base + i * span;
		if(va + span <= _lo)
			continue;
		if(va >= _hi)
			break;

		if(node->isLeaf()) {
			auto &pte = node->entry(i);
			auto &md = node->metadata(i);
			if(!isPopulated(pte, md))
				continue;
			if(pte.present && pte.frame)
				md.refcount = _currentRefcount(*pte.frame);
			fn(va, pte, md);
		}else{
			auto child = resolveChild(_space, node, i);
			if(child)
				_forEachIn(child, va, fn);
		}
	}
}

} // namespace corten
