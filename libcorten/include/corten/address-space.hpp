#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include <frg/expected.hpp>

#include <corten/config.hpp>
#include <corten/cursor.hpp>
#include <corten/error.hpp>
#include <corten/page-table.hpp>
#include <corten/physical.hpp>
#include <corten/rcu.hpp>

namespace corten {

// A virtual address space that is described by its translation tree alone.
// There are no region descriptors: the state of each page lives in the metadata
// of its leaf entry. All modifications go through a RangeCursor obtained from lock().
struct AddressSpace {
	friend struct RangeCursor;

	static frg::expected<Error, std::shared_ptr<AddressSpace>>
	create(std::shared_ptr<FrameAllocator> frames, const Options &options = {});

	AddressSpace(std::shared_ptr<FrameAllocator> frames, const Options &options);

	AddressSpace(const AddressSpace &) = delete;

	AddressSpace &operator= (const AddressSpace &) = delete;

	~AddressSpace();

	// Locks all tables that cover [lo, hi). Both bounds must be page aligned.
	// Creates the tables above the covering node if they are missing.
	// Blocks while conflicting cursors are alive; never fails.
	RangeCursor lock(VirtualAddr lo, VirtualAddr hi);

	const Options &options() {
		return _options;
	}

	FrameAllocator *frameAllocator() {
		return _frames.get();
	}

	std::shared_ptr<FrameAllocator> sharedFrameAllocator() {
		return _frames;
	}

	NodeArena &arena() {
		return _arena;
	}

	RcuReclaimer &reclaimer() {
		return _reclaimer;
	}

	PageTableNode *rootTable() {
		return _root;
	}

	size_t numTables() {
		return _arena.numUsed();
	}

	// Number of times lock() found a stale table after locking and started over.
	uint64_t numLockRetries() {
		return _lockRetries.load(std::memory_order_relaxed);
	}

	uint64_t numTablesCreated() {
		return _tablesCreated.load(std::memory_order_relaxed);
	}

	uint64_t numTablesRetired() {
		return _tablesRetired.load(std::memory_order_relaxed);
	}

	uint64_t numTablesReclaimed() {
		return _reclaimer.numReclaimed();
	}

private:
	frg::expected<Error> _initialize();

	// Links a new table as child i of parent.
	// Returns nullptr if parent was retired before it could be locked.
	frg::expected<Error, PageTableNode *> _createChild(PageTableNode *parent, size_t i,
			VirtualAddr va);

	void _lockSubtree(PageTableNode *node, VirtualAddr base,
			VirtualAddr lo, VirtualAddr hi, std::vector<PageTableNode *> &held);

	Options _options;
	std::shared_ptr<FrameAllocator> _frames;

	NodeArena _arena;
	RcuReclaimer _reclaimer;
	PageTableNode *_root = nullptr;

	std::atomic<uint64_t> _lockRetries{0};
	std::atomic<uint64_t> _tablesCreated{0};
	std::atomic<uint64_t> _tablesRetired{0};
};

} // namespace corten
