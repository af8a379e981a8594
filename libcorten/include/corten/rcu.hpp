#pragma once

#include <stdint.h>

#include <atomic>

#include <frg/list.hpp>
#include <frg/spinlock.hpp>

#include <corten/page-table.hpp>

namespace corten {

// Epoch-based deferred reclamation of page table nodes.
//
// Lock-free traversals of the translation tree run inside a read-side section.
// Each section registers itself in the reader counter of the epoch it observed.
// The epoch only advances once the counter of the previous epoch drained;
// a node that was retired at epoch e is therefore unreachable by any traversal
// once the epoch reaches e + 2.
struct RcuReclaimer {
	typedef frg::ticket_spinlock Mutex;

	RcuReclaimer(NodeArena *arena, bool logReclaim);

	RcuReclaimer(const RcuReclaimer &) = delete;

	RcuReclaimer &operator= (const RcuReclaimer &) = delete;

	~RcuReclaimer();

	// Returns a ticket that has to be passed to exitReadSide().
	uint64_t enterReadSide();
	void exitReadSide(uint64_t ticket);

	// The node must already be stale and unlinked from its parent.
	void deferFree(PageTableNode *node);

	// Advances the epoch if possible and frees all nodes whose grace period elapsed.
	// Returns the number of freed nodes.
	size_t tryReclaim();

	// Frees all pending nodes. Only valid if no read-side section can be active.
	size_t drain();

	uint64_t epoch() {
		return _epoch.load(std::memory_order_acquire);
	}

	size_t numPending() {
		return _numPending.load(std::memory_order_relaxed);
	}

	size_t numReclaimed() {
		return _numReclaimed.load(std::memory_order_relaxed);
	}

	size_t numReaders() {
		return _readers[0].load(std::memory_order_relaxed)
				+ _readers[1].load(std::memory_order_relaxed);
	}

private:
	using NodeList = frg::intrusive_list<
		PageTableNode,
		frg::locate_member<
			PageTableNode,
			frg::default_list_hook<PageTableNode>,
			&PageTableNode::_retireHook
		>
	>;

	size_t _free(NodeList &list);

	NodeArena *_arena;
	bool _logReclaim;

	std::atomic<uint64_t> _epoch{0};
	std::atomic<size_t> _readers[2];

	// Protects _pending. Nodes are queued in epoch order.
	Mutex _mutex;
	NodeList _pending;

	std::atomic<size_t> _numPending{0};
	std::atomic<size_t> _numReclaimed{0};
};

struct RcuReadGuard {
	explicit RcuReadGuard(RcuReclaimer *reclaimer)
	: _reclaimer{reclaimer}, _ticket{reclaimer->enterReadSide()} { }

	RcuReadGuard(const RcuReadGuard &) = delete;

	RcuReadGuard &operator= (const RcuReadGuard &) = delete;

	~RcuReadGuard() {
		if(_reclaimer)
			_reclaimer->exitReadSide(_ticket);
	}

	void unlock() {
		assert(_reclaimer);
		_reclaimer->exitReadSide(_ticket);
		_reclaimer = nullptr;
	}

private:
	RcuReclaimer *_reclaimer;
	uint64_t _ticket;
};

} // namespace corten
