#pragma once

#include <assert.h>
#include <stdint.h>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <frg/expected.hpp>
#include <frg/list.hpp>
#include <frg/spinlock.hpp>

#include <corten/error.hpp>
#include <corten/id-allocator.hpp>
#include <corten/types.hpp>

namespace corten {

using NodeIndex = uint32_t;

constexpr NodeIndex noNode = ~NodeIndex{0};

enum class Status : uint8_t {
	unmapped,
	// Reserved by mmap; the frame is allocated on the first fault.
	privateAnon,
	mapped,
	// Frame shared with another address space; written only after a copy.
	cowShared
};

const char *statusName(Status status);

// Hardware-visible part of an entry.
struct Pte {
	std::optional<FrameNumber> frame;
	PageFlags flags = 0;
	bool present = false;
};

// Software-only part of an entry.
struct PteMetadata {
	Status status = Status::unmapped;
	PageFlags softPermissions = 0;
	// Frame reference count as of the last transition of the entry.
	uint32_t refcount = 0;
};

// An entry is populated if it maps a frame or carries a non-default status.
inline bool isPopulated(const Pte &pte, const PteMetadata &md) {
	return pte.present || md.status != Status::unmapped;
}

// A single table of the translation tree.
// Entries and metadata are only accessed while holding the node's lock.
// Child links and the stale flag may be read without the lock.
struct PageTableNode {
	friend struct RcuReclaimer;

	PageTableNode(NodeIndex index, int level);

	PageTableNode(const PageTableNode &) = delete;

	PageTableNode &operator= (const PageTableNode &) = delete;

	NodeIndex index() {
		return _index;
	}

	int level() {
		return _level;
	}

	bool isLeaf() {
		return !_level;
	}

	void lock();
	void unlock();

	bool heldByCurrentThread() {
		return _owner.load(std::memory_order_relaxed) == std::this_thread::get_id();
	}

	// Once a node is stale, it is unreachable from the root and waits for reclamation.
	void markStale() {
		_stale.store(true, std::memory_order_release);
	}

	bool isStale() {
		return _stale.load(std::memory_order_acquire);
	}

	NodeIndex child(size_t i) {
		assert(i < entriesPerTable);
		return _children[i].load(std::memory_order_acquire);
	}

	void setChild(size_t i, NodeIndex index) {
		assert(i < entriesPerTable);
		assert(heldByCurrentThread());
		assert(!isLeaf());
		_children[i].store(index, std::memory_order_release);
	}

	Pte &entry(size_t i) {
		assert(i < entriesPerTable);
		assert(heldByCurrentThread());
		return _entries[i];
	}

	PteMetadata &metadata(size_t i) {
		assert(i < entriesPerTable);
		assert(heldByCurrentThread());
		return _metadata[i];
	}

	PteMetadata readMetadata(size_t i) {
		return metadata(i);
	}

	void writeMetadata(size_t i, PteMetadata md) {
		metadata(i) = md;
	}

private:
	NodeIndex _index;
	int _level;

	std::mutex _mutex;
	std::atomic<std::thread::id> _owner;
	std::atomic<bool> _stale{false};

	std::array<Pte, entriesPerTable> _entries;
	std::array<PteMetadata, entriesPerTable> _metadata;
	std::array<std::atomic<NodeIndex>, entriesPerTable> _children;

	// Used by the reclaimer once the node is retired.
	frg::default_list_hook<PageTableNode> _retireHook;
	uint64_t _removalEpoch = 0;
};

// Owns all page table nodes of an address space.
// Slots are indexed by NodeIndex; a slot is only reused after its node was freed.
struct NodeArena {
	typedef frg::ticket_spinlock Mutex;

	explicit NodeArena(size_t capacity);

	NodeArena(const NodeArena &) = delete;

	NodeArena &operator= (const NodeArena &) = delete;

	~NodeArena();

	frg::expected<Error, PageTableNode *> allocate(int level);

	PageTableNode *get(NodeIndex index) {
		assert(index < _capacity);
		return _slots[index].load(std::memory_order_acquire);
	}

	void free(PageTableNode *node);

	size_t numUsed() {
		return _numUsed.load(std::memory_order_relaxed);
	}

	size_t capacity() {
		return _capacity;
	}

private:
	size_t _capacity;
	std::unique_ptr<std::atomic<PageTableNode *>[]> _slots;

	Mutex _mutex;
	id_allocator<NodeIndex> _indices;

	std::atomic<size_t> _numUsed{0};
};

} // namespace corten
