#include <corten/debug.hpp>
#include <corten/page-table.hpp>
#include <frg/mutex.hpp>

namespace corten {

const char *statusName(Status status) {
	switch(status) {
	case Status::unmapped: return "unmapped";
	case Status::privateAnon: return "private-anon";
	case Status::mapped: return "mapped";
	case Status::cowShared: return "cow-shared";
	}
	return "unknown";
}

// --------------------------------------------------------
// PageTableNode
// --------------------------------------------------------

PageTableNode::PageTableNode(NodeIndex index, int level)
: _index{index}, _level{level} {
	assert(level >= 0 && level <= rootLevel);
	for(auto &child : _children)
		child.store(noNode, std::memory_order_relaxed);
}

void PageTableNode::lock() {
	assert(!heldByCurrentThread());
	_mutex.lock();
	_owner.store(std::this_thread::get_id(), std::memory_order_relaxed);
}

void PageTableNode::unlock() {
	assert(heldByCurrentThread());
	_owner.store(std::thread::id{}, std::memory_order_relaxed);
	_mutex.unlock();
}

// --------------------------------------------------------
// NodeArena
// --------------------------------------------------------

NodeArena::NodeArena(size_t capacity)
: _capacity{capacity}, _slots{std::make_unique<std::atomic<PageTableNode *>[]>(capacity)},
		_indices{0, static_cast<NodeIndex>(capacity - 1)} {
	if(!capacity || capacity >= noNode)
		panicLogger() << "corten: Invalid page table capacity " << capacity << frg::endlog;
	for(size_t i = 0; i < capacity; i++)
		_slots[i].store(nullptr, std::memory_order_relaxed);
}

NodeArena::~NodeArena() {
	for(size_t i = 0; i < _capacity; i++)
		delete _slots[i].load(std::memory_order_relaxed);
}

frg::expected<Error, PageTableNode *> NodeArena::allocate(int level) {
	std::optional<NodeIndex> index;
	{
		auto lock = frg::guard(&_mutex);
		index = _indices.allocate();
	}
	if(!index)
		return Error::noMemory;

	auto node = new PageTableNode{*index, level};
	assert(!_slots[*index].load(std::memory_order_relaxed));
	_slots[*index].store(node, std::memory_order_release);
	_numUsed.fetch_add(1, std::memory_order_relaxed);
	return node;
}

void NodeArena::free(PageTableNode *node) {
	auto index = node->index();
	assert(_slots[index].load(std::memory_order_relaxed) == node);
	_slots[index].store(nullptr, std::memory_order_relaxed);
	delete node;
	_numUsed.fetch_sub(1, std::memory_order_relaxed);

	auto lock = frg::guard(&_mutex);
	_indices.free(index);
}

} // namespace corten
