#include <assert.h>

#include <string_view>
#include <thread>

#include <corten/page-table.hpp>

#include "testsuite.hpp"

using corten::NodeArena;
using corten::PteMetadata;
using corten::Status;

DEFINE_TEST(node_lock_tracks_owner, ([] {
	NodeArena arena{4};
	auto node = assert_ok(arena.allocate(0)).value();
	assert(node->isLeaf());
	assert(!node->heldByCurrentThread());

	node->lock();
	assert(node->heldByCurrentThread());

	bool heldByOther = true;
	std::thread{[&] {
		heldByOther = node->heldByCurrentThread();
	}}.join();
	assert(!heldByOther);

	node->unlock();
	assert(!node->heldByCurrentThread());
}));

DEFINE_TEST(node_metadata_under_lock, ([] {
	NodeArena arena{4};
	auto node = assert_ok(arena.allocate(0)).value();

	node->lock();
	assert(node->readMetadata(7).status == Status::unmapped);
	node->writeMetadata(7, PteMetadata{Status::privateAnon, corten::page_access::read, 0});
	assert(node->readMetadata(7).status == Status::privateAnon);
	assert(node->readMetadata(7).softPermissions == corten::page_access::read);
	assert(node->readMetadata(6).status == Status::unmapped);
	assert(!node->entry(7).present);
	node->unlock();
}));

DEFINE_TEST(node_stale_is_sticky, ([] {
	NodeArena arena{4};
	auto node = assert_ok(arena.allocate(2)).value();
	assert(!node->isStale());
	node->markStale();
	node->markStale();
	assert(node->isStale());
}));

DEFINE_TEST(node_child_links, ([] {
	NodeArena arena{4};
	auto parent = assert_ok(arena.allocate(1)).value();
	auto child = assert_ok(arena.allocate(0)).value();

	assert(parent->child(3) == corten::noNode);
	parent->lock();
	parent->setChild(3, child->index());
	parent->unlock();

	assert(parent->child(3) == child->index());
	assert(arena.get(parent->child(3)) == child);
	assert(parent->child(4) == corten::noNode);
}));

DEFINE_TEST(arena_exhaustion_and_reuse, ([] {
	NodeArena arena{2};

	auto a = assert_ok(arena.allocate(0)).value();
	auto b = assert_ok(arena.allocate(0)).value();
	assert(a->index() != b->index());
	assert(arena.numUsed() == 2);
	assert_error(arena.allocate(0), corten::Error::noMemory);

	auto index = a->index();
	arena.free(a);
	assert(arena.numUsed() == 1);
	assert(!arena.get(index));

	auto c = assert_ok(arena.allocate(1)).value();
	assert(c->index() == index);
	assert(c->level() == 1);
	assert(arena.get(index) == c);
}));

DEFINE_TEST(status_names, ([] {
	assert(std::string_view{corten::statusName(Status::unmapped)} == "unmapped");
	assert(std::string_view{corten::statusName(Status::cowShared)} == "cow-shared");
}));
