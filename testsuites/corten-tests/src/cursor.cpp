#include <assert.h>

#include <memory>
#include <vector>

#include <corten/address-space.hpp>

#include "testsuite.hpp"

using corten::Status;
using corten::VirtualAddr;

namespace {
	constexpr corten::PageFlags rw = corten::page_access::read | corten::page_access::write;

	constexpr VirtualAddr leafSpan = corten::tableSpan(0);

	std::shared_ptr<corten::AddressSpace> makeSpace() {
		auto frames = std::make_shared<corten::MonotonicFrameAllocator>(64);
		return assert_ok(corten::AddressSpace::create(frames)).value();
	}

	void markPage(corten::AddressSpace *space, VirtualAddr va) {
		auto cursor = space->lock(va, va + corten::kPageSize);
		assert_ok(cursor.mark(va, corten::kPageSize, Status::privateAnon, rw));
	}
} // anonymous namespace

DEFINE_TEST(cursor_mark_query, ([] {
	auto space = makeSpace();

	{
		auto cursor = space->lock(0x400000, 0x408000);
		assert(cursor.query(0x400000) == Status::unmapped);
		assert_ok(cursor.mark(0x400000, 0x8000, Status::privateAnon, rw));
		for(VirtualAddr va = 0x400000; va < 0x408000; va += corten::kPageSize)
			assert(cursor.query(va) == Status::privateAnon);
	}

	auto cursor = space->lock(0x400000, 0x40a000);
	assert(cursor.query(0x407000) == Status::privateAnon);
	assert(cursor.query(0x408000) == Status::unmapped);
	assert(cursor.metadata(0x404000).softPermissions == rw);
	assert(!cursor.entry(0x404000)->present);
}));

DEFINE_TEST(cursor_query_missing_tables, ([] {
	auto space = makeSpace();

	// Tables above the covering node are created by lock(), leaf tables are not.
	auto cursor = space->lock(0x7f0000000000, 0x7f0000000000 + 2 * leafSpan);
	assert(cursor.coveringNode()->level() == 1);
	assert(space->numTables() == 3);
	assert(cursor.query(0x7f0000000000) == Status::unmapped);
	assert(!cursor.entry(0x7f0000000000));
	assert(cursor.metadata(0x7f0000000000).status == Status::unmapped);
	assert(space->numTables() == 3);
}));

DEFINE_TEST(cursor_creates_tables_lazily, ([] {
	auto space = makeSpace();

	{
		auto cursor = space->lock(0, 2 * leafSpan);
		assert_ok(cursor.mark(0, 2 * leafSpan, Status::unmapped, 0));
	}
	assert(space->numTables() == 3);

	{
		// Spans both leaves of the level 1 table.
		auto cursor = space->lock(0, 2 * leafSpan);
		assert_ok(cursor.mark(leafSpan - 0x1000, 0x2000, Status::privateAnon, rw));
	}
	assert(space->numTables() == 5);

	markPage(space.get(), 0x7f0000000000);
	assert(space->numTables() == 8);
	assert(space->numTablesCreated() == 7);

	// The tables already exist.
	markPage(space.get(), 0x7f0000001000);
	assert(space->numTables() == 8);
}));

DEFINE_TEST(cursor_map_unmap, ([] {
	auto space = makeSpace();
	auto frames = space->frameAllocator();
	auto frame = assert_ok(frames->allocate()).value();

	auto cursor = space->lock(0x200000, 0x202000);
	assert_ok(cursor.map(0x201000, frame, rw));

	auto pte = cursor.entry(0x201000);
	assert(pte && pte->present);
	assert(pte->frame == frame);
	assert(pte->flags == rw);
	auto md = cursor.metadata(0x201000);
	assert(md.status == Status::mapped);
	assert(md.softPermissions == rw);
	assert(md.refcount == 1);

	// Reference counts are reported as they are now, not as they were when mapping.
	frames->reference(frame);
	assert(cursor.metadata(0x201000).refcount == 2);
	cursor.forEach([&] (VirtualAddr, corten::Pte &, corten::PteMetadata &md) {
		assert(md.refcount == 2);
	});
	frames->release(frame);
	assert(cursor.metadata(0x201000).refcount == 1);

	cursor.writeProtect(0x201000);
	assert(cursor.entry(0x201000)->flags == corten::page_access::read);

	assert(cursor.unmap(0x201000) == frame);
	assert(!cursor.entry(0x201000)->present);
	assert(cursor.query(0x201000) == Status::unmapped);
	assert(!cursor.unmap(0x201000));
	assert(!cursor.unmap(0x200000));

	frames->release(frame);
}));

DEFINE_TEST(cursor_set_metadata, ([] {
	auto space = makeSpace();
	auto cursor = space->lock(0x1000, 0x2000);
	assert_ok(cursor.setMetadata(0x1000,
			corten::PteMetadata{Status::cowShared, corten::page_access::read, 2}));
	auto md = cursor.metadata(0x1000);
	assert(md.status == Status::cowShared);
	assert(md.refcount == 2);
}));

DEFINE_TEST(cursor_covering_node, ([] {
	auto space = makeSpace();
	markPage(space.get(), 0);
	markPage(space.get(), leafSpan);
	assert(space->numTables() == 5);

	{
		// Spans two leaf tables.
		auto cursor = space->lock(0, 2 * leafSpan);
		assert(cursor.coveringNode()->level() == 1);
		assert(cursor.numLockedTables() == 3);
	}

	{
		auto cursor = space->lock(0x1000, 0x2000);
		assert(cursor.coveringNode()->level() == 0);
		assert(cursor.numLockedTables() == 1);
	}

	{
		// Exactly one leaf table: its parent is needed to remove it.
		auto cursor = space->lock(0, leafSpan);
		assert(cursor.coveringNode()->level() == 1);
		assert(cursor.numLockedTables() == 2);
	}

	{
		// No leaf table yet; it is created before locking.
		auto cursor = space->lock(4 * leafSpan, 4 * leafSpan + 0x1000);
		assert(cursor.coveringNode()->level() == 0);
		assert(cursor.numLockedTables() == 1);
		assert(space->numTables() == 6);
	}

	{
		auto cursor = space->lock(0, corten::kSpaceLimit);
		assert(cursor.coveringNode() == space->rootTable());
		assert(cursor.numLockedTables() == 6);
	}
}));

DEFINE_TEST(cursor_for_each_in_order, ([] {
	auto space = makeSpace();
	std::vector<VirtualAddr> addresses{0x3000, leafSpan + 0x5000, 0x40000000, 0x1000};
	for(auto va : addresses)
		markPage(space.get(), va);

	std::vector<VirtualAddr> seen;
	{
		auto cursor = space->lock(0x2000, 0x40001000);
		cursor.forEach([&] (VirtualAddr va, corten::Pte &, corten::PteMetadata &md) {
			assert(md.status == Status::privateAnon);
			seen.push_back(va);
		});
	}
	assert((seen == std::vector<VirtualAddr>{0x3000, leafSpan + 0x5000, 0x40000000}));
}));

DEFINE_TEST(cursor_remove_tables, ([] {
	auto space = makeSpace();
	markPage(space.get(), 0x1000);
	markPage(space.get(), leafSpan + 0x1000);
	assert(space->numTables() == 5);

	corten::PageTableNode *leaf;
	{
		auto first = space->lock(0x1000, 0x2000);
		leaf = first.coveringNode();
		assert(leaf->isLeaf());
	}

	{
		// Removes the level 1 table and both leaves below it.
		auto cursor = space->lock(0, corten::tableSpan(1));
		assert(cursor.coveringNode()->level() == 2);
		assert_ok(cursor.mark(0, corten::tableSpan(1), Status::unmapped, 0));
		cursor.removeTables();
		assert(leaf->isStale());
		assert(!cursor.coveringNode()->isStale());
	}
	assert(space->numTablesRetired() == 3);

	for(int i = 0; i < 3; i++)
		space->reclaimer().tryReclaim();
	assert(!space->reclaimer().numPending());
	assert(space->numTablesReclaimed() == 3);
	assert(space->numTables() == 2);

	auto cursor = space->lock(0x1000, 0x2000);
	assert(cursor.query(0x1000) == Status::unmapped);
}));

DEFINE_TEST(cursor_keeps_partially_covered_tables, ([] {
	auto space = makeSpace();
	markPage(space.get(), 0x1000);
	markPage(space.get(), leafSpan + 0x1000);

	{
		auto cursor = space->lock(0, leafSpan + 0x1000);
		cursor.removeTables();
	}
	assert(space->numTablesRetired() == 1);

	auto cursor = space->lock(leafSpan, leafSpan + 0x2000);
	assert(cursor.query(leafSpan + 0x1000) == Status::privateAnon);
}));

DEFINE_TEST(cursor_move_and_release, ([] {
	auto space = makeSpace();
	markPage(space.get(), 0x1000);

	auto cursor = space->lock(0x1000, 0x2000);
	assert(cursor);

	corten::RangeCursor other{std::move(cursor)};
	assert(!cursor);
	assert(other);
	assert(other.query(0x1000) == Status::privateAnon);

	cursor = std::move(other);
	assert(cursor);
	cursor.release();
	cursor.release();
	assert(!cursor);

	// All locks were dropped.
	auto again = space->lock(0x1000, 0x2000);
	assert(again.query(0x1000) == Status::privateAnon);
}));
