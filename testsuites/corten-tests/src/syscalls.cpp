#include <assert.h>
#include <string.h>

#include <memory>

#include <corten/syscalls.hpp>

#include "testsuite.hpp"

using corten::Error;
using corten::Status;
using corten::VirtualAddr;

namespace {
	constexpr corten::PageFlags rw = corten::page_access::read | corten::page_access::write;

	struct Fixture {
		Fixture(size_t numFrames = 64)
		: frames{std::make_shared<corten::MonotonicFrameAllocator>(numFrames)},
				space{assert_ok(corten::AddressSpace::create(frames)).value()} { }

		std::shared_ptr<corten::MonotonicFrameAllocator> frames;
		std::shared_ptr<corten::AddressSpace> space;
	};

	Status query(corten::AddressSpace *space, VirtualAddr va) {
		auto page = va & ~(VirtualAddr{corten::kPageSize} - 1);
		auto cursor = space->lock(page, page + corten::kPageSize);
		return cursor.query(page);
	}

	corten::Pte entry(corten::AddressSpace *space, VirtualAddr va) {
		auto cursor = space->lock(va, va + corten::kPageSize);
		auto pte = cursor.entry(va);
		assert(pte);
		return *pte;
	}

	corten::PteMetadata metadata(corten::AddressSpace *space, VirtualAddr va) {
		auto cursor = space->lock(va, va + corten::kPageSize);
		return cursor.metadata(va);
	}
} // anonymous namespace

DEFINE_TEST(mmap_is_lazy, ([] {
	Fixture f;
	assert_ok(corten::mmap(f.space.get(), 0x10000000, 0x10000, rw));

	for(VirtualAddr va = 0x10000000; va < 0x10010000; va += corten::kPageSize) {
		assert(query(f.space.get(), va) == Status::privateAnon);
		assert(metadata(f.space.get(), va).softPermissions == rw);
	}
	assert(query(f.space.get(), 0x10010000) == Status::unmapped);
	assert(!f.frames->numUsedFrames());
}));

DEFINE_TEST(mmap_rounds_length, ([] {
	Fixture f;
	assert_ok(corten::mmap(f.space.get(), 0x20000, 1, rw));
	assert(query(f.space.get(), 0x20000) == Status::privateAnon);
	assert(query(f.space.get(), 0x21000) == Status::unmapped);
}));

DEFINE_TEST(mmap_rejects_bad_ranges, ([] {
	Fixture f;
	auto space = f.space.get();

	assert_error(corten::mmap(space, 0x1001, 0x1000, rw), Error::invalidRange);
	assert_error(corten::mmap(space, 0x1000, 0, rw), Error::invalidRange);
	assert_error(corten::mmap(space, corten::kSpaceLimit, 0x1000, rw), Error::invalidRange);
	assert_error(corten::mmap(space, corten::kSpaceLimit - 0x1000, 0x2000, rw),
			Error::invalidRange);
	assert_error(corten::mmap(space, 0x1000, ~size_t{0}, rw), Error::invalidRange);
	assert_error(corten::mmap(space, 0x1000, 0x1000, 0x100), Error::illegalArgs);

	assert_error(corten::munmap(space, 0x1800, 0x1000), Error::invalidRange);
	assert_error(corten::munmap(space, 0x1000, 0), Error::invalidRange);
	assert_error(corten::pageFault(space, corten::kSpaceLimit, false), Error::invalidRange);

	// The highest page is fine.
	assert_ok(corten::mmap(space, corten::kSpaceLimit - 0x1000, 0x1000, rw));
	assert(space->numTables() == 4);
}));

// mmap, fault, munmap and fault again.
DEFINE_TEST(fault_lifecycle, ([] {
	Fixture f;
	auto space = f.space.get();
	VirtualAddr va = 0x10000000;

	assert_ok(corten::mmap(space, va, 0x1000, rw));
	assert(query(space, va) == Status::privateAnon);

	assert_ok(corten::pageFault(space, va + 0x123, true));
	assert(query(space, va) == Status::mapped);
	auto pte = entry(space, va);
	assert(pte.present && pte.frame);
	assert(pte.flags == rw);
	assert(f.frames->numUsedFrames() == 1);

	assert_ok(corten::munmap(space, va, 0x1000));
	assert(query(space, va) == Status::unmapped);
	assert(!f.frames->numUsedFrames());

	assert_error(corten::pageFault(space, va, false), Error::fault);
}));

DEFINE_TEST(fault_on_unmapped, ([] {
	Fixture f;
	assert_error(corten::pageFault(f.space.get(), 0x5000, false), Error::fault);
	assert_error(corten::pageFault(f.space.get(), 0x5000, true), Error::fault);
}));

DEFINE_TEST(fault_checks_permissions, ([] {
	Fixture f;
	auto space = f.space.get();
	assert_ok(corten::mmap(space, 0x1000, 0x1000, corten::page_access::read));
	assert_ok(corten::mmap(space, 0x2000, 0x1000, 0));

	assert_error(corten::pageFault(space, 0x1000, true), Error::fault);
	assert(query(space, 0x1000) == Status::privateAnon);
	assert_ok(corten::pageFault(space, 0x1000, false));
	assert(query(space, 0x1000) == Status::mapped);
	assert_error(corten::pageFault(space, 0x1000, true), Error::fault);
	assert(!(entry(space, 0x1000).flags & corten::page_access::write));

	assert_error(corten::pageFault(space, 0x2000, false), Error::fault);
	assert(f.frames->numUsedFrames() == 1);
}));

DEFINE_TEST(fault_spurious, ([] {
	Fixture f;
	assert_ok(corten::mmap(f.space.get(), 0x1000, 0x1000, rw));
	assert_ok(corten::pageFault(f.space.get(), 0x1000, false));
	auto frame = entry(f.space.get(), 0x1000).frame;
	assert_ok(corten::pageFault(f.space.get(), 0x1000, true));
	assert(entry(f.space.get(), 0x1000).frame == frame);
	assert(f.frames->numUsedFrames() == 1);
}));

DEFINE_TEST(fault_out_of_frames, ([] {
	Fixture f{1};
	auto space = f.space.get();
	assert_ok(corten::mmap(space, 0x1000, 0x2000, rw));
	assert_ok(corten::pageFault(space, 0x1000, true));
	assert_error(corten::pageFault(space, 0x2000, true), Error::noMemory);
	assert(query(space, 0x2000) == Status::privateAnon);

	assert_ok(corten::munmap(space, 0x1000, 0x1000));
	assert_ok(corten::pageFault(space, 0x2000, true));
}));

DEFINE_TEST(mmap_replaces_mappings, ([] {
	Fixture f;
	auto space = f.space.get();
	assert_ok(corten::mmap(space, 0x1000, 0x2000, rw));
	assert_ok(corten::writeSpace(space, 0x1000, "data", 4));
	assert(f.frames->numUsedFrames() == 1);

	assert_ok(corten::mmap(space, 0x1000, 0x2000, corten::page_access::read));
	assert(!f.frames->numUsedFrames());
	assert(query(space, 0x1000) == Status::privateAnon);
	assert(!entry(space, 0x1000).present);

	char buffer[4];
	assert_ok(corten::readSpace(space, 0x1000, buffer, 4));
	assert(!memcmp(buffer, "\0\0\0\0", 4));
}));

DEFINE_TEST(mmap_out_of_tables_keeps_mappings, ([] {
	auto frames = std::make_shared<corten::MonotonicFrameAllocator>(16);
	corten::Options options;
	options.maxTables = 4;
	auto space = assert_ok(corten::AddressSpace::create(frames, options)).value();

	assert_ok(corten::mmap(space.get(), 0, 0x1000, rw));
	assert_ok(corten::writeSpace(space.get(), 0, "data", 4));
	assert(space->numTables() == 4);

	// The second leaf table does not fit.
	assert_error(corten::mmap(space.get(), 0, 2 * corten::tableSpan(0), rw), Error::noMemory);
	assert(query(space.get(), 0) == Status::mapped);
	assert(query(space.get(), 0x1000) == Status::unmapped);
	assert(frames->numUsedFrames() == 1);

	char buffer[4];
	assert_ok(corten::readSpace(space.get(), 0, buffer, 4));
	assert(!memcmp(buffer, "data", 4));
}));

DEFINE_TEST(read_write_space, ([] {
	Fixture f;
	auto space = f.space.get();
	assert_ok(corten::mmap(space, 0x10000, 0x3000, rw));

	// Crosses two page boundaries.
	char message[0x2000];
	for(size_t i = 0; i < sizeof(message); i++)
		message[i] = static_cast<char>(i * 7);
	assert_ok(corten::writeSpace(space, 0x10f80, message, sizeof(message)));
	assert(f.frames->numUsedFrames() == 3);

	char buffer[sizeof(message)];
	assert_ok(corten::readSpace(space, 0x10f80, buffer, sizeof(buffer)));
	assert(!memcmp(buffer, message, sizeof(message)));

	assert_error(corten::readSpace(space, 0x13000, buffer, 1), Error::fault);
	assert_error(corten::writeSpace(space, 0x12fff, message, 2), Error::fault);
	assert_error(corten::readSpace(space, corten::kSpaceLimit - 1, buffer, 2),
			Error::invalidRange);
}));

DEFINE_TEST(munmap_partial, ([] {
	Fixture f;
	auto space = f.space.get();
	assert_ok(corten::mmap(space, 0x1000, 0x4000, rw));
	assert_ok(corten::writeSpace(space, 0x1000, "abcd", 4));
	assert_ok(corten::writeSpace(space, 0x4000, "efgh", 4));

	assert_ok(corten::munmap(space, 0x2000, 0x2000));
	assert(query(space, 0x1000) == Status::mapped);
	assert(query(space, 0x2000) == Status::unmapped);
	assert(query(space, 0x3000) == Status::unmapped);
	assert(query(space, 0x4000) == Status::mapped);
	assert(f.frames->numUsedFrames() == 2);

	// Unmapping holes is not an error.
	assert_ok(corten::munmap(space, 0x100000000, 0x10000));
}));

DEFINE_TEST(munmap_reclaims_tables, ([] {
	Fixture f;
	auto space = f.space.get();
	assert_ok(corten::mmap(space, 0x40000000, 0x1000, rw));
	assert_ok(corten::pageFault(space, 0x40000000, true));
	assert(space->numTables() == 4);

	assert_ok(corten::munmap(space, 0x40000000, corten::tableSpan(1)));
	assert(space->numTablesRetired() == 2);
	assert(!f.frames->numUsedFrames());

	for(int i = 0; i < 3; i++)
		space->reclaimer().tryReclaim();
	assert(space->numTables() == 2);

	// Tables are recreated on demand.
	assert_ok(corten::mmap(space, 0x40000000, 0x1000, rw));
	assert(query(space, 0x40000000) == Status::privateAnon);
}));

// Fork a mapped page, then write to it in both spaces.
DEFINE_TEST(fork_cow_lifecycle, ([] {
	Fixture f;
	auto parent = f.space.get();
	VirtualAddr va = 0x20000000;

	assert_ok(corten::mmap(parent, va, 0x1000, rw));
	assert_ok(corten::pageFault(parent, va, true));
	auto original = *entry(parent, va).frame;

	auto child = assert_ok(corten::forkCow(parent)).value();
	assert(child->sharedFrameAllocator() == parent->sharedFrameAllocator());

	assert(query(parent, va) == Status::cowShared);
	assert(query(child.get(), va) == Status::cowShared);
	assert(metadata(parent, va).refcount == 2);
	assert(metadata(child.get(), va).refcount == 2);
	assert(f.frames->referenceCount(original) == 2);
	assert(*entry(child.get(), va).frame == original);
	assert(!(entry(parent, va).flags & corten::page_access::write));
	assert(!(entry(child.get(), va).flags & corten::page_access::write));

	// Reads do not break the sharing.
	assert_ok(corten::pageFault(child.get(), va, false));
	assert(query(child.get(), va) == Status::cowShared);

	assert_ok(corten::pageFault(child.get(), va, true));
	assert(query(child.get(), va) == Status::mapped);
	auto copy = *entry(child.get(), va).frame;
	assert(copy != original);
	assert(entry(child.get(), va).flags == rw);
	assert(f.frames->referenceCount(original) == 1);
	assert(f.frames->referenceCount(copy) == 1);
	assert(metadata(child.get(), va).refcount == 1);
	assert(metadata(parent, va).refcount == 1);

	// The parent is now the only user and takes the frame over.
	assert(query(parent, va) == Status::cowShared);
	assert_ok(corten::pageFault(parent, va, true));
	assert(query(parent, va) == Status::mapped);
	assert(*entry(parent, va).frame == original);
	assert(f.frames->numUsedFrames() == 2);
}));

DEFINE_TEST(fork_cow_isolation, ([] {
	Fixture f;
	auto parent = f.space.get();
	assert_ok(corten::mmap(parent, 0x1000, 0x2000, rw));
	assert_ok(corten::writeSpace(parent, 0x1000, "hello", 5));

	auto child = assert_ok(corten::forkCow(parent)).value();
	assert_ok(corten::writeSpace(child.get(), 0x1000, "world", 5));

	char buffer[5];
	assert_ok(corten::readSpace(parent, 0x1000, buffer, 5));
	assert(!memcmp(buffer, "hello", 5));
	assert_ok(corten::readSpace(child.get(), 0x1000, buffer, 5));
	assert(!memcmp(buffer, "world", 5));

	// Pages that were never touched stay lazy in both spaces.
	assert(query(child.get(), 0x2000) == Status::privateAnon);
	assert_ok(corten::writeSpace(child.get(), 0x2000, "x", 1));
	assert(query(parent, 0x2000) == Status::privateAnon);
	assert_ok(corten::readSpace(parent, 0x2000, buffer, 1));
	assert(buffer[0] == 0);
}));

DEFINE_TEST(fork_twice, ([] {
	Fixture f;
	auto parent = f.space.get();
	assert_ok(corten::mmap(parent, 0x1000, 0x1000, rw));
	assert_ok(corten::writeSpace(parent, 0x1000, "a", 1));
	auto frame = *entry(parent, 0x1000).frame;

	auto first = assert_ok(corten::forkCow(parent)).value();
	auto second = assert_ok(corten::forkCow(parent)).value();
	assert(f.frames->referenceCount(frame) == 3);
	assert(metadata(second.get(), 0x1000).refcount == 3);

	assert_ok(corten::munmap(first.get(), 0x1000, 0x1000));
	assert(f.frames->referenceCount(frame) == 2);
	second.reset();
	assert(f.frames->referenceCount(frame) == 1);
	first.reset();
	assert(f.frames->numUsedFrames() == 1);
}));

DEFINE_TEST(fork_out_of_frames, ([] {
	Fixture f{1};
	auto parent = f.space.get();
	assert_ok(corten::mmap(parent, 0x1000, 0x1000, rw));
	assert_ok(corten::writeSpace(parent, 0x1000, "a", 1));

	auto child = assert_ok(corten::forkCow(parent)).value();
	assert_error(corten::pageFault(child.get(), 0x1000, true), Error::noMemory);
	assert(query(child.get(), 0x1000) == Status::cowShared);

	// Once the child is gone, the parent writes in place.
	child.reset();
	assert_ok(corten::pageFault(parent, 0x1000, true));
	assert(query(parent, 0x1000) == Status::mapped);
	assert(f.frames->numUsedFrames() == 1);
}));
