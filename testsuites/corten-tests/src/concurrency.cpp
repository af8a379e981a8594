#include <assert.h>
#include <string.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include <corten/syscalls.hpp>

#include "testsuite.hpp"

using namespace std::chrono_literals;
using corten::Status;
using corten::VirtualAddr;

namespace {
	constexpr corten::PageFlags rw = corten::page_access::read | corten::page_access::write;

	constexpr VirtualAddr leafSpan = corten::tableSpan(0);

	constexpr int numThreads = 8;

	std::shared_ptr<corten::AddressSpace> makeSpace(size_t numFrames) {
		auto frames = std::make_shared<corten::MonotonicFrameAllocator>(numFrames);
		return assert_ok(corten::AddressSpace::create(frames)).value();
	}
} // anonymous namespace

DEFINE_TEST(disjoint_ranges_do_not_block, ([] {
	auto space = makeSpace(64);

	// No tables exist yet; the cursor must not end up holding the root.
	auto cursor = space->lock(0x1000, 0x2000);
	assert(cursor.coveringNode()->isLeaf());
	assert_ok(cursor.mark(0x1000, 0x1000, Status::privateAnon, rw));

	auto disjoint = std::async(std::launch::async, [&] {
		// Below another root entry.
		assert_ok(corten::mmap(space.get(), 0x8000000000, 0x1000, rw));
		assert_ok(corten::pageFault(space.get(), 0x8000000000, true));
		// Below another entry of the same level 2 table.
		assert_ok(corten::mmap(space.get(), 0x40002000, 0x1000, rw));
		assert_ok(corten::pageFault(space.get(), 0x40002000, true));
	});
	assert(disjoint.wait_for(5s) == std::future_status::ready);
	disjoint.get();

	// An overlapping range has to wait for the cursor.
	auto overlapping = std::async(std::launch::async, [&] {
		assert_ok(corten::pageFault(space.get(), 0x1000, true));
	});
	assert(overlapping.wait_for(50ms) == std::future_status::timeout);
	cursor.release();
	assert(overlapping.wait_for(5s) == std::future_status::ready);
	overlapping.get();
}));

DEFINE_TEST(concurrent_mmaps_on_fresh_space, ([] {
	for(int round = 0; round < 20; round++) {
		auto space = makeSpace(64);

		std::atomic<int> ready{0};
		std::vector<std::thread> workers;
		for(int t = 0; t < numThreads; t++) {
			workers.emplace_back([&, t] {
				ready.fetch_add(1);
				while(ready.load() < numThreads)
					;
				// Half of the threads share a level 2 table, the others get their own.
				VirtualAddr va = (t % 2) ? t * corten::tableSpan(2) : t * corten::tableSpan(1);
				assert_ok(corten::mmap(space.get(), va, 0x1000, rw));
				assert_ok(corten::pageFault(space.get(), va, true));
			});
		}
		for(auto &thread : workers)
			thread.join();

		assert(space->frameAllocator()->numUsedFrames() == numThreads);
		// Racing creators link exactly one table per slot.
		assert(space->numTables() == space->numTablesCreated() + 1);
	}
}));

DEFINE_TEST(parallel_private_regions, ([] {
	auto space = makeSpace(4096);
	constexpr int rounds = 50;
	constexpr size_t regionSize = 16 * corten::kPageSize;

	std::vector<std::thread> workers;
	for(int t = 0; t < numThreads; t++) {
		workers.emplace_back([&, t] {
			// Alternate between regions sharing a leaf table and regions on their own.
			VirtualAddr base = (t % 2) ? t * regionSize : t * leafSpan;
			char pattern[regionSize / 4];
			char buffer[regionSize / 4];

			for(int r = 0; r < rounds; r++) {
				memset(pattern, 'a' + (t + r) % 26, sizeof(pattern));
				assert_ok(corten::mmap(space.get(), base, regionSize, rw));
				assert_ok(corten::writeSpace(space.get(), base + 0x800, pattern, sizeof(pattern)));
				assert_ok(corten::readSpace(space.get(), base + 0x800, buffer, sizeof(buffer)));
				assert(!memcmp(pattern, buffer, sizeof(pattern)));
				assert_ok(corten::munmap(space.get(), base, regionSize));
			}
		});
	}
	for(auto &thread : workers)
		thread.join();

	assert(!space->frameAllocator()->numUsedFrames());
}));

DEFINE_TEST(overlapping_stress, ([] {
	auto space = makeSpace(1 << 14);
	constexpr int iterations = 2000;
	// Four leaf tables worth of address space shared by all threads.
	constexpr VirtualAddr arena = 4 * leafSpan;

	std::vector<std::thread> workers;
	for(int t = 0; t < numThreads; t++) {
		workers.emplace_back([&, t] {
			std::mt19937 rng{static_cast<unsigned int>(t)};
			std::uniform_int_distribution<int> pickOp{0, 9};
			std::uniform_int_distribution<VirtualAddr> pickPage{0, arena / corten::kPageSize - 1};
			std::uniform_int_distribution<VirtualAddr> pickPages{1, 64};

			for(int i = 0; i < iterations; i++) {
				auto va = pickPage(rng) * corten::kPageSize;
				auto op = pickOp(rng);
				if(op < 3) {
					auto length = std::min(pickPages(rng) * corten::kPageSize, arena - va);
					assert_ok(corten::mmap(space.get(), va, length, rw));
				}else if(op < 5) {
					auto length = std::min(pickPages(rng) * corten::kPageSize, arena - va);
					assert_ok(corten::munmap(space.get(), va, length));
				}else if(op < 6) {
					// Whole leaf tables get removed and recreated.
					auto table = va & ~(leafSpan - 1);
					assert_ok(corten::munmap(space.get(), table, leafSpan));
				}else{
					// Faults race with unmapping; a fatal fault is fine.
					auto outcome = corten::pageFault(space.get(), va, op % 2);
					assert(outcome || outcome.error() == corten::Error::fault);
				}
			}
		});
	}
	for(auto &thread : workers)
		thread.join();

	// Every frame is reachable from exactly one entry.
	size_t mapped = 0;
	{
		auto cursor = space->lock(0, arena);
		cursor.forEach([&] (VirtualAddr, corten::Pte &pte, corten::PteMetadata &md) {
			assert(pte.present == (md.status == Status::mapped));
			if(pte.present) {
				assert(space->frameAllocator()->referenceCount(*pte.frame) == 1);
				mapped++;
			}
		});
	}
	assert(space->frameAllocator()->numUsedFrames() == mapped);

	assert_ok(corten::munmap(space.get(), 0, corten::tableSpan(2)));
	assert(!space->frameAllocator()->numUsedFrames());
	while(space->reclaimer().numPending())
		space->reclaimer().tryReclaim();
	assert(space->numTables() == 1);
	assert(space->numTablesReclaimed() == space->numTablesCreated());
}));

DEFINE_TEST(racing_faults_on_one_page, ([] {
	auto space = makeSpace(64);
	assert_ok(corten::mmap(space.get(), 0x1000, 0x1000, rw));

	std::atomic<int> ready{0};
	std::vector<std::thread> workers;
	for(int t = 0; t < numThreads; t++) {
		workers.emplace_back([&, t] {
			ready.fetch_add(1);
			while(ready.load() < numThreads)
				;
			assert_ok(corten::pageFault(space.get(), 0x1000, t % 2));
		});
	}
	for(auto &thread : workers)
		thread.join();

	assert(space->frameAllocator()->numUsedFrames() == 1);
}));

DEFINE_TEST(racing_cow_faults, ([] {
	for(int round = 0; round < 100; round++) {
		auto parent = makeSpace(64);
		assert_ok(corten::mmap(parent.get(), 0x1000, 0x1000, rw));
		assert_ok(corten::writeSpace(parent.get(), 0x1000, "shared", 6));
		auto child = assert_ok(corten::forkCow(parent.get())).value();

		std::atomic<int> ready{0};
		auto writer = [&] (corten::AddressSpace *space, const char *text) {
			ready.fetch_add(1);
			while(ready.load() < 2)
				;
			assert_ok(corten::writeSpace(space, 0x1000, text, 6));
		};
		std::thread a{writer, parent.get(), "parent"};
		std::thread b{writer, child.get(), "child!"};
		a.join();
		b.join();

		// One side copied, the other one kept the original frame.
		auto frames = parent->frameAllocator();
		assert(frames->numUsedFrames() == 2);

		char buffer[6];
		assert_ok(corten::readSpace(parent.get(), 0x1000, buffer, 6));
		assert(!memcmp(buffer, "parent", 6));
		assert_ok(corten::readSpace(child.get(), 0x1000, buffer, 6));
		assert(!memcmp(buffer, "child!", 6));
	}
}));
