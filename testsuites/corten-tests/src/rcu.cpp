#include <assert.h>

#include <atomic>
#include <thread>
#include <vector>

#include <corten/rcu.hpp>

#include "testsuite.hpp"

using corten::NodeArena;
using corten::RcuReadGuard;
using corten::RcuReclaimer;

namespace {
	corten::PageTableNode *retire(NodeArena &arena, RcuReclaimer &reclaimer) {
		auto node = assert_ok(arena.allocate(0)).value();
		node->markStale();
		reclaimer.deferFree(node);
		return node;
	}
} // anonymous namespace

DEFINE_TEST(rcu_waits_for_readers, ([] {
	NodeArena arena{8};
	RcuReclaimer reclaimer{&arena, false};

	auto ticket = reclaimer.enterReadSide();
	retire(arena, reclaimer);
	assert(reclaimer.numPending() == 1);

	// The reader blocks the second epoch transition.
	for(int i = 0; i < 4; i++)
		reclaimer.tryReclaim();
	assert(reclaimer.numPending() == 1);
	assert(arena.numUsed() == 1);
	assert(reclaimer.epoch() == 1);

	reclaimer.exitReadSide(ticket);
	assert(reclaimer.tryReclaim() == 1);
	assert(!reclaimer.numPending());
	assert(reclaimer.numReclaimed() == 1);
	assert(!arena.numUsed());
}));

DEFINE_TEST(rcu_later_readers_do_not_delay, ([] {
	NodeArena arena{8};
	RcuReclaimer reclaimer{&arena, false};

	retire(arena, reclaimer);
	reclaimer.tryReclaim();
	assert(reclaimer.numPending() == 1);

	// This reader started after the removal and cannot see the node.
	RcuReadGuard guard{&reclaimer};
	assert(reclaimer.numReaders() == 1);
	assert(reclaimer.tryReclaim() == 1);
	assert(!arena.numUsed());
}));

DEFINE_TEST(rcu_read_guard, ([] {
	NodeArena arena{1};
	RcuReclaimer reclaimer{&arena, false};

	{
		RcuReadGuard guard{&reclaimer};
		assert(reclaimer.numReaders() == 1);
		guard.unlock();
		assert(!reclaimer.numReaders());
	}
	assert(!reclaimer.numReaders());

	{
		RcuReadGuard guard{&reclaimer};
		RcuReadGuard nested{&reclaimer};
		assert(reclaimer.numReaders() == 2);
	}
	assert(!reclaimer.numReaders());
}));

DEFINE_TEST(rcu_drain, ([] {
	NodeArena arena{8};
	RcuReclaimer reclaimer{&arena, false};

	for(int i = 0; i < 5; i++)
		retire(arena, reclaimer);
	assert(reclaimer.numPending() == 5);
	assert(reclaimer.drain() == 5);
	assert(!reclaimer.numPending());
	assert(!arena.numUsed());
}));

DEFINE_TEST(rcu_concurrent_readers, ([] {
	constexpr int numNodes = 2000;
	NodeArena arena{64};
	RcuReclaimer reclaimer{&arena, false};

	std::atomic<bool> done{false};
	std::vector<std::thread> readers;
	for(int i = 0; i < 4; i++) {
		readers.emplace_back([&] {
			while(!done.load(std::memory_order_relaxed)) {
				RcuReadGuard guard{&reclaimer};
				std::this_thread::yield();
			}
		});
	}

	int retired = 0;
	while(retired < numNodes) {
		if(arena.numUsed() < arena.capacity()) {
			retire(arena, reclaimer);
			retired++;
		}
		reclaimer.tryReclaim();
	}

	done.store(true, std::memory_order_relaxed);
	for(auto &thread : readers)
		thread.join();

	reclaimer.drain();
	assert(reclaimer.numReclaimed() == numNodes);
	assert(!arena.numUsed());
}));
