#include <assert.h>
#include <string.h>

#include <corten/physical.hpp>

#include "testsuite.hpp"

using corten::Error;
using corten::MonotonicFrameAllocator;

DEFINE_TEST(frame_allocate_zeroed, ([] {
	MonotonicFrameAllocator frames{4};

	auto frame = assert_ok(frames.allocate()).value();
	assert(frame == MonotonicFrameAllocator::firstFrame);
	assert(frames.referenceCount(frame) == 1);
	assert(frames.numUsedFrames() == 1);

	auto p = frames.contents(frame);
	for(size_t i = 0; i < corten::kPageSize; i++)
		assert(p[i] == std::byte{0});

	assert(frames.release(frame) == 0);
	assert(frames.numUsedFrames() == 0);
}));

DEFINE_TEST(frame_exhaustion_and_reuse, ([] {
	MonotonicFrameAllocator frames{2};

	auto a = assert_ok(frames.allocate()).value();
	auto b = assert_ok(frames.allocate()).value();
	assert(a != b);
	assert_error(frames.allocate(), Error::noMemory);

	memset(frames.contents(a), 0xAB, corten::kPageSize);
	frames.release(a);

	// Recycled frames are handed out zero-filled again.
	auto c = assert_ok(frames.allocate()).value();
	assert(c == a);
	assert(frames.contents(c)[0] == std::byte{0});
	assert(frames.contents(c)[corten::kPageSize - 1] == std::byte{0});

	frames.release(b);
	frames.release(c);
	assert(!frames.numUsedFrames());
}));

DEFINE_TEST(frame_reference_counting, ([] {
	MonotonicFrameAllocator frames{4};

	auto frame = assert_ok(frames.allocate()).value();
	frames.reference(frame);
	frames.reference(frame);
	assert(frames.referenceCount(frame) == 3);

	assert(frames.release(frame) == 2);
	assert(frames.releaseShared(frame));
	assert(frames.referenceCount(frame) == 1);

	// The last reference cannot be dropped as a shared one.
	assert(!frames.releaseShared(frame));
	assert(frames.referenceCount(frame) == 1);
	assert(frames.numUsedFrames() == 1);

	assert(frames.release(frame) == 0);
	assert(!frames.numUsedFrames());
}));

DEFINE_TEST(frame_accessor, ([] {
	MonotonicFrameAllocator frames{1};
	auto frame = assert_ok(frames.allocate()).value();

	corten::FrameAccessor empty;
	assert(!empty);

	corten::FrameAccessor accessor{&frames, frame};
	assert(accessor);
	assert(accessor.get() == frames.contents(frame));
	frames.release(frame);
}));
