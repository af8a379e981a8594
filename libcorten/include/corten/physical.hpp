#pragma once

#include <assert.h>
#include <stddef.h>

#include <atomic>
#include <memory>
#include <vector>

#include <frg/expected.hpp>
#include <frg/spinlock.hpp>

#include <corten/config.hpp>
#include <corten/error.hpp>
#include <corten/types.hpp>

namespace corten {

// Source of simulated physical frames.
// Each frame carries kPageSize bytes of contents and a reference count;
// a frame returns to the allocator once its count drops to zero.
//
// Thread safety: all functions may be called concurrently.
// Accesses to frame contents are synchronized by the page table locks of the mappings.
struct FrameAllocator {
	virtual ~FrameAllocator() = default;

	// Returns a zero-filled frame with a reference count of one.
	virtual frg::expected<Error, FrameNumber> allocate() = 0;

	// Adds a reference to an allocated frame.
	virtual void reference(FrameNumber frame) = 0;

	// Drops a reference; frees the frame when the count reaches zero.
	// Returns the remaining count.
	virtual size_t release(FrameNumber frame) = 0;

	// Drops a reference only if it is not the last one.
	// Returns false (and keeps the reference) if the caller holds the only reference.
	virtual bool releaseShared(FrameNumber frame) = 0;

	virtual size_t referenceCount(FrameNumber frame) = 0;

	virtual std::byte *contents(FrameNumber frame) = 0;

	virtual size_t numUsedFrames() = 0;
};

struct FrameAccessor {
	FrameAccessor()
	: _pointer{nullptr} { }

	FrameAccessor(FrameAllocator *allocator, FrameNumber frame)
	: _pointer{allocator->contents(frame)} { }

	explicit operator bool () {
		return _pointer;
	}

	std::byte *get() {
		return _pointer;
	}

private:
	std::byte *_pointer;
};

// Hands out frame numbers from a bump counter and recycles freed frames.
struct MonotonicFrameAllocator final : public FrameAllocator {
	typedef frg::ticket_spinlock Mutex;

	static constexpr FrameNumber firstFrame = 0x1000;

	explicit MonotonicFrameAllocator(size_t numFrames);

	MonotonicFrameAllocator(const MonotonicFrameAllocator &) = delete;

	MonotonicFrameAllocator &operator= (const MonotonicFrameAllocator &) = delete;

	frg::expected<Error, FrameNumber> allocate() override;
	void reference(FrameNumber frame) override;
	size_t release(FrameNumber frame) override;
	bool releaseShared(FrameNumber frame) override;
	size_t referenceCount(FrameNumber frame) override;
	std::byte *contents(FrameNumber frame) override;

	size_t numUsedFrames() override {
		return _usedFrames.load(std::memory_order_relaxed);
	}
	size_t numTotalFrames() {
		return _numFrames;
	}

private:
	struct Descriptor {
		std::atomic<size_t> refcount{0};
		std::unique_ptr<std::byte[]> data;
	};

	Descriptor &_descriptor(FrameNumber frame) {
		assert(frame >= firstFrame && frame < firstFrame + _numFrames);
		return _descriptors[frame - firstFrame];
	}

	size_t _numFrames;
	std::unique_ptr<Descriptor[]> _descriptors;

	Mutex _mutex;
	FrameNumber _nextFrame;
	std::vector<FrameNumber> _freeFrames;

	std::atomic<size_t> _usedFrames{0};
};

std::shared_ptr<FrameAllocator> makeFrameAllocator(const Options &options);

} // namespace corten
