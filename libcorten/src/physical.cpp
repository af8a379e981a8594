#include <string.h>

#include <corten/physical.hpp>
#include <frg/mutex.hpp>

namespace corten {

MonotonicFrameAllocator::MonotonicFrameAllocator(size_t numFrames)
: _numFrames{numFrames}, _descriptors{std::make_unique<Descriptor[]>(numFrames)},
		_nextFrame{firstFrame} { }

frg::expected<Error, FrameNumber> MonotonicFrameAllocator::allocate() {
	FrameNumber frame;
	{
		auto lock = frg::guard(&_mutex);

		if(!_freeFrames.empty()) {
			frame = _freeFrames.back();
			_freeFrames.pop_back();
		}else if(_nextFrame < firstFrame + _numFrames) {
			frame = _nextFrame++;
		}else{
			return Error::noMemory;
		}
	}

	// The frame is not reachable by anybody else until we return it.
	auto &desc = _descriptor(frame);
	if(desc.data) {
		memset(desc.data.get(), 0, kPageSize);
	}else{
		desc.data = std::make_unique<std::byte[]>(kPageSize);
	}
	desc.refcount.store(1, std::memory_order_release);
	_usedFrames.fetch_add(1, std::memory_order_relaxed);
	return frame;
}

void MonotonicFrameAllocator::reference(FrameNumber frame) {
	auto previous = _descriptor(frame).refcount.fetch_add(1, std::memory_order_relaxed);
	assert(previous && "reference to a free frame");
	(void)previous;
}

size_t MonotonicFrameAllocator::release(FrameNumber frame) {
	auto previous = _descriptor(frame).refcount.fetch_sub(1, std::memory_order_acq_rel);
	assert(previous && "release of a free frame");
	if(previous > 1)
		return previous - 1;

	_usedFrames.fetch_sub(1, std::memory_order_relaxed);
	auto lock = frg::guard(&_mutex);
	_freeFrames.push_back(frame);
	return 0;
}

bool MonotonicFrameAllocator::releaseShared(FrameNumber frame) {
	auto &refcount = _descriptor(frame).refcount;
	auto current = refcount.load(std::memory_order_relaxed);
	while(true) {
		assert(current && "release of a free frame");
		if(current == 1)
			return false;
		if(refcount.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
				std::memory_order_relaxed))
			return true;
	}
}

size_t MonotonicFrameAllocator::referenceCount(FrameNumber frame) {
	return _descriptor(frame).refcount.load(std::memory_order_acquire);
}

std::byte *MonotonicFrameAllocator::contents(FrameNumber frame) {
	auto &desc = _descriptor(frame);
	assert(desc.data);
	return desc.data.get();
}

std::shared_ptr<FrameAllocator> makeFrameAllocator(const Options &options) {
	return std::make_shared<MonotonicFrameAllocator>(options.maxFrames);
}

} // namespace corten
