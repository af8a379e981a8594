#include <string.h>

#include <algorithm>

#include <corten/debug.hpp>
#include <corten/syscalls.hpp>

namespace corten {

namespace {
	constexpr PageFlags allAccess = page_access::read | page_access::write
			| page_access::execute;

	// Returns the page-aligned end of the range.
	frg::expected<Error, VirtualAddr> checkRange(VirtualAddr va, size_t length) {
		if(!isPageAligned(va) || !length)
			return Error::invalidRange;
		if(va >= kSpaceLimit || length > kSpaceLimit - va)
			return Error::invalidRange;

		auto rounded = (length + kPageSize - 1) & ~(size_t{kPageSize} - 1);
		if(rounded > kSpaceLimit - va)
			return Error::invalidRange;
		return va + rounded;
	}

	bool accessAllowed(PageFlags softPermissions, bool isWrite) {
		if(isWrite)
			return softPermissions & page_access::write;
		return softPermissions & page_access::read;
	}

	// Drops the frame references of all populated entries in the cursor's range.
	void dropEntries(RangeCursor &cursor, FrameAllocator *frames) {
		cursor.forEach([&] (VirtualAddr, Pte &pte, PteMetadata &md) {
			if(pte.frame)
				frames->release(*pte.frame);
			pte = Pte{};
			md = PteMetadata{};
		});
	}

	frg::expected<Error> resolveCow(AddressSpace *space, RangeCursor &cursor,
			VirtualAddr page, PteMetadata md) {
		auto frames = space->frameAllocator();
		auto pte = cursor.entry(page);
		assert(pte && pte->present && pte->frame);
		auto original = *pte->frame;

		if(frames->referenceCount(original) == 1) {
			// The other sharers are gone; take the frame over.
			FRG_TRY(cursor.map(page, original, md.softPermissions));
			if(space->options().logFaults)
				infoLogger() << "corten: Reusing exclusive frame 0x" << frg::hex_fmt(original)
						<< " at 0x" << frg::hex_fmt(page) << frg::endlog;
			return {};
		}

		auto copy = FRG_TRY(frames->allocate());
		memcpy(FrameAccessor{frames, copy}.get(), FrameAccessor{frames, original}.get(),
				kPageSize);

		// Another sharer may have dropped its reference after we checked the count.
		if(!frames->releaseShared(original)) {
			frames->release(copy);
			FRG_TRY(cursor.map(page, original, md.softPermissions));
			return {};
		}

		auto outcome = cursor.map(page, copy, md.softPermissions);
		if(!outcome) {
			frames->release(copy);
			return outcome.error();
		}
		if(space->options().logFaults)
			infoLogger() << "corten: Copied frame 0x" << frg::hex_fmt(original)
					<< " to 0x" << frg::hex_fmt(copy) << " at 0x" << frg::hex_fmt(page)
					<< frg::endlog;
		return {};
	}

	frg::expected<Error> fatalFault(AddressSpace *space, VirtualAddr va, bool isWrite,
			Status status) {
		if(space->options().logFaults)
			infoLogger() << "corten: Fatal " << (isWrite ? "write" : "read")
					<< " fault at 0x" << frg::hex_fmt(va)
					<< " (page is " << statusName(status) << ")" << frg::endlog;
		return Error::fault;
	}
} // anonymous namespace

frg::expected<Error> mmap(AddressSpace *space, VirtualAddr va, size_t length,
		PageFlags permissions) {
	if(permissions & ~allAccess)
		return Error::illegalArgs;
	auto end = FRG_TRY(checkRange(va, length));

	auto cursor = space->lock(va, end);
	// Allocate all tables before the old mappings are dropped.
	FRG_TRY(cursor.populate(va, end - va));
	dropEntries(cursor, space->frameAllocator());
	FRG_TRY(cursor.mark(va, end - va, Status::privateAnon, permissions));
	return {};
}

frg::expected<Error> munmap(AddressSpace *space, VirtualAddr va, size_t length) {
	auto end = FRG_TRY(checkRange(va, length));

	auto cursor = space->lock(va, end);
	dropEntries(cursor, space->frameAllocator());
	cursor.removeTables();
	return {};
}

frg::expected<Error> pageFault(AddressSpace *space, VirtualAddr va, bool isWrite) {
	if(va >= kSpaceLimit)
		return Error::invalidRange;
	auto page = va & ~(VirtualAddr{kPageSize} - 1);

	auto cursor = space->lock(page, page + kPageSize);
	auto md = cursor.metadata(page);

	switch(md.status) {
	case Status::unmapped:
		return fatalFault(space, va, isWrite, md.status);

	case Status::privateAnon: {
		if(!accessAllowed(md.softPermissions, isWrite))
			return fatalFault(space, va, isWrite, md.status);

		auto frames = space->frameAllocator();
		auto frame = FRG_TRY(frames->allocate());
		auto outcome = cursor.map(page, frame, md.softPermissions);
		if(!outcome) {
			frames->release(frame);
			return outcome.error();
		}
		return {};
	}

	case Status::mapped:
		// Another thread resolved the fault before we got the lock.
		if(!accessAllowed(md.softPermissions, isWrite))
			return fatalFault(space, va, isWrite, md.status);
		return {};

	case Status::cowShared:
		if(!accessAllowed(md.softPermissions, isWrite))
			return fatalFault(space, va, isWrite, md.status);
		if(!isWrite)
			return {};
		return resolveCow(space, cursor, page, md);
	}

	return Error::fault;
}

frg::expected<Error, std::shared_ptr<AddressSpace>> forkCow(AddressSpace *source) {
	auto child = FRG_TRY(AddressSpace::create(source->sharedFrameAllocator(),
			source->options()));
	auto frames = source->frameAllocator();

	auto src = source->lock(0, kSpaceLimit);
	auto dst = child->lock(0, kSpaceLimit);

	Error error = Error::success;
	src.forEach([&] (VirtualAddr va, Pte &pte, PteMetadata &md) {
		if(error != Error::success)
			return;

		switch(md.status) {
		case Status::unmapped:
			break;

		case Status::privateAnon: {
			auto outcome = dst.mark(va, kPageSize, Status::privateAnon, md.softPermissions);
			if(!outcome)
				error = outcome.error();
			break;
		}

		case Status::mapped:
		case Status::cowShared: {
			assert(pte.present && pte.frame);
			auto frame = *pte.frame;
			auto flags = pte.flags & ~page_access::write;

			auto outcome = dst.map(va, frame, flags);
			if(!outcome) {
				error = outcome.error();
				break;
			}
			frames->reference(frame);
			pte.flags = flags;

			PteMetadata shared{Status::cowShared, md.softPermissions,
					static_cast<uint32_t>(frames->referenceCount(frame))};
			md = shared;
			// The table exists since map() succeeded.
			dst.setMetadata(va, shared).unwrap();
			break;
		}
		}
	});

	if(error != Error::success) {
		// Entries that were already shared stay copy-on-write in the source;
		// dropping the child releases its references again.
		warningLogger() << "corten: Fork failed with " << errorName(error) << frg::endlog;
		return error;
	}
	return child;
}

frg::expected<Error> readSpace(AddressSpace *space, VirtualAddr va, void *buffer, size_t size) {
	if(va >= kSpaceLimit || size > kSpaceLimit - va)
		return Error::invalidRange;
	auto frames = space->frameAllocator();

	size_t progress = 0;
	while(progress < size) {
		auto address = va + progress;
		auto page = address & ~(VirtualAddr{kPageSize} - 1);
		auto offset = address - page;
		auto chunk = std::min(size - progress, size_t{kPageSize} - offset);

		{
			auto cursor = space->lock(page, page + kPageSize);
			auto pte = cursor.entry(page);
			if(pte && pte->present && (pte->flags & page_access::read)) {
				FrameAccessor accessor{frames, *pte->frame};
				memcpy(static_cast<std::byte *>(buffer) + progress,
						accessor.get() + offset, chunk);
				progress += chunk;
				continue;
			}
		}

		FRG_TRY(pageFault(space, address, false));
	}
	return {};
}

frg::expected<Error> writeSpace(AddressSpace *space, VirtualAddr va,
		const void *buffer, size_t size) {
	if(va >= kSpaceLimit || size > kSpaceLimit - va)
		return Error::invalidRange;
	auto frames = space->frameAllocator();

	size_t progress = 0;
	while(progress < size) {
		auto address = va + progress;
		auto page = address & ~(VirtualAddr{kPageSize} - 1);
		auto offset = address - page;
		auto chunk = std::min(size - progress, size_t{kPageSize} - offset);

		{
			auto cursor = space->lock(page, page + kPageSize);
			auto pte = cursor.entry(page);
			if(pte && pte->present && (pte->flags & page_access::write)) {
				FrameAccessor accessor{frames, *pte->frame};
				memcpy(accessor.get() + offset,
						static_cast<const std::byte *>(buffer) + progress, chunk);
				progress += chunk;
				continue;
			}
		}

		FRG_TRY(pageFault(space, address, true));
	}
	return {};
}

} // namespace corten
