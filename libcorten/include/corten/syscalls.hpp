#pragma once

#include <stddef.h>

#include <memory>

#include <frg/expected.hpp>

#include <corten/address-space.hpp>
#include <corten/error.hpp>
#include <corten/types.hpp>

namespace corten {

// Reserves [va, va + length) as private anonymous memory with the given permissions.
// Frames are only allocated on the first fault. Existing mappings in the range are replaced.
frg::expected<Error> mmap(AddressSpace *space, VirtualAddr va, size_t length,
		PageFlags permissions);

// Removes all mappings in [va, va + length) and releases their frames.
frg::expected<Error> munmap(AddressSpace *space, VirtualAddr va, size_t length);

// Resolves a fault on va. Returns Error::fault if the access is not allowed.
frg::expected<Error> pageFault(AddressSpace *space, VirtualAddr va, bool isWrite);

// Creates a copy of the source space that shares all populated frames copy-on-write.
frg::expected<Error, std::shared_ptr<AddressSpace>> forkCow(AddressSpace *source);

// Copy between a buffer and the address space as a user access would,
// faulting pages in as necessary.
frg::expected<Error> readSpace(AddressSpace *space, VirtualAddr va, void *buffer, size_t size);
frg::expected<Error> writeSpace(AddressSpace *space, VirtualAddr va,
		const void *buffer, size_t size);

} // namespace corten
