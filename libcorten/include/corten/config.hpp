#pragma once

#include <stddef.h>

#include <frg/expected.hpp>
#include <frg/string.hpp>

#include <corten/error.hpp>

namespace corten {

struct Options {
	// Number of frames handed out by the default frame allocator.
	size_t maxFrames = 65536;
	// Capacity of the page table arena of each address space.
	size_t maxTables = 16384;

	bool logFaults = false;
	bool logTables = false;
	bool logReclaim = false;
};

// Parses a kernel-style command line, e.g. "corten.frames=1024 corten.log-faults".
// Unknown options are ignored.
frg::expected<Error, Options> parseOptions(frg::string_view cmdline);

} // namespace corten
