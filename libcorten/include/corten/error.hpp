#pragma once

namespace corten {

enum class Error {
	success,
	// Address or length outside of the address space, or misaligned.
	invalidRange,
	// Out of physical frames or page table slots.
	noMemory,
	// Access to a page that is unmapped or does not permit the access.
	fault,
	illegalArgs
};

inline const char *errorName(Error error) {
	switch(error) {
	case Error::success: return "success";
	case Error::invalidRange: return "invalid range";
	case Error::noMemory: return "out of memory";
	case Error::fault: return "fault";
	case Error::illegalArgs: return "illegal arguments";
	}
	return "unknown error";
}

} // namespace corten
