#pragma once

#include <stddef.h>
#include <stdint.h>

namespace corten {

using VirtualAddr = uintptr_t;
using FrameNumber = uint64_t;

enum {
	kPageSize = 0x1000,
	kPageShift = 12
};

// Geometry of the translation tree. Level 0 tables hold the 4 KiB leaf entries.
constexpr int numLevels = 4;
constexpr int rootLevel = numLevels - 1;
constexpr size_t bitsPerLevel = 9;
constexpr size_t entriesPerTable = size_t{1} << bitsPerLevel;

// Exclusive upper bound of the simulated address space (48 bits).
constexpr VirtualAddr kSpaceLimit = VirtualAddr{1} << (kPageShift + bitsPerLevel * numLevels);

using PageFlags = uint32_t;

namespace page_access {
	static constexpr PageFlags write = 1;
	static constexpr PageFlags execute = 2;
	static constexpr PageFlags read = 4;
}

// Amount of address space covered by a single entry of a table at the given level.
constexpr VirtualAddr entrySpan(int level) {
	return VirtualAddr{1} << (kPageShift + bitsPerLevel * level);
}

// Amount of address space covered by a whole table at the given level.
constexpr VirtualAddr tableSpan(int level) {
	return entrySpan(level) << bitsPerLevel;
}

constexpr size_t indexAt(int level, VirtualAddr va) {
	return (va >> (kPageShift + bitsPerLevel * level)) & (entriesPerTable - 1);
}

constexpr bool isPageAligned(uintptr_t x) {
	return !(x & (kPageSize - 1));
}

static_assert(kSpaceLimit == tableSpan(rootLevel));

} // namespace corten
