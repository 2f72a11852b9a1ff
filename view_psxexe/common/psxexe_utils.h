/*
 * PS-X EXE Shared Utilities
 *
 * Small helpers shared by the loader, the memory map builder and the entry
 * locator. Nothing in here depends on Binary Ninja so the core can be unit
 * tested without a running host.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <string>

namespace psxexe {

/*
 * ============================================================================
 * BINARY DATA UTILITIES
 * ============================================================================
 */

/**
 * Read a little-endian 32-bit value.
 *
 * The executable header and all MIPS R3000A instruction words in a PS-X EXE
 * are little-endian regardless of the host byte order.
 */
[[nodiscard]] constexpr inline uint32_t ReadLE32(const uint8_t* p) noexcept
{
	return static_cast<uint32_t>(p[0]) |
	       (static_cast<uint32_t>(p[1]) << 8) |
	       (static_cast<uint32_t>(p[2]) << 16) |
	       (static_cast<uint32_t>(p[3]) << 24);
}

/*
 * ============================================================================
 * REGION FLAGS
 * ============================================================================
 *
 * Permission bits carried by region requests. The Binary Ninja adapter maps
 * them onto SegmentReadable/SegmentWritable/SegmentExecutable.
 */

enum RegionFlag : uint32_t
{
	RegionReadable = 0x1,
	RegionWritable = 0x2,
	RegionExecutable = 0x4
};

constexpr uint32_t kRegionRWX = RegionReadable | RegionWritable | RegionExecutable;
constexpr uint32_t kRegionRW = RegionReadable | RegionWritable;
constexpr uint32_t kRegionRX = RegionReadable | RegionExecutable;

// "rwx" style rendering used in log tables
inline std::string FormatRegionFlags(uint32_t flags)
{
	std::string out = "---";
	if (flags & RegionReadable)
		out[0] = 'r';
	if (flags & RegionWritable)
		out[1] = 'w';
	if (flags & RegionExecutable)
		out[2] = 'x';
	return out;
}

/**
 * Format a byte count with a binary unit suffix for log output.
 */
inline std::string FormatSize(uint64_t bytes)
{
	char buf[32];
	if (bytes >= 1024 * 1024 && (bytes % (1024 * 1024)) == 0)
		snprintf(buf, sizeof(buf), "%lluM", (unsigned long long)(bytes / (1024 * 1024)));
	else if (bytes >= 1024 && (bytes % 1024) == 0)
		snprintf(buf, sizeof(buf), "%lluK", (unsigned long long)(bytes / 1024));
	else
		snprintf(buf, sizeof(buf), "%llu", (unsigned long long)bytes);
	return buf;
}

} /* namespace psxexe */
