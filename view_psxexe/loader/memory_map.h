/*
 * PS-X EXE Memory Map Builder
 *
 * Turns a parsed header into an ordered list of region and mirror requests,
 * then realizes that list against an AddressSpace.
 *
 * Layout of the produced map:
 *
 *   0x80000000  RAM_B      [cached base, load address)             rwx
 *   loadAddr    CODE_B     [load address, + code size) file@0x800  r-x
 *   codeEnd     RAM_HI_B   [code end, cached base + 2M)            rwx
 *   each of the above mirrored at 0x00000000 (_A) and 0xA0000000 (_C)
 *   dataAddr    DATA       (only when the header address is non-zero)
 *   bssAddr     BSS        (only when the header address is non-zero)
 *   0x1F800000  CACHE      scratchpad, 1K                          rw-
 *   0x1F800400  UNK1       3K                                      rw-
 *   0x1F801000+ hardware register blocks (mmio_catalog.h)          rw-
 *
 * Building is a pure function of (header, file length, options): building
 * twice yields identical plans.
 */

#pragma once

#include "address_space.h"
#include "exe_header.h"
#include "mmio_catalog.h"
#include "common/diagnostics.h"

#include <cstdint>
#include <string>
#include <vector>

namespace psxexe {

constexpr uint32_t kRamSize = 0x200000;
constexpr uint32_t kRamBaseLow = 0x00000000;       // KUSEG
constexpr uint32_t kRamBaseCached = 0x80000000;    // KSEG0
constexpr uint32_t kRamBaseUncached = 0xA0000000;  // KSEG1
constexpr uint32_t kMirrorMask = 0x00FFFFFF;

constexpr uint32_t kScratchpadBase = 0x1F800000;
constexpr uint32_t kScratchpadSize = 0x400;
constexpr uint32_t kUnknownBase = 0x1F800400;
constexpr uint32_t kUnknownSize = 0xC00;

enum class MapEntryKind
{
	Region,
	Mirror
};

struct MapEntry
{
	MapEntryKind kind = MapEntryKind::Region;
	std::string name;
	uint64_t start = 0;
	uint64_t size = 0;
	uint32_t flags = 0;          // Region only; mirrors inherit from their base
	uint64_t mirrorOf = 0;       // Mirror only: start of the base region
	uint64_t fileOffset = 0;
	uint64_t fileLength = 0;     // 0 = zero-filled
	SectionKind section = SectionKind::Data;

	bool operator==(const MapEntry& other) const;
	bool operator!=(const MapEntry& other) const { return !(*this == other); }
};

// Register definitions for one catalog block, applied as one batch
struct RegisterBatch
{
	std::string blockName;
	uint64_t blockStart = 0;
	std::vector<RegisterDefinition> definitions;
};

struct MemoryMapPlan
{
	std::vector<MapEntry> entries;
	std::vector<RegisterBatch> registers;
	bool createSections = true;
};

struct MemoryMapOptions
{
	bool includeRegisters = true;
	bool includeReserved = true;
	bool createSections = true;
};

struct RealizeStats
{
	size_t regions = 0;
	size_t mirrors = 0;
	size_t sections = 0;
	size_t registers = 0;
	size_t reserved = 0;
	size_t failures = 0;
	bool cancelled = false;
};

/**
 * Address of the mirror of `address` inside the segment starting at `base`.
 */
[[nodiscard]] constexpr inline uint32_t MirrorAddress(uint32_t base, uint32_t address) noexcept
{
	return base + (address & kMirrorMask);
}

/**
 * Build the ordered region plan.
 *
 * @param header      Parsed header.
 * @param fileLength  Total input length; limits how much of the code region
 *                    is file-backed.
 * @param options     Which optional parts to include.
 */
MemoryMapPlan BuildMemoryMap(const ExeHeader& header, uint64_t fileLength,
	const MemoryMapOptions& options = MemoryMapOptions());

/**
 * Register batches for every catalog block, in catalog order.
 */
std::vector<RegisterBatch> BuildRegisterBatches(bool includeReserved);

/**
 * Create every planned region, mirror and register definition.
 *
 * Individual failures are logged and counted; they never stop the pass.
 * Cancellation stops the pass and keeps what was already created.
 */
RealizeStats RealizeMemoryMap(const MemoryMapPlan& plan, AddressSpace& space, Diagnostics& diag);

/**
 * Apply register batches only. Used by the realization pass and by the
 * "Define Hardware Registers" command on an already-loaded view.
 */
void RealizeRegisters(const std::vector<RegisterBatch>& batches, AddressSpace& space, Diagnostics& diag,
	RealizeStats& stats);

/**
 * One-line summary at info level, plus the region table when verbose.
 */
void LogMemoryMapSummary(const MemoryMapPlan& plan, const RealizeStats& stats, Diagnostics& diag, bool verbose);

} /* namespace psxexe */
