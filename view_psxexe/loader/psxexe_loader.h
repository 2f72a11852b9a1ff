/*
 * PS-X EXE Loader
 *
 * Single entry point that runs the three load phases in order against an
 * AddressSpace:
 *
 *   1. ParseExeHeader      magic gate, header decode
 *   2. BuildMemoryMap      RAM/code/mirrors, DATA/BSS, scratchpad, MMIO
 *      RealizeMemoryMap
 *   3. LocateEntryPoint    start/entry/gp/sp, main() heuristic
 *
 * Only a header that fails to parse is fatal. Everything after that degrades
 * to logged warnings.
 */

#pragma once

#include "address_space.h"
#include "exe_header.h"
#include "memory_map.h"
#include "analysis/entry_locator.h"
#include "common/diagnostics.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace psxexe {

constexpr const char* kLoaderVersion = "1.0.0";

struct LoadOptions
{
	bool locateMain = true;
	bool defineRegisters = true;
	bool defineReserved = true;
	bool createSections = true;
	bool seedEntryPoint = true;
	bool verbose = false;
};

struct LoadReport
{
	std::optional<ExeHeader> header;
	RealizeStats memory;
	EntryResult entry;
	bool cancelled = false;

	bool Parsed() const { return header.has_value(); }
};

/**
 * Switch off one load pass by name.
 *
 * Tokens: "all", "main", "mmio" (also drops filler), "filler".
 *
 * @return false for an unknown token (options unchanged).
 */
bool DisableLoadPass(LoadOptions& options, const std::string& token);

/**
 * Apply a comma/semicolon/space separated token list (the value of
 * BN_PSXEXE_DISABLE_PASSES). Unknown tokens are reported and ignored.
 */
void ApplyDisabledPasses(LoadOptions& options, const char* value, Diagnostics& diag);

/**
 * Load an executable into `space`.
 *
 * @param headerData  First bytes of the file (at least the 0x38-byte field
 *                    block; the full 0x800 header for the marker text).
 * @param headerLen   Number of valid bytes at headerData.
 * @param fileLength  Total file length, used to size the code backing.
 */
LoadReport LoadExecutable(const uint8_t* headerData, size_t headerLen, uint64_t fileLength, AddressSpace& space,
	Diagnostics& diag, const LoadOptions& options = LoadOptions());

void LogHeaderSummary(const ExeHeader& header, Diagnostics& diag);

} /* namespace psxexe */
