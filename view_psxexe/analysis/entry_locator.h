/*
 * PS-X EXE Entry Point Locator
 *
 * Marks the header's initial PC as the "start" function, seeds the default
 * gp/sp register values, and then tries to find the program's main() by
 * scanning forward from the entry for the SDK startup stub.
 *
 * Finding main is a heuristic. When no signature matches, or the matched call
 * cannot be decoded, the loader simply goes without a "main" label.
 */

#pragma once

#include "signature_scan.h"
#include "loader/address_space.h"
#include "loader/exe_header.h"
#include "common/diagnostics.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace psxexe {

constexpr const char* kStartSymbol = "start";
constexpr const char* kMainSymbol = "main";

struct EntryLocatorOptions
{
	bool seedEntryPoint = true;
	bool locateMain = true;
	// nullptr = GetEntrySignatures()
	const std::vector<EntrySignature>* signatures = nullptr;
};

struct EntryResult
{
	uint64_t startAddress = 0;
	bool startDefined = false;
	std::optional<uint64_t> mainAddress;
	std::string signatureName;     // signature that produced main
	uint64_t matchAddress = 0;
};

/**
 * Create the "start" function and entry point at initialPc and set the
 * default register context (gp = initialGp, sp = stackBase + stackOffset).
 *
 * @return true if the function, entry point and label were all created.
 */
bool SeedEntryPoint(AddressSpace& space, const ExeHeader& header, Diagnostics& diag);

/**
 * Scan for each signature in order and label the first resolved call
 * target as "main".
 *
 * @return Address of main, or std::nullopt (logged, never an error).
 */
std::optional<uint64_t> FindMainFunction(AddressSpace& space, const ExeHeader& header, Diagnostics& diag,
	const std::vector<EntrySignature>& signatures, EntryResult* result = nullptr);

EntryResult LocateEntryPoint(AddressSpace& space, const ExeHeader& header, Diagnostics& diag,
	const EntryLocatorOptions& options = EntryLocatorOptions());

} /* namespace psxexe */
