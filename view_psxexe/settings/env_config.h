/*
 * PS-X EXE Plugin Environment Configuration
 *
 * ============================================================================
 * ENVIRONMENT VARIABLE REFERENCE
 * ============================================================================
 *
 * BN_PSXEXE_DISABLE_PASSES
 *   Purpose: Switch off individual load passes
 *   Values:  Comma/semicolon/space separated list:
 *            - "all"    - everything optional (main search, registers, filler)
 *            - "main"   - skip the main() signature search
 *            - "mmio"   - skip hardware register labels and data
 *            - "filler" - skip reserved filler arrays only
 *   Effect:  Memory map and the start entry point are always created
 *
 * BN_PSXEXE_VERBOSE
 *   Purpose: Force verbose load logging
 *   Values:  Any non-empty value
 *   Effect:  Region table, phase timing and settings summary are logged
 *
 * ============================================================================
 */

#pragma once

#include <string>
#include <vector>

namespace PsxExeEnvConfig
{

constexpr const char* kDisablePasses = "BN_PSXEXE_DISABLE_PASSES";
constexpr const char* kVerbose = "BN_PSXEXE_VERBOSE";

/**
 * Split an environment value on comma, semicolon and whitespace.
 * Empty tokens are skipped.
 */
std::vector<std::string> ParseTokenList(const char* value);

/**
 * Lowercase and map '-' to '_' so "Locate-Main" == "locate_main".
 */
std::string NormalizeToken(std::string token);

bool IsEnvSet(const char* envVar);

// nullptr when unset
const char* GetEnv(const char* envVar);

}
