/*
 * Masked Signature Scan
 *
 * Byte patterns with a per-byte mask (0xFF = must match, 0x00 = wildcard),
 * searched either in a buffer or across a mapped address range.
 */

#pragma once

#include "loader/address_space.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace psxexe {

struct EntrySignature
{
	std::string name;
	std::vector<uint8_t> pattern;
	std::vector<uint8_t> mask;     // same length as pattern
	uint32_t callOffset = 0;       // call instruction position relative to the match

	bool IsValid() const { return !pattern.empty() && pattern.size() == mask.size(); }
};

/**
 * Get the built-in signature table.
 *
 * The single default entry matches the SDK startup stub tail: three zero
 * words, an arbitrary word, then a word holding 0x4D. The instruction that
 * follows the match (+4) is the call into main.
 */
const std::vector<EntrySignature>& GetEntrySignatures();

/**
 * Compare `length` bytes of `mem` against a masked pattern.
 */
[[nodiscard]] bool MaskedCompare(const uint8_t* pattern, const uint8_t* mask, size_t length, const uint8_t* mem);

/**
 * First offset in `data` where the masked pattern matches.
 */
[[nodiscard]] std::optional<size_t> FindMaskedPattern(const uint8_t* data, size_t length,
	const uint8_t* pattern, const uint8_t* mask, size_t patternLength);

/**
 * Scan [start, end) of an address space for the first match of a signature.
 *
 * Reads in 4K windows overlapping by the pattern length so matches spanning
 * a window boundary are found. IsCancelled() is polled before every window;
 * a cancelled scan reports no match.
 *
 * @return Address of the first matching byte.
 */
[[nodiscard]] std::optional<uint64_t> ScanForSignature(const AddressSpace& space, uint64_t start, uint64_t end,
	const EntrySignature& signature);

} /* namespace psxexe */
