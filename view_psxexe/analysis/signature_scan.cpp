/*
 * Masked Signature Scan - Implementation
 */

#include "signature_scan.h"

#include <algorithm>
#include <cstring>

namespace psxexe {

static constexpr size_t kScanWindow = 0x1000;

const std::vector<EntrySignature>& GetEntrySignatures()
{
	static const std::vector<EntrySignature> signatures = {
		{
			"sdk_start_main_call",
			{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x4D, 0x00, 0x00, 0x00},
			{0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF},
			4,
		},
	};
	return signatures;
}

bool MaskedCompare(const uint8_t* pattern, const uint8_t* mask, size_t length, const uint8_t* mem)
{
	if (!mask)
		return memcmp(mem, pattern, length) == 0;

	for (size_t i = 0; i < length; i++)
	{
		if ((mem[i] & mask[i]) != (pattern[i] & mask[i]))
			return false;
	}
	return true;
}

std::optional<size_t> FindMaskedPattern(const uint8_t* data, size_t length, const uint8_t* pattern,
	const uint8_t* mask, size_t patternLength)
{
	if (!data || !pattern || patternLength == 0 || length < patternLength)
		return std::nullopt;

	for (size_t offset = 0; offset + patternLength <= length; offset++)
	{
		if (MaskedCompare(pattern, mask, patternLength, data + offset))
			return offset;
	}
	return std::nullopt;
}

std::optional<uint64_t> ScanForSignature(const AddressSpace& space, uint64_t start, uint64_t end,
	const EntrySignature& signature)
{
	if (!signature.IsValid() || end <= start)
		return std::nullopt;

	const size_t patternLength = signature.pattern.size();
	std::vector<uint8_t> window;
	uint64_t address = start;
	while (address < end && end - address >= patternLength)
	{
		if (space.IsCancelled())
			return std::nullopt;

		size_t want = static_cast<size_t>(std::min<uint64_t>(kScanWindow + patternLength - 1, end - address));
		window.clear();
		size_t got = space.Read(address, want, window);
		if (got < patternLength)
			return std::nullopt;

		auto hit = FindMaskedPattern(window.data(), got, signature.pattern.data(), signature.mask.data(),
			patternLength);
		if (hit)
			return address + *hit;

		// Short read means the mapped range ended early
		if (got < want)
			return std::nullopt;
		address += got - (patternLength - 1);
	}
	return std::nullopt;
}

} /* namespace psxexe */
