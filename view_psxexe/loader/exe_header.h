/*
 * PS-X EXE Header
 *
 * Fixed-layout header found at offset 0 of every PlayStation executable.
 * The header is always padded to 0x800 bytes (one CD-ROM sector); the code
 * image follows immediately after it.
 *
 *   0x00  "PS-X EXE"            8 bytes
 *   0x08  reserved              8 bytes
 *   0x10  initial PC
 *   0x14  initial GP
 *   0x18  load address (code)
 *   0x1C  code size
 *   0x20  data address / 0x24 data size
 *   0x28  bss address  / 0x2C bss size
 *   0x30  stack base   / 0x34 stack offset
 *   0x38  reserved, marker text at 0x4C ("Sony Computer Entertainment Inc. ...")
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace psxexe {

constexpr uint32_t kHeaderSize = 0x800;
constexpr size_t kExeMagicLength = 8;
constexpr char kExeMagic[kExeMagicLength + 1] = "PS-X EXE";

namespace HeaderOffsets
{
	constexpr size_t kMagic = 0x00;
	constexpr size_t kInitialPc = 0x10;
	constexpr size_t kInitialGp = 0x14;
	constexpr size_t kLoadAddress = 0x18;
	constexpr size_t kCodeSize = 0x1C;
	constexpr size_t kDataAddress = 0x20;
	constexpr size_t kDataSize = 0x24;
	constexpr size_t kBssAddress = 0x28;
	constexpr size_t kBssSize = 0x2C;
	constexpr size_t kStackBase = 0x30;
	constexpr size_t kStackOffset = 0x34;
	// First byte past the numeric field block
	constexpr size_t kFieldsEnd = 0x38;
	constexpr size_t kMarker = 0x4C;
}

enum class MarkerRegion
{
	Unknown,
	NorthAmerica,
	Japan,
	Europe
};

/**
 * Decoded executable header. Immutable once parsed; passed by value or const
 * reference into the memory map builder and the entry locator.
 */
struct ExeHeader
{
	uint32_t initialPc = 0;
	uint32_t initialGp = 0;
	uint32_t loadAddress = 0;
	uint32_t codeSize = 0;
	uint32_t dataAddress = 0;   // 0 = no data section
	uint32_t dataSize = 0;
	uint32_t bssAddress = 0;    // 0 = no bss section
	uint32_t bssSize = 0;
	uint32_t stackBase = 0;
	uint32_t stackOffset = 0;
	std::string marker;

	uint32_t StackPointer() const { return stackBase + stackOffset; }
	uint64_t CodeFileOffset() const { return kHeaderSize; }
	bool HasData() const { return dataAddress != 0; }
	bool HasBss() const { return bssAddress != 0; }
};

/**
 * Check the 8-byte magic at offset 0. Nothing else in the header is
 * validated.
 */
[[nodiscard]] bool HasExeMagic(const uint8_t* data, size_t length);

/**
 * Check the magic and that the numeric field block is present.
 *
 * Accepts exactly the inputs ParseExeHeader accepts, so a file offered as a
 * PS-X EXE view can always be opened.
 */
[[nodiscard]] bool IsExeCandidate(const uint8_t* data, size_t length);

/**
 * Decode the header.
 *
 * Returns std::nullopt when the magic does not match (no other field is read)
 * or when the input is too short to hold the numeric field block. Zero or
 * out-of-range addresses are legal and handled downstream.
 *
 * @param data    Start of the file.
 * @param length  Number of bytes available (need not cover the full 0x800).
 */
[[nodiscard]] std::optional<ExeHeader> ParseExeHeader(const uint8_t* data, size_t length);

/**
 * Classify the licence marker text ("... for North America area").
 */
MarkerRegion GetMarkerRegion(const std::string& marker);
const char* GetMarkerRegionName(MarkerRegion region);

} /* namespace psxexe */
