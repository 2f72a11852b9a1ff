/*
 * PS-X EXE Hardware Register Catalog
 *
 * Static table of the memory-mapped I/O blocks of the PlayStation between
 * 0x1F801000 and 0x1F801DC0. Each block becomes one zero-filled RW- region in
 * the memory map; each register becomes a typed data variable and a label.
 *
 * Registers that repeat (the 24 SPU voices) are described once with a repeat
 * count and stride and expanded to "VOICE_00_LEFT_RIGHT", "VOICE_01_..." etc.
 * Bytes of a block that no register covers are reported as reserved filler so
 * the view shows them as plain unlabelled byte arrays.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace psxexe {

struct MmioRegister
{
	std::string name;
	uint32_t offset;         // from block base
	uint8_t width;           // in bits: 8, 16 or 32
	uint32_t repeatCount;    // 1 = single register
	uint32_t stride;         // distance between repeats, 0 when repeatCount == 1
};

struct MmioBlock
{
	std::string name;
	uint32_t base;
	uint32_t size;
	// Prepended to register labels ("DMA_GPU" + "_" + "MADR"); empty = none
	std::string elementPrefix;
	std::vector<MmioRegister> registers;
};

struct RegisterDefinition
{
	std::string name;        // empty for reserved filler
	uint32_t address;
	uint8_t width;           // element width in bits
	uint32_t count;          // element count, > 1 only for filler arrays
	bool reserved;

	uint32_t ByteSize() const { return (width / 8) * count; }
	bool operator==(const RegisterDefinition& other) const
	{
		return name == other.name && address == other.address && width == other.width &&
			count == other.count && reserved == other.reserved;
	}
};

/**
 * Get the hardware block table in emission order (memory control, I/O ports,
 * interrupt control, DMA, timers, CD-ROM, GPU, MDEC, SPU voices, SPU control).
 */
const std::vector<MmioBlock>& GetMmioCatalog();

/**
 * Find the catalog block covering an address.
 *
 * @return Pointer into the static catalog, or nullptr.
 */
const MmioBlock* FindMmioBlock(uint32_t address);

/**
 * Expand a block into register definitions sorted by address.
 *
 * @param block            Catalog block.
 * @param includeReserved  Also emit filler spans for bytes no register covers.
 *
 * Filler spans never cross a repeated element boundary; inside a repeated
 * bank they are named "<prefix>_<nn>_RSVD_<off>", elsewhere
 * "<block>_RSVD_<off>". The name is informational only (filler gets no label).
 */
std::vector<RegisterDefinition> ExpandMmioBlock(const MmioBlock& block, bool includeReserved = true);

/**
 * Label for the i-th instance of a register.
 */
std::string GetRegisterLabel(const MmioBlock& block, const MmioRegister& reg, uint32_t index);

} /* namespace psxexe */
