/*
 * PS-X EXE Address Space Capability
 *
 * Everything the loader core needs from its host, expressed as one abstract
 * class. The Binary Ninja implementation lives in view/psxexe_address_space.h;
 * the unit tests provide an in-memory fake.
 *
 * All mutating calls return false and fill `error` on failure. The core logs
 * the reason and carries on; no call here is allowed to throw.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace psxexe {

enum class SymbolKind
{
	Function,
	Data
};

enum class SectionKind
{
	Code,
	Data
};

class AddressSpace
{
public:
	virtual ~AddressSpace() = default;

	// Polled before every region, register batch and scan window
	virtual bool IsCancelled() const { return false; }

	/**
	 * Create a named region.
	 *
	 * @param fileOffset  Offset of the backing bytes in the input file.
	 * @param fileLength  Number of backed bytes; the rest of the region reads
	 *                    as zero. 0 = fully zero-filled.
	 */
	virtual bool CreateRegion(const std::string& name, uint64_t start, uint64_t size, uint32_t flags,
		uint64_t fileOffset, uint64_t fileLength, std::string& error) = 0;

	/**
	 * Create a view of an existing region at another address. The new range
	 * shares the base region's contents and copies its flags.
	 *
	 * @param baseStart  Start address of the already-created base region.
	 */
	virtual bool CreateMirror(const std::string& name, uint64_t baseStart, uint64_t start, uint64_t size,
		std::string& error) = 0;

	// Optional; hosts without a section concept keep the default
	virtual bool CreateSection(const std::string& name, uint64_t start, uint64_t size, SectionKind kind,
		std::string& error)
	{
		(void)name; (void)start; (void)size; (void)kind; (void)error;
		return true;
	}

	/**
	 * Find the mapped region containing an address.
	 *
	 * @return false when the address is unmapped.
	 */
	virtual bool FindRegion(uint64_t address, uint64_t& start, uint64_t& end) const = 0;

	// Replaces `out` with the bytes read; returns their count (short at region end)
	virtual size_t Read(uint64_t address, size_t length, std::vector<uint8_t>& out) const = 0;

	/**
	 * Disassemble one instruction and report the addresses it references
	 * (branch/call targets first).
	 */
	virtual bool DecodeReferences(uint64_t address, std::vector<uint64_t>& references, std::string& error) = 0;

	virtual bool DefineLabel(uint64_t address, const std::string& name, SymbolKind kind, std::string& error) = 0;

	/**
	 * Define a typed data variable.
	 *
	 * @param width  Element width in bits (8, 16 or 32).
	 * @param count  Element count; > 1 defines an array.
	 */
	virtual bool DefineData(uint64_t address, uint8_t width, uint32_t count, std::string& error) = 0;

	virtual bool CreateFunction(uint64_t address, std::string& error) = 0;
	virtual bool AddEntryPoint(uint64_t address, std::string& error) = 0;

	// Default value of a register at function entry ("gp", "sp")
	virtual bool SetRegisterDefault(const std::string& reg, uint64_t value, std::string& error) = 0;
};

} /* namespace psxexe */
