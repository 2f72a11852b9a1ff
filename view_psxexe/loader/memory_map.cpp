/*
 * PS-X EXE Memory Map Builder - Implementation
 */

#include "memory_map.h"
#include "common/psxexe_utils.h"

#include <algorithm>
#include <set>
#include <string>

namespace psxexe {

bool MapEntry::operator==(const MapEntry& other) const
{
	return kind == other.kind && name == other.name && start == other.start && size == other.size &&
		flags == other.flags && mirrorOf == other.mirrorOf && fileOffset == other.fileOffset &&
		fileLength == other.fileLength && section == other.section;
}

// ============================================================================
// Plan construction
// ============================================================================

static MapEntry MakeRegion(const std::string& name, uint64_t start, uint64_t size, uint32_t flags,
	SectionKind section = SectionKind::Data)
{
	MapEntry e;
	e.kind = MapEntryKind::Region;
	e.name = name;
	e.start = start;
	e.size = size;
	e.flags = flags;
	e.section = section;
	return e;
}

static MapEntry MakeMirror(const std::string& name, uint64_t baseStart, uint64_t start, uint64_t size)
{
	MapEntry e;
	e.kind = MapEntryKind::Mirror;
	e.name = name;
	e.start = start;
	e.size = size;
	e.mirrorOf = baseStart;
	return e;
}

/*
 * Emit a RAM piece and its two mirrors. `stem` is "RAM", "CODE" or "RAM_HI";
 * the suffix names the segment (_B cached, _A low, _C uncached). A mirror that
 * would land on the base itself (code linked into KUSEG) is dropped.
 */
static void AddMirroredPiece(std::vector<MapEntry>& entries, const MapEntry& base, const std::string& stem)
{
	if (base.size == 0)
		return;

	entries.push_back(base);

	uint32_t start = static_cast<uint32_t>(base.start);
	uint32_t low = MirrorAddress(kRamBaseLow, start);
	uint32_t uncached = MirrorAddress(kRamBaseUncached, start);
	if (low != base.start)
		entries.push_back(MakeMirror(stem + "_A", base.start, low, base.size));
	if (uncached != base.start)
		entries.push_back(MakeMirror(stem + "_C", base.start, uncached, base.size));
}

static uint64_t Clamp(uint64_t value, uint64_t low, uint64_t high)
{
	return std::min(std::max(value, low), high);
}

struct RamHole
{
	uint64_t start;
	uint64_t end;
};

/*
 * Translate a DATA/BSS range into the cached RAM window. Ranges linked into
 * KUSEG or KSEG1 RAM land on the same physical bytes, so they punch the same
 * hole. Ranges outside RAM produce nothing.
 */
static bool ToRamHole(uint64_t address, uint64_t size, RamHole& hole)
{
	if (size == 0)
		return false;

	for (uint64_t base : {uint64_t(kRamBaseLow), uint64_t(kRamBaseCached), uint64_t(kRamBaseUncached)})
	{
		if (address < base || address >= base + kRamSize)
			continue;
		hole.start = kRamBaseCached + (address - base);
		hole.end = std::min<uint64_t>(hole.start + size, kRamBaseCached + kRamSize);
		return true;
	}
	return false;
}

/*
 * Emit [start, end) minus `holes` as mirrored RAM pieces. The first piece keeps
 * `stem`; later ones are numbered from 2 so every segment name stays unique.
 */
static void AddRamPieces(std::vector<MapEntry>& entries, const std::string& stem, uint64_t start, uint64_t end,
	const std::vector<RamHole>& holes)
{
	size_t index = 0;
	uint64_t cursor = start;
	auto emit = [&](uint64_t pieceStart, uint64_t pieceEnd) {
		if (pieceEnd <= pieceStart)
			return;
		std::string name = (index == 0) ? stem : stem + "_" + std::to_string(index + 1);
		index++;
		AddMirroredPiece(entries, MakeRegion(name + "_B", pieceStart, pieceEnd - pieceStart, kRegionRWX), name);
	};

	// holes are sorted by start and may overlap each other
	for (const auto& hole : holes)
	{
		if (hole.end <= cursor || hole.start >= end)
			continue;
		emit(cursor, std::min(hole.start, end));
		cursor = std::max(cursor, hole.end);
		if (cursor >= end)
			return;
	}
	emit(cursor, end);
}

MemoryMapPlan BuildMemoryMap(const ExeHeader& header, uint64_t fileLength, const MemoryMapOptions& options)
{
	MemoryMapPlan plan;

	const uint64_t ramStart = kRamBaseCached;
	const uint64_t ramEnd = ramStart + kRamSize;
	const uint64_t codeStart = header.loadAddress;
	const uint64_t codeEnd = codeStart + header.codeSize;

	// RAM around the code region, clamped to the 2M window
	uint64_t preEnd = Clamp(codeStart, ramStart, ramEnd);
	uint64_t postStart = Clamp(codeEnd, ramStart, ramEnd);
	if (header.codeSize == 0)
		postStart = preEnd;
	if (postStart < preEnd)
		postStart = preEnd;

	// DATA and BSS inside RAM replace the RAM bytes they cover
	std::vector<RamHole> holes;
	RamHole hole;
	if (header.HasData() && ToRamHole(header.dataAddress, header.dataSize, hole))
		holes.push_back(hole);
	if (header.HasBss() && ToRamHole(header.bssAddress, header.bssSize, hole))
		holes.push_back(hole);
	std::sort(holes.begin(), holes.end(), [](const RamHole& a, const RamHole& b) { return a.start < b.start; });

	AddRamPieces(plan.entries, "RAM", ramStart, preEnd, holes);

	if (header.codeSize != 0)
	{
		MapEntry code = MakeRegion("CODE_B", codeStart, header.codeSize, kRegionRX, SectionKind::Code);
		uint64_t available = (fileLength > header.CodeFileOffset()) ? fileLength - header.CodeFileOffset() : 0;
		code.fileOffset = header.CodeFileOffset();
		code.fileLength = std::min<uint64_t>(header.codeSize, available);
		AddMirroredPiece(plan.entries, code, "CODE");
	}

	AddRamPieces(plan.entries, "RAM_HI", postStart, ramEnd, holes);

	if (header.HasData())
		plan.entries.push_back(MakeRegion("DATA", header.dataAddress, header.dataSize, kRegionRWX));
	if (header.HasBss())
		plan.entries.push_back(MakeRegion("BSS", header.bssAddress, header.bssSize, kRegionRWX));

	plan.entries.push_back(MakeRegion("CACHE", kScratchpadBase, kScratchpadSize, kRegionRW));
	plan.entries.push_back(MakeRegion("UNK1", kUnknownBase, kUnknownSize, kRegionRW));

	for (const auto& block : GetMmioCatalog())
		plan.entries.push_back(MakeRegion(block.name, block.base, block.size, kRegionRW));

	plan.createSections = options.createSections;
	if (options.includeRegisters)
		plan.registers = BuildRegisterBatches(options.includeReserved);

	return plan;
}

std::vector<RegisterBatch> BuildRegisterBatches(bool includeReserved)
{
	std::vector<RegisterBatch> batches;
	for (const auto& block : GetMmioCatalog())
	{
		RegisterBatch batch;
		batch.blockName = block.name;
		batch.blockStart = block.base;
		batch.definitions = ExpandMmioBlock(block, includeReserved);
		batches.push_back(std::move(batch));
	}
	return batches;
}

// ============================================================================
// Realization
// ============================================================================

static bool RealizeEntry(const MapEntry& entry, AddressSpace& space, Diagnostics& diag, RealizeStats& stats,
	bool createSections)
{
	std::string error;

	if (entry.size == 0)
	{
		diag.LogWarn("Skipping %s at 0x%08llx: zero size", entry.name.c_str(), (unsigned long long)entry.start);
		stats.failures++;
		return false;
	}

	if (entry.kind == MapEntryKind::Mirror)
	{
		if (!space.CreateMirror(entry.name, entry.mirrorOf, entry.start, entry.size, error))
		{
			diag.LogWarn("Failed to mirror 0x%08llx at %s 0x%08llx-0x%08llx: %s",
				(unsigned long long)entry.mirrorOf, entry.name.c_str(), (unsigned long long)entry.start,
				(unsigned long long)(entry.start + entry.size), error.c_str());
			stats.failures++;
			return false;
		}
		stats.mirrors++;
		return true;
	}

	if (!space.CreateRegion(entry.name, entry.start, entry.size, entry.flags, entry.fileOffset, entry.fileLength,
		error))
	{
		diag.LogWarn("Failed to create %s 0x%08llx-0x%08llx: %s", entry.name.c_str(),
			(unsigned long long)entry.start, (unsigned long long)(entry.start + entry.size), error.c_str());
		stats.failures++;
		return false;
	}
	stats.regions++;

	if (createSections)
	{
		if (space.CreateSection(entry.name, entry.start, entry.size, entry.section, error))
			stats.sections++;
		else
			diag.LogWarn("Failed to create section %s: %s", entry.name.c_str(), error.c_str());
	}
	return true;
}

RealizeStats RealizeMemoryMap(const MemoryMapPlan& plan, AddressSpace& space, Diagnostics& diag)
{
	RealizeStats stats;
	std::set<uint64_t> created;

	for (const auto& entry : plan.entries)
	{
		if (space.IsCancelled())
		{
			diag.LogWarn("Memory map cancelled after %zu regions", stats.regions + stats.mirrors);
			stats.cancelled = true;
			return stats;
		}

		if (entry.kind == MapEntryKind::Mirror && created.count(entry.mirrorOf) == 0)
		{
			diag.LogWarn("Skipping mirror %s: base 0x%08llx was not created", entry.name.c_str(),
				(unsigned long long)entry.mirrorOf);
			stats.failures++;
			continue;
		}

		if (RealizeEntry(entry, space, diag, stats, plan.createSections) && entry.kind == MapEntryKind::Region)
			created.insert(entry.start);
	}

	// Register blocks whose region failed have nowhere to live
	std::vector<RegisterBatch> batches;
	for (const auto& batch : plan.registers)
	{
		if (created.count(batch.blockStart) == 0)
		{
			diag.LogWarn("Skipping registers of %s: region missing", batch.blockName.c_str());
			continue;
		}
		batches.push_back(batch);
	}
	RealizeRegisters(batches, space, diag, stats);
	return stats;
}

void RealizeRegisters(const std::vector<RegisterBatch>& batches, AddressSpace& space, Diagnostics& diag,
	RealizeStats& stats)
{
	for (const auto& batch : batches)
	{
		if (space.IsCancelled())
		{
			diag.LogWarn("Register definition cancelled at %s", batch.blockName.c_str());
			stats.cancelled = true;
			return;
		}

		for (const auto& def : batch.definitions)
		{
			std::string error;
			if (!space.DefineData(def.address, def.width, def.count, error))
			{
				diag.LogWarn("Failed to define %s at 0x%08x: %s", def.name.c_str(), def.address, error.c_str());
				stats.failures++;
				continue;
			}

			if (def.reserved)
			{
				stats.reserved++;
				continue;
			}

			if (!space.DefineLabel(def.address, def.name, SymbolKind::Data, error))
			{
				diag.LogWarn("Failed to label %s at 0x%08x: %s", def.name.c_str(), def.address, error.c_str());
				stats.failures++;
				continue;
			}
			stats.registers++;
		}
	}
}

void LogMemoryMapSummary(const MemoryMapPlan& plan, const RealizeStats& stats, Diagnostics& diag, bool verbose)
{
	diag.LogInfo("Memory map: %zu regions, %zu mirrors, %zu registers (%zu reserved spans), %zu failures%s",
		stats.regions, stats.mirrors, stats.registers, stats.reserved, stats.failures,
		stats.cancelled ? " (cancelled)" : "");

	if (!verbose)
		return;

	for (const auto& entry : plan.entries)
	{
		if (entry.kind == MapEntryKind::Mirror)
		{
			diag.LogInfo("  %-14s 0x%08llx-0x%08llx %6s  mirror of 0x%08llx", entry.name.c_str(),
				(unsigned long long)entry.start, (unsigned long long)(entry.start + entry.size),
				FormatSize(entry.size).c_str(), (unsigned long long)entry.mirrorOf);
		}
		else if (entry.fileLength != 0)
		{
			diag.LogInfo("  %-14s 0x%08llx-0x%08llx %6s  %s  file@0x%llx+0x%llx", entry.name.c_str(),
				(unsigned long long)entry.start, (unsigned long long)(entry.start + entry.size),
				FormatSize(entry.size).c_str(), FormatRegionFlags(entry.flags).c_str(),
				(unsigned long long)entry.fileOffset, (unsigned long long)entry.fileLength);
		}
		else
		{
			diag.LogInfo("  %-14s 0x%08llx-0x%08llx %6s  %s", entry.name.c_str(),
				(unsigned long long)entry.start, (unsigned long long)(entry.start + entry.size),
				FormatSize(entry.size).c_str(), FormatRegionFlags(entry.flags).c_str());
		}
	}
}

} /* namespace psxexe */
