#include "test_helpers.h"

#include "loader/memory_map.h"

using namespace psxexe;

namespace
{

const MapEntry* FindEntry(const MemoryMapPlan& plan, const std::string& name)
{
	for (const auto& entry : plan.entries)
	{
		if (entry.name == name)
			return &entry;
	}
	return nullptr;
}

class MemoryMapTest: public ::testing::Test
{
protected:
	ExeBuilder builder;
	RecordingDiagnostics diag;

	std::vector<uint8_t> file;
	std::unique_ptr<FakeAddressSpace> space;

	MemoryMapPlan Plan(const MemoryMapOptions& options = MemoryMapOptions())
	{
		file = builder.Build();
		return BuildMemoryMap(builder.Header(), file.size(), options);
	}

	RealizeStats Realize(const MemoryMapPlan& plan)
	{
		if (!space)
			space = std::make_unique<FakeAddressSpace>(file);
		return RealizeMemoryMap(plan, *space, diag);
	}
};

}

// ============================================================================
// Plan layout
// ============================================================================

TEST_F(MemoryMapTest, SplitsRamAroundCode)
{
	auto plan = Plan();

	const MapEntry* ram = FindEntry(plan, "RAM_B");
	ASSERT_NE(ram, nullptr);
	EXPECT_EQ(ram->start, 0x80000000u);
	EXPECT_EQ(ram->size, 0x10000u);
	EXPECT_EQ(ram->flags, kRegionRWX);

	const MapEntry* code = FindEntry(plan, "CODE_B");
	ASSERT_NE(code, nullptr);
	EXPECT_EQ(code->start, 0x80010000u);
	EXPECT_EQ(code->size, 0x800u);
	EXPECT_EQ(code->flags, kRegionRX);
	EXPECT_EQ(code->section, SectionKind::Code);
	EXPECT_EQ(code->fileOffset, 0x800u);
	EXPECT_EQ(code->fileLength, 0x800u);

	const MapEntry* hi = FindEntry(plan, "RAM_HI_B");
	ASSERT_NE(hi, nullptr);
	EXPECT_EQ(hi->start, 0x80010800u);
	EXPECT_EQ(hi->start + hi->size, 0x80200000u) << "Upper RAM runs to the end of the 2M window";
}

TEST_F(MemoryMapTest, MirrorsUseMaskedAddresses)
{
	auto plan = Plan();
	const MapEntry* base = FindEntry(plan, "CODE_B");
	const MapEntry* low = FindEntry(plan, "CODE_A");
	const MapEntry* uncached = FindEntry(plan, "CODE_C");
	ASSERT_NE(base, nullptr);
	ASSERT_NE(low, nullptr);
	ASSERT_NE(uncached, nullptr);

	EXPECT_EQ(low->kind, MapEntryKind::Mirror);
	EXPECT_EQ(low->start, base->start & kMirrorMask);
	EXPECT_EQ(low->mirrorOf, base->start);
	EXPECT_EQ(low->size, base->size);
	EXPECT_EQ(uncached->start, 0xA0000000u | (base->start & kMirrorMask));
	EXPECT_EQ(uncached->size, base->size);

	EXPECT_EQ(MirrorAddress(kRamBaseUncached, 0x80123456), 0xA0123456u);
	EXPECT_EQ(MirrorAddress(kRamBaseLow, 0x80123456), 0x00123456u);
}

TEST_F(MemoryMapTest, DataAndBssOnlyWhenAddressed)
{
	auto plan = Plan();
	EXPECT_EQ(FindEntry(plan, "DATA"), nullptr);
	EXPECT_EQ(FindEntry(plan, "BSS"), nullptr);

	builder.dataAddress = 0x1F000000;
	builder.dataSize = 0x1000;
	builder.bssAddress = 0x1F100000;
	builder.bssSize = 0x800;
	plan = Plan();

	const MapEntry* data = FindEntry(plan, "DATA");
	const MapEntry* bss = FindEntry(plan, "BSS");
	ASSERT_NE(data, nullptr);
	ASSERT_NE(bss, nullptr);
	EXPECT_EQ(data->start, 0x1F000000u);
	EXPECT_EQ(data->size, 0x1000u);
	EXPECT_EQ(bss->size, 0x800u);
	EXPECT_EQ(bss->flags, kRegionRWX);
}

TEST_F(MemoryMapTest, DataAndBssCarvedOutOfRam)
{
	builder.bssAddress = 0x80010800;
	builder.bssSize = 0x1000;
	builder.dataAddress = 0x80100000;
	builder.dataSize = 0x2000;
	auto plan = Plan();

	const MapEntry* hi = FindEntry(plan, "RAM_HI_B");
	ASSERT_NE(hi, nullptr);
	EXPECT_EQ(hi->start, 0x80011800u) << "Upper RAM starts after BSS";
	EXPECT_EQ(hi->start + hi->size, 0x80100000u) << "Upper RAM stops at DATA";

	const MapEntry* tail = FindEntry(plan, "RAM_HI_2_B");
	ASSERT_NE(tail, nullptr);
	EXPECT_EQ(tail->start, 0x80102000u);
	EXPECT_EQ(tail->start + tail->size, 0x80200000u);
	EXPECT_NE(FindEntry(plan, "RAM_HI_2_A"), nullptr);
	EXPECT_NE(FindEntry(plan, "RAM_HI_2_C"), nullptr);

	const MapEntry* ram = FindEntry(plan, "RAM_B");
	ASSERT_NE(ram, nullptr);
	EXPECT_EQ(ram->size, 0x10000u) << "RAM below the code is untouched";
	EXPECT_EQ(FindEntry(plan, "RAM_2_B"), nullptr);
}

TEST_F(MemoryMapTest, RamHoleFollowsMirrorWindow)
{
	builder.dataAddress = 0x00004000;
	builder.dataSize = 0x1000;
	auto plan = Plan();

	const MapEntry* ram = FindEntry(plan, "RAM_B");
	const MapEntry* rest = FindEntry(plan, "RAM_2_B");
	ASSERT_NE(ram, nullptr);
	ASSERT_NE(rest, nullptr);
	EXPECT_EQ(ram->start + ram->size, 0x80004000u) << "Low RAM data occupies the same physical bytes";
	EXPECT_EQ(rest->start, 0x80005000u);
	EXPECT_EQ(rest->start + rest->size, 0x80010000u);
}

TEST_F(MemoryMapTest, IncludesScratchpadAndHardwareBlocks)
{
	auto plan = Plan();

	const MapEntry* cache = FindEntry(plan, "CACHE");
	ASSERT_NE(cache, nullptr);
	EXPECT_EQ(cache->start, 0x1F800000u);
	EXPECT_EQ(cache->size, 0x400u);
	EXPECT_EQ(cache->flags, kRegionRW);

	for (const auto& block : GetMmioCatalog())
	{
		const MapEntry* entry = FindEntry(plan, block.name);
		ASSERT_NE(entry, nullptr) << block.name;
		EXPECT_EQ(entry->start, block.base);
		EXPECT_EQ(entry->size, block.size);
	}
	EXPECT_EQ(plan.registers.size(), GetMmioCatalog().size());
}

TEST_F(MemoryMapTest, TruncatedFileShortensCodeBacking)
{
	builder.declaredCodeSize = 0x2000;
	auto plan = Plan();
	const MapEntry* code = FindEntry(plan, "CODE_B");
	ASSERT_NE(code, nullptr);
	EXPECT_EQ(code->size, 0x2000u) << "The region keeps the declared size";
	EXPECT_EQ(code->fileLength, 0x800u) << "Only bytes present in the file back the region";
}

TEST_F(MemoryMapTest, UncachedLoadDropsSelfMirror)
{
	builder.loadAddress = 0xA0010000;
	builder.initialPc = 0xA0010000;
	auto plan = Plan();
	ASSERT_NE(FindEntry(plan, "CODE_B"), nullptr);
	EXPECT_NE(FindEntry(plan, "CODE_A"), nullptr);
	EXPECT_EQ(FindEntry(plan, "CODE_C"), nullptr) << "A mirror landing on its own base is dropped";
}

TEST_F(MemoryMapTest, PlanIsDeterministic)
{
	auto first = Plan();
	auto second = Plan();
	ASSERT_EQ(first.entries.size(), second.entries.size());
	for (size_t i = 0; i < first.entries.size(); i++)
		EXPECT_EQ(first.entries[i], second.entries[i]) << "Entry " << i << " differs";
	ASSERT_EQ(first.registers.size(), second.registers.size());
	for (size_t i = 0; i < first.registers.size(); i++)
		EXPECT_EQ(first.registers[i].definitions, second.registers[i].definitions);
}

TEST_F(MemoryMapTest, OptionsControlRegistersAndSections)
{
	MemoryMapOptions options;
	options.includeRegisters = false;
	options.createSections = false;
	auto plan = Plan(options);
	EXPECT_TRUE(plan.registers.empty());

	auto stats = Realize(plan);
	EXPECT_EQ(stats.sections, 0u);
	EXPECT_TRUE(space->sections.empty());
	EXPECT_TRUE(space->labels.empty());
	EXPECT_NE(space->FindByName("GPU_REGS"), nullptr) << "Blocks are mapped even without register labels";
}

// ============================================================================
// Realization
// ============================================================================

TEST_F(MemoryMapTest, RealizesEveryEntry)
{
	auto plan = Plan();
	auto stats = Realize(plan);

	EXPECT_EQ(stats.failures, 0u);
	EXPECT_FALSE(stats.cancelled);
	EXPECT_EQ(stats.regions + stats.mirrors, plan.entries.size());
	EXPECT_EQ(stats.sections, stats.regions);
	EXPECT_EQ(space->regions.size(), plan.entries.size());

	EXPECT_EQ(space->LabelAt(0x1F801810), "GPU_REG0");
	EXPECT_EQ(space->LabelAt(0x1F801C00), "VOICE_00_LEFT_RIGHT");
	EXPECT_EQ(space->data[0x1F801C0A].width, 8) << "Reserved filler is typed as bytes";
	EXPECT_EQ(space->LabelAt(0x1F801C0A), "") << "Reserved filler is not labelled";
	EXPECT_GT(stats.reserved, 0u);
}

TEST_F(MemoryMapTest, RealizesDataAndBssInsideRam)
{
	builder.bssAddress = 0x80010800;
	builder.bssSize = 0x1000;
	builder.dataAddress = 0x80100000;
	builder.dataSize = 0x2000;
	auto stats = Realize(Plan());

	EXPECT_EQ(stats.failures, 0u);
	const auto* bss = space->FindByName("BSS");
	const auto* data = space->FindByName("DATA");
	ASSERT_NE(bss, nullptr);
	ASSERT_NE(data, nullptr);
	EXPECT_EQ(bss->start, 0x80010800u);
	EXPECT_EQ(bss->flags, kRegionRWX);
	EXPECT_FALSE(bss->mirror);
	EXPECT_EQ(data->start, 0x80100000u);
	EXPECT_EQ(data->size, 0x2000u);
	EXPECT_EQ(data->flags, kRegionRWX);

	for (const char* name : {"RAM_B", "RAM_A", "RAM_C", "RAM_HI_B", "RAM_HI_A", "RAM_HI_C", "RAM_HI_2_B",
		"RAM_HI_2_A", "RAM_HI_2_C"})
		EXPECT_NE(space->FindByName(name), nullptr) << name;

	const auto* tail = space->FindByName("RAM_HI_2_C");
	ASSERT_NE(tail, nullptr);
	EXPECT_EQ(tail->start, 0xA0102000u);
	EXPECT_EQ(tail->mirrorOf, 0x80102000u);
}

TEST_F(MemoryMapTest, CodeBytesComeFromFile)
{
	builder.PutCode32(0x80010010, 0xDEADBEEF);
	auto plan = Plan();
	Realize(plan);

	std::vector<uint8_t> out;
	ASSERT_EQ(space->Read(0x80010010, 4, out), 4u);
	EXPECT_EQ(ReadLE32(out.data()), 0xDEADBEEFu);
}

TEST_F(MemoryMapTest, MirrorAliasesBase)
{
	auto plan = Plan();
	Realize(plan);

	const auto* mirror = space->FindByName("CODE_C");
	ASSERT_NE(mirror, nullptr);
	EXPECT_TRUE(mirror->mirror);
	EXPECT_EQ(mirror->flags, kRegionRX) << "Mirrors inherit their base's permissions";

	space->Poke32(0xA0010020, 0x12345678);
	std::vector<uint8_t> out;
	ASSERT_EQ(space->Read(0x80010020, 4, out), 4u);
	EXPECT_EQ(ReadLE32(out.data()), 0x12345678u) << "A write through a mirror is visible at the base";
}

TEST_F(MemoryMapTest, FailedRegionDoesNotStopTheMap)
{
	auto plan = Plan();
	space = std::make_unique<FakeAddressSpace>(file);
	space->rejectRegions = {"CODE_B", "GPU_REGS"};
	auto stats = Realize(plan);

	EXPECT_EQ(space->FindByName("CODE_B"), nullptr);
	EXPECT_EQ(space->FindByName("CODE_A"), nullptr) << "Mirrors of a failed base are skipped";
	EXPECT_EQ(space->FindByName("CODE_C"), nullptr);
	EXPECT_NE(space->FindByName("RAM_HI_B"), nullptr) << "Later entries are still created";
	EXPECT_NE(space->FindByName("CACHE"), nullptr);
	EXPECT_EQ(stats.failures, 4u) << "CODE_B, its two mirrors and GPU_REGS";

	EXPECT_EQ(space->LabelAt(0x1F801810), "") << "Registers of a missing block are skipped";
	EXPECT_EQ(space->LabelAt(0x1F801820), "MDEC_REG0");
	EXPECT_TRUE(diag.Contains("GPU_REGS"));
	EXPECT_GT(diag.Count(DiagnosticLevel::Warning), 0u);
}

TEST_F(MemoryMapTest, ZeroSizeEntryIsAFailure)
{
	auto plan = Plan();
	MapEntry empty;
	empty.name = "EMPTY";
	empty.start = 0x1F900000;
	plan.entries.insert(plan.entries.begin(), empty);

	auto stats = Realize(plan);
	EXPECT_EQ(stats.failures, 1u);
	EXPECT_EQ(space->FindByName("EMPTY"), nullptr);
	EXPECT_NE(space->FindByName("RAM_B"), nullptr);
}

TEST_F(MemoryMapTest, CancellationStopsBetweenEntries)
{
	auto plan = Plan();
	space = std::make_unique<FakeAddressSpace>(file);
	space->cancelAfterPolls = 2;
	auto stats = Realize(plan);

	EXPECT_TRUE(stats.cancelled);
	EXPECT_EQ(space->regions.size(), 2u);
	EXPECT_TRUE(space->labels.empty()) << "No registers are defined after cancellation";
}
