#include "test_helpers.h"

#include "loader/psxexe_loader.h"
#include "settings/env_config.h"

using namespace psxexe;

namespace
{

class LoaderTest: public ::testing::Test
{
protected:
	ExeBuilder builder;
	RecordingDiagnostics diag;
	std::vector<uint8_t> file;
	std::unique_ptr<FakeAddressSpace> space;

	LoadReport Load(const LoadOptions& options = LoadOptions())
	{
		file = builder.Build();
		space = std::make_unique<FakeAddressSpace>(file);
		size_t headerLen = std::min<size_t>(file.size(), kHeaderSize);
		return LoadExecutable(file.data(), headerLen, file.size(), *space, diag, options);
	}
};

}

// ============================================================================
// End-to-end load
// ============================================================================

TEST_F(LoaderTest, LoadsCompleteExecutable)
{
	builder.PutMainSignature(0x80010100, 0x80010400);
	auto report = Load();

	ASSERT_TRUE(report.Parsed());
	EXPECT_FALSE(report.cancelled);
	EXPECT_EQ(report.memory.failures, 0u);
	EXPECT_GT(report.memory.registers, 0u);

	EXPECT_NE(space->FindByName("CODE_B"), nullptr);
	EXPECT_NE(space->FindByName("RAM_HI_C"), nullptr);
	EXPECT_EQ(space->LabelAt(0x80010000), kStartSymbol);
	EXPECT_EQ(space->LabelAt(0x80010400), kMainSymbol);
	EXPECT_EQ(space->LabelAt(0x1F801070), "I_STAT");
	ASSERT_TRUE(report.entry.mainAddress.has_value());
	EXPECT_EQ(*report.entry.mainAddress, 0x80010400u);
	EXPECT_TRUE(diag.Contains("North America")) << "The header summary includes the marker";
}

TEST_F(LoaderTest, LoadsDataAndBssInsideRam)
{
	builder.bssAddress = 0x80010800;
	builder.bssSize = 0x1000;
	builder.dataAddress = 0x80100000;
	builder.dataSize = 0x2000;
	auto report = Load();

	ASSERT_TRUE(report.Parsed());
	EXPECT_EQ(report.memory.failures, 0u);
	EXPECT_NE(space->FindByName("BSS"), nullptr);
	EXPECT_NE(space->FindByName("DATA"), nullptr);
	EXPECT_FALSE(diag.Contains("overlaps"));
}

TEST_F(LoaderTest, RejectsBadMagic)
{
	file = builder.Build();
	file[0] = 'X';
	space = std::make_unique<FakeAddressSpace>(file);
	auto report = LoadExecutable(file.data(), kHeaderSize, file.size(), *space, diag);

	EXPECT_FALSE(report.Parsed());
	EXPECT_TRUE(space->regions.empty()) << "Nothing is mapped for a rejected file";
	EXPECT_EQ(diag.Count(DiagnosticLevel::Error), 1u);
}

TEST_F(LoaderTest, ShortFileWarnsAndLoads)
{
	builder.declaredCodeSize = 0x4000;
	auto report = Load();

	ASSERT_TRUE(report.Parsed());
	EXPECT_TRUE(diag.Contains("header declares 0x4000"));
	const auto* code = space->FindByName("CODE_B");
	ASSERT_NE(code, nullptr);
	EXPECT_EQ(code->size, 0x4000u);
}

TEST_F(LoaderTest, OptionsSkipPasses)
{
	builder.PutMainSignature(0x80010100, 0x80010400);
	LoadOptions options;
	options.locateMain = false;
	options.defineRegisters = false;
	options.defineReserved = false;
	auto report = Load(options);

	ASSERT_TRUE(report.Parsed());
	EXPECT_FALSE(report.entry.mainAddress.has_value());
	EXPECT_EQ(space->LabelAt(0x1F801070), "");
	EXPECT_TRUE(space->data.empty());
	EXPECT_EQ(space->LabelAt(0x80010000), kStartSymbol) << "The entry point is always seeded";
}

TEST_F(LoaderTest, VerboseLogsMapTable)
{
	LoadOptions options;
	options.verbose = true;
	Load(options);
	EXPECT_TRUE(diag.Contains("mirror of 0x80010000"));
	EXPECT_TRUE(diag.Contains("Memory map took"));
}

TEST_F(LoaderTest, CancelledLoadSkipsEntryLocation)
{
	file = builder.Build();
	space = std::make_unique<FakeAddressSpace>(file);
	space->cancelAfterPolls = 3;
	auto report = LoadExecutable(file.data(), kHeaderSize, file.size(), *space, diag);

	EXPECT_TRUE(report.cancelled);
	EXPECT_TRUE(space->entryPoints.empty());
}

// ============================================================================
// Disabled passes
// ============================================================================

TEST(LoadPassTests, DisableIndividualPasses)
{
	LoadOptions options;
	EXPECT_TRUE(DisableLoadPass(options, "main"));
	EXPECT_FALSE(options.locateMain);
	EXPECT_TRUE(options.defineRegisters);

	options = LoadOptions();
	EXPECT_TRUE(DisableLoadPass(options, "filler"));
	EXPECT_FALSE(options.defineReserved);
	EXPECT_TRUE(options.defineRegisters);

	options = LoadOptions();
	EXPECT_TRUE(DisableLoadPass(options, "hardware_registers"));
	EXPECT_FALSE(options.defineRegisters);
	EXPECT_FALSE(options.defineReserved) << "Filler needs the register pass";
}

TEST(LoadPassTests, DisableAll)
{
	LoadOptions options;
	EXPECT_TRUE(DisableLoadPass(options, "all"));
	EXPECT_FALSE(options.locateMain);
	EXPECT_FALSE(options.defineRegisters);
	EXPECT_FALSE(options.defineReserved);
	EXPECT_TRUE(options.seedEntryPoint);
}

TEST(LoadPassTests, UnknownTokenWarns)
{
	LoadOptions options;
	RecordingDiagnostics diag;
	EXPECT_FALSE(DisableLoadPass(options, "segments"));

	ApplyDisabledPasses(options, "Locate-Main, bogus", diag);
	EXPECT_FALSE(options.locateMain) << "Tokens are normalized before matching";
	EXPECT_TRUE(options.defineRegisters);
	EXPECT_EQ(diag.Count(DiagnosticLevel::Warning), 1u);
	EXPECT_TRUE(diag.Contains("bogus"));
}

TEST(LoadPassTests, EmptyValueChangesNothing)
{
	LoadOptions options;
	RecordingDiagnostics diag;
	ApplyDisabledPasses(options, nullptr, diag);
	ApplyDisabledPasses(options, "", diag);
	ApplyDisabledPasses(options, " ,; ", diag);
	EXPECT_TRUE(options.locateMain);
	EXPECT_TRUE(options.defineRegisters);
	EXPECT_TRUE(diag.entries.empty());
}

// ============================================================================
// Environment token parsing
// ============================================================================

TEST(EnvConfigTests, SplitsOnDelimiters)
{
	auto tokens = PsxExeEnvConfig::ParseTokenList("main, filler;mmio\tall\n");
	ASSERT_EQ(tokens.size(), 4u);
	EXPECT_EQ(tokens[0], "main");
	EXPECT_EQ(tokens[1], "filler");
	EXPECT_EQ(tokens[2], "mmio");
	EXPECT_EQ(tokens[3], "all");
	EXPECT_TRUE(PsxExeEnvConfig::ParseTokenList(nullptr).empty());
}

TEST(EnvConfigTests, NormalizesTokens)
{
	EXPECT_EQ(PsxExeEnvConfig::NormalizeToken("Hardware-Registers"), "hardware_registers");
	EXPECT_EQ(PsxExeEnvConfig::NormalizeToken("MAIN"), "main");
}

TEST(EnvConfigTests, UnsetVariable)
{
	EXPECT_EQ(PsxExeEnvConfig::GetEnv("BN_PSXEXE_TEST_SURELY_UNSET"), nullptr);
	EXPECT_FALSE(PsxExeEnvConfig::IsEnvSet("BN_PSXEXE_TEST_SURELY_UNSET"));
	EXPECT_EQ(PsxExeEnvConfig::GetEnv(nullptr), nullptr);
}
