#include "test_helpers.h"

#include "analysis/signature_scan.h"

using namespace psxexe;

namespace
{

constexpr uint64_t kBase = 0x80010000;

// One region at kBase backed by `bytes`
std::unique_ptr<FakeAddressSpace> MakeSpace(const std::vector<uint8_t>& bytes)
{
	auto space = std::make_unique<FakeAddressSpace>(bytes);
	std::string error;
	EXPECT_TRUE(space->CreateRegion("CODE_B", kBase, bytes.size(), kRegionRX, 0, bytes.size(), error)) << error;
	return space;
}

void PutStub(std::vector<uint8_t>& bytes, size_t offset, uint32_t call)
{
	PutLE32(bytes, offset + 0, 0);
	PutLE32(bytes, offset + 4, call);
	PutLE32(bytes, offset + 8, 0);
	PutLE32(bytes, offset + 12, 0x4D);
}

}

// ============================================================================
// Masked comparison
// ============================================================================

TEST(SignatureScanTests, MaskedCompareIgnoresMaskedBytes)
{
	const uint8_t pattern[] = {0x12, 0x00, 0x34};
	const uint8_t mask[] = {0xFF, 0x00, 0xFF};
	const uint8_t hit[] = {0x12, 0xAB, 0x34};
	const uint8_t miss[] = {0x12, 0xAB, 0x35};

	EXPECT_TRUE(MaskedCompare(pattern, mask, 3, hit));
	EXPECT_FALSE(MaskedCompare(pattern, mask, 3, miss));
	EXPECT_FALSE(MaskedCompare(pattern, nullptr, 3, hit)) << "No mask means exact comparison";
}

TEST(SignatureScanTests, FindMaskedPatternReturnsFirstHit)
{
	const uint8_t data[] = {0x00, 0x12, 0x01, 0x34, 0x12, 0x02, 0x34};
	const uint8_t pattern[] = {0x12, 0x00, 0x34};
	const uint8_t mask[] = {0xFF, 0x00, 0xFF};

	auto hit = FindMaskedPattern(data, sizeof(data), pattern, mask, sizeof(pattern));
	ASSERT_TRUE(hit.has_value());
	EXPECT_EQ(*hit, 1u);

	EXPECT_FALSE(FindMaskedPattern(data, 2, pattern, mask, sizeof(pattern)).has_value())
		<< "Data shorter than the pattern cannot match";
	EXPECT_FALSE(FindMaskedPattern(data, sizeof(data), pattern, mask, 0).has_value());
}

// ============================================================================
// Built-in signature
// ============================================================================

TEST(SignatureScanTests, StartupSignatureShape)
{
	const auto& signatures = GetEntrySignatures();
	ASSERT_EQ(signatures.size(), 1u);

	const EntrySignature& sig = signatures.front();
	EXPECT_TRUE(sig.IsValid());
	EXPECT_EQ(sig.pattern.size(), 16u);
	EXPECT_EQ(sig.callOffset, 4u);
	EXPECT_EQ(sig.pattern[12], 0x4D);
	for (size_t i = 4; i < 8; i++)
		EXPECT_EQ(sig.mask[i], 0x00) << "The call word is a wildcard at byte " << i;
}

TEST(SignatureScanTests, MatchesAnyCallTarget)
{
	const EntrySignature& sig = GetEntrySignatures().front();
	std::vector<uint8_t> stub(16, 0);
	PutStub(stub, 0, EncodeJal(0x80012340));
	EXPECT_TRUE(MaskedCompare(sig.pattern.data(), sig.mask.data(), 16, stub.data()));

	PutStub(stub, 0, EncodeJal(0x80099990));
	EXPECT_TRUE(MaskedCompare(sig.pattern.data(), sig.mask.data(), 16, stub.data()));

	PutLE32(stub, 8, 0x24020001);
	EXPECT_FALSE(MaskedCompare(sig.pattern.data(), sig.mask.data(), 16, stub.data()))
		<< "The delay slot after the call must be a nop";
}

// ============================================================================
// Address space scan
// ============================================================================

TEST(SignatureScanTests, ScansMappedRange)
{
	std::vector<uint8_t> bytes(0x400, 0xFF);
	PutStub(bytes, 0x120, EncodeJal(0x80010200));
	auto space = MakeSpace(bytes);

	auto match = ScanForSignature(*space, kBase, kBase + bytes.size(), GetEntrySignatures().front());
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(*match, kBase + 0x120);
}

TEST(SignatureScanTests, FindsMatchAcrossWindowBoundary)
{
	std::vector<uint8_t> bytes(0x3000, 0xFF);
	PutStub(bytes, 0xFF8, EncodeJal(0x80010200));
	auto space = MakeSpace(bytes);

	auto match = ScanForSignature(*space, kBase, kBase + bytes.size(), GetEntrySignatures().front());
	ASSERT_TRUE(match.has_value()) << "A stub straddling a read window must still be found";
	EXPECT_EQ(*match, kBase + 0xFF8);
}

TEST(SignatureScanTests, RespectsScanStart)
{
	std::vector<uint8_t> bytes(0x400, 0xFF);
	PutStub(bytes, 0x40, EncodeJal(0x80010200));
	PutStub(bytes, 0x300, EncodeJal(0x80010300));
	auto space = MakeSpace(bytes);

	auto match = ScanForSignature(*space, kBase + 0x100, kBase + bytes.size(), GetEntrySignatures().front());
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(*match, kBase + 0x300) << "Bytes before the start address are not searched";
}

TEST(SignatureScanTests, NoMatchInRange)
{
	std::vector<uint8_t> bytes(0x2000, 0x00);
	auto space = MakeSpace(bytes);

	EXPECT_FALSE(ScanForSignature(*space, kBase, kBase + bytes.size(), GetEntrySignatures().front()).has_value());
	EXPECT_FALSE(ScanForSignature(*space, kBase + 8, kBase + 8, GetEntrySignatures().front()).has_value())
		<< "An empty range never matches";
	EXPECT_FALSE(ScanForSignature(*space, 0x90000000, 0x90001000, GetEntrySignatures().front()).has_value())
		<< "Unmapped ranges never match";
}

TEST(SignatureScanTests, StopsWhenCancelled)
{
	std::vector<uint8_t> bytes(0x3000, 0xFF);
	PutStub(bytes, 0x2800, EncodeJal(0x80010200));
	auto space = MakeSpace(bytes);
	space->cancelAfterPolls = 1;

	EXPECT_FALSE(ScanForSignature(*space, kBase, kBase + bytes.size(), GetEntrySignatures().front()).has_value())
		<< "The stub lies past the first window, which is the only one read before cancellation";
}
