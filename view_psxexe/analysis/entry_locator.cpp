/*
 * PS-X EXE Entry Point Locator - Implementation
 */

#include "entry_locator.h"

namespace psxexe {

bool SeedEntryPoint(AddressSpace& space, const ExeHeader& header, Diagnostics& diag)
{
	const uint64_t pc = header.initialPc;
	bool ok = true;
	std::string error;

	if (!space.CreateFunction(pc, error))
	{
		diag.LogWarn("Failed to create start function at 0x%08llx: %s", (unsigned long long)pc, error.c_str());
		ok = false;
	}
	if (!space.AddEntryPoint(pc, error))
	{
		diag.LogWarn("Failed to add entry point at 0x%08llx: %s", (unsigned long long)pc, error.c_str());
		ok = false;
	}
	if (!space.DefineLabel(pc, kStartSymbol, SymbolKind::Function, error))
	{
		diag.LogWarn("Failed to label start at 0x%08llx: %s", (unsigned long long)pc, error.c_str());
		ok = false;
	}

	// Register defaults are set even when the entry point failed
	if (!space.SetRegisterDefault("gp", header.initialGp, error))
		diag.LogWarn("Failed to set default gp=0x%08x: %s", header.initialGp, error.c_str());
	if (!space.SetRegisterDefault("sp", header.StackPointer(), error))
		diag.LogWarn("Failed to set default sp=0x%08x: %s", header.StackPointer(), error.c_str());

	diag.LogDebug("Entry 0x%08x gp=0x%08x sp=0x%08x", header.initialPc, header.initialGp, header.StackPointer());
	return ok;
}

std::optional<uint64_t> FindMainFunction(AddressSpace& space, const ExeHeader& header, Diagnostics& diag,
	const std::vector<EntrySignature>& signatures, EntryResult* result)
{
	uint64_t regionStart = 0;
	uint64_t regionEnd = 0;
	if (!space.FindRegion(header.initialPc, regionStart, regionEnd))
	{
		diag.LogInfo("Entry 0x%08x is not mapped, skipping main search", header.initialPc);
		return std::nullopt;
	}

	for (const auto& signature : signatures)
	{
		if (!signature.IsValid())
		{
			diag.LogWarn("Ignoring malformed signature %s", signature.name.c_str());
			continue;
		}

		auto match = ScanForSignature(space, header.initialPc, regionEnd, signature);
		if (!match)
		{
			if (space.IsCancelled())
				return std::nullopt;
			diag.LogDebug("Signature %s not found in 0x%08x-0x%08llx", signature.name.c_str(), header.initialPc,
				(unsigned long long)regionEnd);
			continue;
		}

		const uint64_t call = *match + signature.callOffset;
		std::vector<uint64_t> references;
		std::string error;
		if (!space.DecodeReferences(call, references, error))
		{
			diag.LogInfo("Signature %s matched at 0x%08llx but the call at 0x%08llx did not decode: %s",
				signature.name.c_str(), (unsigned long long)*match, (unsigned long long)call, error.c_str());
			continue;
		}
		if (references.empty())
		{
			diag.LogInfo("Signature %s matched at 0x%08llx but 0x%08llx has no operand reference",
				signature.name.c_str(), (unsigned long long)*match, (unsigned long long)call);
			continue;
		}

		const uint64_t target = references.front();
		if (!space.DefineLabel(target, kMainSymbol, SymbolKind::Function, error))
		{
			diag.LogWarn("Failed to label main at 0x%08llx: %s", (unsigned long long)target, error.c_str());
			continue;
		}
		if (!space.CreateFunction(target, error))
			diag.LogWarn("Failed to create main function at 0x%08llx: %s", (unsigned long long)target, error.c_str());

		diag.LogInfo("Found main at 0x%08llx (%s match at 0x%08llx)", (unsigned long long)target,
			signature.name.c_str(), (unsigned long long)*match);
		if (result)
		{
			result->signatureName = signature.name;
			result->matchAddress = *match;
		}
		return target;
	}

	diag.LogInfo("main not found");
	return std::nullopt;
}

EntryResult LocateEntryPoint(AddressSpace& space, const ExeHeader& header, Diagnostics& diag,
	const EntryLocatorOptions& options)
{
	EntryResult result;
	result.startAddress = header.initialPc;

	if (options.seedEntryPoint)
		result.startDefined = SeedEntryPoint(space, header, diag);

	if (options.locateMain)
	{
		const auto& signatures = options.signatures ? *options.signatures : GetEntrySignatures();
		result.mainAddress = FindMainFunction(space, header, diag, signatures, &result);
	}
	return result;
}

} /* namespace psxexe */
