/*
 * PS-X EXE Loader - Implementation
 */

#include "psxexe_loader.h"
#include "settings/env_config.h"

#include <chrono>

namespace psxexe {

bool DisableLoadPass(LoadOptions& options, const std::string& token)
{
	if (token == "all")
	{
		options.locateMain = false;
		options.defineRegisters = false;
		options.defineReserved = false;
		return true;
	}
	if (token == "main" || token == "locate_main")
	{
		options.locateMain = false;
		return true;
	}
	if (token == "mmio" || token == "registers" || token == "hardware_registers")
	{
		options.defineRegisters = false;
		options.defineReserved = false;
		return true;
	}
	if (token == "filler" || token == "reserved")
	{
		options.defineReserved = false;
		return true;
	}
	return false;
}

void ApplyDisabledPasses(LoadOptions& options, const char* value, Diagnostics& diag)
{
	if (!value || value[0] == '\0')
		return;

	for (auto& token : PsxExeEnvConfig::ParseTokenList(value))
	{
		auto normalized = PsxExeEnvConfig::NormalizeToken(token);
		if (normalized.empty())
			continue;
		if (!DisableLoadPass(options, normalized))
			diag.LogWarn("Ignoring unknown load pass '%s'", token.c_str());
	}
}

void LogHeaderSummary(const ExeHeader& header, Diagnostics& diag)
{
	diag.LogInfo("PS-X EXE: pc=0x%08x gp=0x%08x load=0x%08x code_size=0x%x sp=0x%08x",
		header.initialPc, header.initialGp, header.loadAddress, header.codeSize, header.StackPointer());
	if (header.HasData())
		diag.LogInfo("PS-X EXE: data 0x%08x size 0x%x", header.dataAddress, header.dataSize);
	if (header.HasBss())
		diag.LogInfo("PS-X EXE: bss 0x%08x size 0x%x", header.bssAddress, header.bssSize);
	if (!header.marker.empty())
	{
		const char* region = GetMarkerRegionName(GetMarkerRegion(header.marker));
		diag.LogInfo("PS-X EXE: marker \"%s\"%s%s", header.marker.c_str(), region[0] ? " region " : "", region);
	}
}

static double ElapsedMs(std::chrono::steady_clock::time_point since)
{
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

LoadReport LoadExecutable(const uint8_t* headerData, size_t headerLen, uint64_t fileLength, AddressSpace& space,
	Diagnostics& diag, const LoadOptions& options)
{
	LoadReport report;

	report.header = ParseExeHeader(headerData, headerLen);
	if (!report.header)
	{
		diag.LogError("Not a PS-X EXE (bad magic or truncated header, %zu bytes)", headerLen);
		return report;
	}
	const ExeHeader& header = *report.header;
	LogHeaderSummary(header, diag);

	if (fileLength < kHeaderSize + static_cast<uint64_t>(header.codeSize))
	{
		diag.LogWarn("File holds 0x%llx code bytes, header declares 0x%x; the rest reads as zero",
			(unsigned long long)(fileLength > kHeaderSize ? fileLength - kHeaderSize : 0), header.codeSize);
	}

	auto phaseStart = std::chrono::steady_clock::now();
	MemoryMapOptions mapOptions;
	mapOptions.includeRegisters = options.defineRegisters;
	mapOptions.includeReserved = options.defineReserved;
	mapOptions.createSections = options.createSections;
	MemoryMapPlan plan = BuildMemoryMap(header, fileLength, mapOptions);
	report.memory = RealizeMemoryMap(plan, space, diag);
	LogMemoryMapSummary(plan, report.memory, diag, options.verbose);
	if (options.verbose)
		diag.LogInfo("Memory map took %.1f ms", ElapsedMs(phaseStart));

	if (report.memory.cancelled)
	{
		report.cancelled = true;
		return report;
	}

	phaseStart = std::chrono::steady_clock::now();
	EntryLocatorOptions entryOptions;
	entryOptions.seedEntryPoint = options.seedEntryPoint;
	entryOptions.locateMain = options.locateMain;
	report.entry = LocateEntryPoint(space, header, diag, entryOptions);
	report.cancelled = space.IsCancelled();
	if (options.verbose)
		diag.LogInfo("Entry location took %.1f ms", ElapsedMs(phaseStart));

	return report;
}

} /* namespace psxexe */
