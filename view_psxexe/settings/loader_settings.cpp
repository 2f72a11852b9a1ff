/*
 * PS-X EXE Loader Settings
 */

#include "loader_settings.h"
#include "view/psxexe_address_space.h"

using namespace BinaryNinja;

psxexe::LoadOptions DefaultLoaderSettings()
{
	psxexe::LoadOptions options;
	options.locateMain = true;
	options.defineRegisters = true;
	options.defineReserved = true;
	options.createSections = true;
	options.seedEntryPoint = true;
	options.verbose = false;
	return options;
}

static void ApplyLoaderEnvOverrides(psxexe::LoadOptions& options, const Ref<Logger>& logger)
{
	auto& config = PsxExeSettings::PluginConfig::Get();
	if (config.IsVerboseForced())
		options.verbose = true;

	LoggerDiagnostics diag(logger);
	psxexe::ApplyDisabledPasses(options, config.GetDisablePassesEnv(), diag);
}

psxexe::LoadOptions LoadLoaderSettings(const Ref<Settings>& settings, BinaryView* view, const Ref<Logger>& logger)
{
	psxexe::LoadOptions result = DefaultLoaderSettings();
	using namespace PsxExeSettingNames;

	auto analysis = PsxExeSettings::RegisterComponent(kAnalysisComponent);
	auto mmio = PsxExeSettings::RegisterComponent(kMmioComponent);
	auto debug = PsxExeSettings::RegisterComponent(kDebugComponent);

	result.locateMain = analysis->GetBool(settings, kLocateMain, view, result.locateMain);
	result.defineRegisters = mmio->GetBool(settings, kDefineHardwareRegisters, view, result.defineRegisters);
	result.defineReserved = mmio->GetBool(settings, kDefineReservedFiller, view, result.defineReserved);
	result.verbose = debug->GetBool(settings, kVerboseLogging, view, result.verbose);

	// Filler lives inside the register blocks
	if (!result.defineRegisters)
		result.defineReserved = false;

	ApplyLoaderEnvOverrides(result, logger);
	return result;
}

void LogLoaderSettingsSummary(const Ref<Logger>& logger, const psxexe::LoadOptions& options)
{
	if (!logger)
		return;

	logger->LogInfo("PS-X EXE settings: locate_main=%d define_registers=%d define_reserved=%d "
		"create_sections=%d seed_entry=%d verbose=%d",
		options.locateMain, options.defineRegisters, options.defineReserved,
		options.createSections, options.seedEntryPoint, options.verbose);
}

void RegisterLoaderSettings(const Ref<Settings>& settings)
{
	if (!settings)
		return;

	using namespace PsxExeSettingNames;
	auto analysis = PsxExeSettings::RegisterComponent(kAnalysisComponent);
	auto mmio = PsxExeSettings::RegisterComponent(kMmioComponent);
	auto debug = PsxExeSettings::RegisterComponent(kDebugComponent);

	analysis->RegisterBool(settings, kLocateMain, true,
		"Locate main()",
		"Scan forward from the entry point for the SDK startup stub and label the function it calls as main.");

	mmio->RegisterBool(settings, kDefineHardwareRegisters, true,
		"Define hardware registers",
		"Label the memory-mapped I/O registers (DMA, timers, GPU, SPU, ...) and type them by width.");

	mmio->RegisterBool(settings, kDefineReservedFiller, true,
		"Define reserved filler",
		"Define unused bytes inside hardware register blocks as unlabelled byte arrays.");

	debug->RegisterBool(settings, kVerboseLogging, false,
		"Verbose PS-X EXE loader logging",
		"Log the region table, per-phase timing and the resolved settings on every load.");
}
