/*
 * PS-X EXE Commands
 *
 * Each command:
 * 1. Validates the view is a PS-X EXE view
 * 2. Loads settings (view load settings + environment)
 * 3. Creates a cancellable background task
 * 4. Runs the pass on a detached thread through PsxExeAddressSpace
 */

#include "psxexe_commands.h"
#include "analysis/entry_locator.h"
#include "loader/memory_map.h"
#include "settings/loader_settings.h"
#include "view/psxexe_address_space.h"
#include "view/psxexe_view.h"

#include <thread>

using namespace BinaryNinja;

namespace
{

Ref<Logger> GetCommandLogger()
{
	static Ref<Logger> logger = LogRegistry::CreateLogger("PsxExe.Commands");
	return logger;
}

psxexe::LoadOptions LoadCommandSettings(BinaryView* view)
{
	Ref<Settings> settings = view->GetLoadSettings(view->GetTypeName());
	if (!settings)
		settings = Settings::Instance();
	return LoadLoaderSettings(settings, view, GetCommandLogger());
}

bool IsValidForCommand(BinaryView* view)
{
	return IsPsxExeView(view);
}

/*
 * Command: Locate main
 *
 * Runs only the signature search; start/entry/gp were set at load.
 */
void RunLocateMain(BinaryView* view)
{
	if (!view)
		return;

	Ref<Logger> logger = GetCommandLogger();
	auto header = ReadPsxExeHeader(view);
	if (!header)
	{
		logger->LogError("Locate main: header could not be read");
		return;
	}

	Ref<BackgroundTask> task = new BackgroundTask("PS-X EXE: Locate main", true);
	Ref<BinaryView> viewRef = view;
	psxexe::ExeHeader exeHeader = *header;
	std::thread([viewRef, task, exeHeader, logger]() mutable {
		try
		{
			task->SetProgressText("Scanning for the SDK startup stub...");

			PsxExeAddressSpace space(viewRef.GetPtr(), viewRef->GetDefaultPlatform(), logger,
				[task]() { return task->IsCancelled(); });
			LoggerDiagnostics diag(logger);

			psxexe::EntryLocatorOptions options;
			options.seedEntryPoint = false;
			options.locateMain = true;
			psxexe::EntryResult result = psxexe::LocateEntryPoint(space, exeHeader, diag, options);

			if (result.mainAddress)
				viewRef->UpdateAnalysis();
			else if (!space.IsCancelled())
				logger->LogInfo("Locate main: no match from 0x%08x", exeHeader.initialPc);

			task->SetProgressText("Locate main complete");
		}
		catch (const std::exception& e)
		{
			logger->LogError("Locate main failed: %s", e.what());
		}

		task->Finish();
	}).detach();
}

/*
 * Command: Define Hardware Registers
 *
 * Re-applies register labels and typed data to the existing MMIO segments.
 */
void RunDefineHardwareRegisters(BinaryView* view)
{
	if (!view)
		return;

	Ref<Logger> logger = GetCommandLogger();
	psxexe::LoadOptions options = LoadCommandSettings(view);

	Ref<BackgroundTask> task = new BackgroundTask("PS-X EXE: Define Hardware Registers", true);
	Ref<BinaryView> viewRef = view;
	bool includeReserved = options.defineReserved;
	std::thread([viewRef, task, includeReserved, logger]() mutable {
		try
		{
			task->SetProgressText("Defining hardware registers...");

			PsxExeAddressSpace space(viewRef.GetPtr(), viewRef->GetDefaultPlatform(), logger,
				[task]() { return task->IsCancelled(); });
			LoggerDiagnostics diag(logger);

			psxexe::RealizeStats stats;
			psxexe::RealizeRegisters(psxexe::BuildRegisterBatches(includeReserved), space, diag, stats);

			logger->LogInfo("Hardware registers: %zu defined, %zu reserved spans, %zu failures%s",
				stats.registers, stats.reserved, stats.failures, stats.cancelled ? " (cancelled)" : "");
			viewRef->UpdateAnalysis();

			task->SetProgressText("Hardware registers complete");
		}
		catch (const std::exception& e)
		{
			logger->LogError("Define hardware registers failed: %s", e.what());
		}

		task->Finish();
	}).detach();
}

}

namespace PsxExeCommands
{

void RegisterCommands()
{
	PluginCommand::Register(
		"PS-X EXE\\Locate main",
		"Search for the SDK startup stub and label the function it calls as main",
		RunLocateMain,
		IsValidForCommand);

	PluginCommand::Register(
		"PS-X EXE\\Define Hardware Registers",
		"Label and type the PlayStation memory-mapped I/O registers",
		RunDefineHardwareRegisters,
		IsValidForCommand);
}

}
