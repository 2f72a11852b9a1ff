/*
 * PS-X EXE Loader Settings
 *
 * Settings keys and load helpers for the PS-X EXE view.
 * Resolution order: built-in defaults, Binary Ninja settings, environment.
 */

#pragma once

#include "binaryninjaapi.h"
#include "plugin_settings.h"
#include "loader/psxexe_loader.h"

#include <memory>

namespace PsxExeSettingNames
{
	// Component "analysis"
	constexpr const char* kAnalysisComponent = "analysis";
	constexpr const char* kLocateMain = "locateMain";

	// Component "mmio"
	constexpr const char* kMmioComponent = "mmio";
	constexpr const char* kDefineHardwareRegisters = "defineHardwareRegisters";
	constexpr const char* kDefineReservedFiller = "defineReservedFiller";

	// Component "debug"
	constexpr const char* kDebugComponent = "debug";
	constexpr const char* kVerboseLogging = "verboseLogging";
}

psxexe::LoadOptions DefaultLoaderSettings();

/**
 * Resolve load options for a view.
 *
 * @param settings  Load settings of the view, or Settings::Instance(); may be null.
 * @param view      Resource scope for per-file values; may be null.
 * @param logger    Receives warnings about unknown override tokens.
 */
psxexe::LoadOptions LoadLoaderSettings(const BinaryNinja::Ref<BinaryNinja::Settings>& settings,
	BinaryNinja::BinaryView* view, const BinaryNinja::Ref<BinaryNinja::Logger>& logger);

void LogLoaderSettingsSummary(const BinaryNinja::Ref<BinaryNinja::Logger>& logger,
	const psxexe::LoadOptions& options);

void RegisterLoaderSettings(const BinaryNinja::Ref<BinaryNinja::Settings>& settings);
