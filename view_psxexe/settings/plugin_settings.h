/*
 * PS-X EXE Plugin Settings
 *
 * Settings infrastructure with component registration. Each component owns
 * a sub-prefix under the plugin prefix and registers its own settings.
 */

#pragma once

#include "binaryninjaapi.h"

#include <memory>
#include <string>

namespace PsxExeSettings
{

// Base plugin key prefix - all component settings are under this
constexpr const char* kPluginPrefix = "loader.psxexe.";

// Standard loader key (not under our prefix)
constexpr const char* kPlatform = "loader.platform";

/*
 * SettingsComponent - a named group of settings under the plugin prefix.
 *
 * Usage:
 *   auto mmio = PsxExeSettings::RegisterComponent("mmio");
 *   mmio->RegisterBool(settings, "defineHardwareRegisters", true, "Title", "Description");
 *   // Registers key: "loader.psxexe.mmio.defineHardwareRegisters"
 */
class SettingsComponent
{
public:
	explicit SettingsComponent(const std::string& name);

	// Build a full key for a setting under this component
	std::string GetKey(const char* setting) const;

	void RegisterBool(const BinaryNinja::Ref<BinaryNinja::Settings>& settings,
		const char* name, bool defaultValue, const char* title, const char* description);

	// Read a boolean, falling back when the key is not registered in `settings`
	bool GetBool(const BinaryNinja::Ref<BinaryNinja::Settings>& settings, const char* name,
		BinaryNinja::BinaryView* view, bool fallback) const;

private:
	std::string m_name;
	std::string m_prefix;
};

// Register a new component; returns the existing one if already registered
std::shared_ptr<SettingsComponent> RegisterComponent(const std::string& name);

// Called from CorePluginInit
void InitPluginSettings();

/*
 * PluginConfig - environment overrides, parsed once and cached.
 */
class PluginConfig
{
public:
	static PluginConfig& Get();

	// Raw BN_PSXEXE_DISABLE_PASSES value (token parsing happens in the loader)
	const char* GetDisablePassesEnv() const { return m_disablePassesEnv; }

	// BN_PSXEXE_VERBOSE
	bool IsVerboseForced() const { return m_verbose; }

private:
	PluginConfig();

	const char* m_disablePassesEnv;
	bool m_verbose;
};

}
