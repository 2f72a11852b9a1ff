/*
 * PS-X EXE Plugin Settings
 *
 * Keys live under loader.psxexe.<component>.<setting> and are registered both
 * on Settings::Instance() and on every per-file load settings object, which is
 * what makes them editable in "Open with Options".
 *
 * Environment overrides (env_config.h) are read once by PluginConfig and win
 * over whatever the settings say; LoadLoaderSettings applies them last.
 */

#include "plugin_settings.h"
#include "loader_settings.h"
#include "env_config.h"

#include <mutex>
#include <unordered_map>

using namespace BinaryNinja;

namespace PsxExeSettings
{

static std::mutex s_registryMutex;
static std::unordered_map<std::string, std::shared_ptr<SettingsComponent>> s_components;

static std::string EscapeJson(const char* text)
{
	std::string out;
	for (const char* p = text; p && *p; ++p)
	{
		if (*p == '"' || *p == '\\')
			out.push_back('\\');
		out.push_back(*p);
	}
	return out;
}

SettingsComponent::SettingsComponent(const std::string& name)
	: m_name(name)
	, m_prefix(std::string(kPluginPrefix) + name + ".")
{
}

std::string SettingsComponent::GetKey(const char* setting) const
{
	return m_prefix + setting;
}

void SettingsComponent::RegisterBool(const Ref<Settings>& settings,
	const char* name, bool defaultValue, const char* title, const char* description)
{
	if (!settings)
		return;

	std::string json = "{\"title\" : \"" + EscapeJson(title) + "\", \"type\" : \"boolean\", \"default\" : " +
		(defaultValue ? "true" : "false") + ", \"description\" : \"" + EscapeJson(description) + "\"}";
	settings->RegisterSetting(GetKey(name), json);
}

bool SettingsComponent::GetBool(const Ref<Settings>& settings, const char* name, BinaryView* view,
	bool fallback) const
{
	if (!settings)
		return fallback;
	std::string key = GetKey(name);
	if (!settings->Contains(key))
		return fallback;
	return settings->Get<bool>(key, view);
}

std::shared_ptr<SettingsComponent> RegisterComponent(const std::string& name)
{
	std::lock_guard<std::mutex> lock(s_registryMutex);

	auto it = s_components.find(name);
	if (it != s_components.end())
		return it->second;

	auto component = std::make_shared<SettingsComponent>(name);
	s_components[name] = component;
	return component;
}

void InitPluginSettings()
{
	const PluginConfig& config = PluginConfig::Get();
	if (config.IsVerboseForced())
		LogInfo("PS-X EXE: verbose logging forced by %s", PsxExeEnvConfig::kVerbose);

	RegisterLoaderSettings(Settings::Instance());
}

PluginConfig& PluginConfig::Get()
{
	static PluginConfig instance;
	return instance;
}

PluginConfig::PluginConfig()
	: m_disablePassesEnv(nullptr)
	, m_verbose(false)
{
	m_verbose = PsxExeEnvConfig::IsEnvSet(PsxExeEnvConfig::kVerbose);
	m_disablePassesEnv = PsxExeEnvConfig::GetEnv(PsxExeEnvConfig::kDisablePasses);
}

}
