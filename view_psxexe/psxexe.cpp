/*
 * PS-X EXE View Plugin
 *
 * Plugin entry: registers settings, the "PS-X EXE" BinaryViewType and the
 * plugin commands. The MIPS architecture itself comes from arch_mips.
 */

#include "binaryninjaapi.h"
#include "commands/psxexe_commands.h"
#include "settings/plugin_settings.h"
#include "view/psxexe_view.h"

using namespace BinaryNinja;

extern "C"
{
	BN_DECLARE_CORE_ABI_VERSION

	BINARYNINJAPLUGIN void CorePluginDependencies()
	{
		AddRequiredPluginDependency("arch_mips");
	}

	BINARYNINJAPLUGIN bool CorePluginInit()
	{
		PsxExeSettings::InitPluginSettings();
		InitPsxExeViewType();
		PsxExeCommands::RegisterCommands();
		return true;
	}
}
