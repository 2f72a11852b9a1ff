/*
 * PS-X EXE Commands
 *
 * Plugin commands for re-running load passes on an open PS-X EXE view.
 * Accessible via the Command Palette and Plugins > PS-X EXE:
 *
 *   PS-X EXE\Locate main                 re-run the main() signature search
 *   PS-X EXE\Define Hardware Registers   re-apply MMIO labels and data types
 *
 * Both run on a background thread behind a cancellable BackgroundTask.
 */

#pragma once

namespace PsxExeCommands
{

void RegisterCommands();

}
