/*
 * PS-X EXE Diagnostics Channel
 *
 * The loader core never talks to a host logger directly. Every component
 * receives a Diagnostics reference and reports through it with the same
 * printf-style calls the Binary Ninja Logger exposes (LogInfo, LogWarn, ...).
 *
 * Implementations:
 *   - LoggerDiagnostics (view/psxexe_address_space.h) forwards to a
 *     BinaryNinja::Logger
 *   - the unit tests record messages in memory
 *   - NullDiagnostics drops everything
 */

#pragma once

#include <cstdarg>
#include <string>

namespace psxexe {

enum class DiagnosticLevel
{
	Debug,
	Info,
	Warning,
	Error
};

class Diagnostics
{
public:
	virtual ~Diagnostics() = default;

	void LogDebug(const char* fmt, ...);
	void LogInfo(const char* fmt, ...);
	void LogWarn(const char* fmt, ...);
	void LogError(const char* fmt, ...);

protected:
	virtual void Emit(DiagnosticLevel level, const std::string& message) = 0;

private:
	void EmitV(DiagnosticLevel level, const char* fmt, va_list args);
};

class NullDiagnostics: public Diagnostics
{
protected:
	void Emit(DiagnosticLevel, const std::string&) override {}
};

/**
 * Format a printf-style message into a std::string.
 */
std::string FormatString(const char* fmt, ...);
std::string FormatStringV(const char* fmt, va_list args);

} /* namespace psxexe */
