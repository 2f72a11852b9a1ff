/*
 * PS-X EXE Diagnostics Channel
 */

#include "diagnostics.h"

#include <cstdio>
#include <vector>

namespace psxexe {

std::string FormatStringV(const char* fmt, va_list args)
{
	if (!fmt)
		return {};

	char stackBuf[256];
	va_list copy;
	va_copy(copy, args);
	int needed = vsnprintf(stackBuf, sizeof(stackBuf), fmt, copy);
	va_end(copy);

	if (needed < 0)
		return {};
	if (static_cast<size_t>(needed) < sizeof(stackBuf))
		return std::string(stackBuf, static_cast<size_t>(needed));

	// Message did not fit; format again into an exact-size buffer
	std::vector<char> heapBuf(static_cast<size_t>(needed) + 1);
	va_copy(copy, args);
	vsnprintf(heapBuf.data(), heapBuf.size(), fmt, copy);
	va_end(copy);
	return std::string(heapBuf.data(), static_cast<size_t>(needed));
}

std::string FormatString(const char* fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	std::string result = FormatStringV(fmt, args);
	va_end(args);
	return result;
}

void Diagnostics::EmitV(DiagnosticLevel level, const char* fmt, va_list args)
{
	Emit(level, FormatStringV(fmt, args));
}

void Diagnostics::LogDebug(const char* fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	EmitV(DiagnosticLevel::Debug, fmt, args);
	va_end(args);
}

void Diagnostics::LogInfo(const char* fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	EmitV(DiagnosticLevel::Info, fmt, args);
	va_end(args);
}

void Diagnostics::LogWarn(const char* fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	EmitV(DiagnosticLevel::Warning, fmt, args);
	va_end(args);
}

void Diagnostics::LogError(const char* fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	EmitV(DiagnosticLevel::Error, fmt, args);
	va_end(args);
}

} /* namespace psxexe */
