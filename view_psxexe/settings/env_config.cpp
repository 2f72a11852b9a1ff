/*
 * PS-X EXE Plugin Environment Configuration
 *
 * Token lists split on commas, semicolons and whitespace. Matching is done on
 * the normalized form (lowercase, '-' read as '_'), so
 *   BN_PSXEXE_DISABLE_PASSES="Locate-Main;filler"
 * disables "locate_main" and "filler".
 */

#include "env_config.h"

#include <cctype>
#include <cstdlib>

namespace PsxExeEnvConfig
{

static bool IsDelimiter(char c)
{
	return c == ',' || c == ';' || c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::vector<std::string> ParseTokenList(const char* value)
{
	std::vector<std::string> tokens;
	if (!value)
		return tokens;

	std::string current;
	for (const char* p = value; *p; ++p)
	{
		if (IsDelimiter(*p))
		{
			if (!current.empty())
				tokens.emplace_back(std::move(current));
			current.clear();
			continue;
		}
		current.push_back(*p);
	}
	if (!current.empty())
		tokens.emplace_back(std::move(current));
	return tokens;
}

std::string NormalizeToken(std::string token)
{
	for (char& ch : token)
	{
		if (ch == '-')
			ch = '_';
		ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
	}
	return token;
}

bool IsEnvSet(const char* envVar)
{
	const char* value = GetEnv(envVar);
	return value && value[0] != '\0';
}

const char* GetEnv(const char* envVar)
{
	if (!envVar)
		return nullptr;
	return std::getenv(envVar);
}

}
