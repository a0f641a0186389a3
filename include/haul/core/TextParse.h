#pragma once

#include "haul/core/Types.h"

#include <string>
#include <string_view>
#include <vector>

namespace haul::core {

// Shared helpers for the line-based text formats (config, location catalog, mission requests).

std::string_view trimView(std::string_view s);
std::string lowerAscii(std::string_view s);
bool icontains(std::string_view hay, std::string_view needle);

// Strict parsers: the whole (trimmed) token must be consumed.
bool parseBool(std::string_view s, bool& out);
bool parseInt(std::string_view s, i64& out);
bool parseDouble(std::string_view s, double& out);

// Removes one level of matching '...' or "..." quotes and resolves \" \\ \n \t escapes.
std::string unquote(std::string_view s);
std::string quoteIfNeeded(std::string_view s);

// Cuts a trailing "# ..." or "// ..." comment that is not inside quotes.
std::string_view stripComment(std::string_view line);

// Splits on `sep` outside of quotes; each item is trimmed and unquoted.
// Empty items are kept so callers can report them.
std::vector<std::string> splitQuoted(std::string_view s, char sep);

// Splits "name = value" (or "name value") into its two trimmed halves.
bool splitAssignment(std::string_view line, std::string_view& name, std::string_view& value);

} // namespace haul::core
