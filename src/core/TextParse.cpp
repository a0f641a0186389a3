#include "haul/core/TextParse.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace haul::core {

std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string lowerAscii(std::string_view s) {
  std::string out;
  out.resize(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    out[i] = (char)std::tolower((unsigned char)s[i]);
  }
  return out;
}

bool icontains(std::string_view hay, std::string_view needle) {
  if (needle.empty()) return true;
  return lowerAscii(hay).find(lowerAscii(needle)) != std::string::npos;
}

bool parseBool(std::string_view s, bool& out) {
  const std::string k = lowerAscii(trimView(s));
  if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
  if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
  return false;
}

bool parseInt(std::string_view s, i64& out) {
  s = trimView(s);
  if (s.empty()) return false;

  i64 v = 0;
  const auto* begin = s.data();
  const auto* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc{} || res.ptr != end) return false;
  out = v;
  return true;
}

bool parseDouble(std::string_view s, double& out) {
  s = trimView(s);
  if (s.empty()) return false;

  // strtod requires a null-terminated buffer.
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2) {
    const char q0 = s.front();
    const char q1 = s.back();
    if ((q0 == '"' && q1 == '"') || (q0 == '\'' && q1 == '\'')) {
      s = s.substr(1, s.size() - 2);
    }
  }

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == '\\' || n == '"' || n == '\'') { out.push_back(n); ++i; continue; }
      if (n == 'n') { out.push_back('\n'); ++i; continue; }
      if (n == 't') { out.push_back('\t'); ++i; continue; }
    }
    out.push_back(c);
  }
  return out;
}

std::string quoteIfNeeded(std::string_view s) {
  bool needs = s.empty();
  for (char c : s) {
    if (std::isspace((unsigned char)c) || c == '#' || c == '=' || c == '"' || c == '\\' || c == ',' || c == '|') {
      needs = true;
      break;
    }
  }
  if (!needs) return std::string(s);

  std::string out;
  out.reserve(s.size() + 8);
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('"');
  return out;
}

std::string_view stripComment(std::string_view line) {
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != 0) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '"') {
      quote = c;
      continue;
    }
    // A lone apostrophe (O'Reilly) only opens a quote at the start of a token.
    if (c == '\'' && (i == 0 || std::isspace((unsigned char)line[i - 1]) || line[i - 1] == '=' || line[i - 1] == ',')) {
      quote = c;
      continue;
    }
    if (c == '#') return trimView(line.substr(0, i));
    if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') return trimView(line.substr(0, i));
  }
  return trimView(line);
}

std::vector<std::string> splitQuoted(std::string_view s, char sep) {
  std::vector<std::string> out;
  s = trimView(s);
  if (s.empty()) return out;

  char quote = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quote != 0) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      if (trimView(s.substr(start, i - start)).empty()) quote = c;
      continue;
    }
    if (c == sep) {
      out.push_back(unquote(s.substr(start, i - start)));
      start = i + 1;
    }
  }
  out.push_back(unquote(s.substr(start)));
  return out;
}

bool splitAssignment(std::string_view line, std::string_view& name, std::string_view& value) {
  line = trimView(line);
  if (line.empty()) return false;

  const std::size_t eq = line.find('=');
  if (eq != std::string_view::npos) {
    name = trimView(line.substr(0, eq));
    value = trimView(line.substr(eq + 1));
  } else {
    std::size_t sp = 0;
    while (sp < line.size() && !std::isspace((unsigned char)line[sp])) ++sp;
    name = trimView(line.substr(0, sp));
    value = trimView(sp < line.size() ? line.substr(sp) : std::string_view{});
  }
  return !name.empty();
}

} // namespace haul::core
