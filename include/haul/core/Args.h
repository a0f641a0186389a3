#pragma once

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace haul::core {

// Small argument parser for the planner CLI.
//
// Supports:
//  - Flags:         --json   -h
//  - KV args:       --ship taurus   --ship=taurus
//  - Multi-value:   --missions a.missions b.missions   (see setVariadic)
//  - Positional:    everything else, and everything after "--"
//
// Values that look like numbers (-1, -.5, 2e-3) are never mistaken for switches.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  // Long option consuming exactly `valueCount` following values when present.
  void setArity(std::string_view key, int valueCount) {
    if (valueCount <= 0) return;
    arity_[std::string(key)] = valueCount;
  }

  // Long option consuming every following value up to the next switch.
  void setVariadic(std::string_view key) { arity_[std::string(key)] = kVariadic; }

  // Long option that never takes a value, so "--json out.txt" leaves out.txt positional.
  void setFlag(std::string_view key) { arity_[std::string(key)] = 0; }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.push_back(std::string(argv[j]));
        }
        break;
      }

      if (startsWith(a, "--")) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        const int took = consumeValues(key, argc, argv, i, 1);
        if (took == 0) flags_.push_back(key);
        continue;
      }

      if (a.size() >= 2 && a[0] == '-' && a[1] != '-') {
        if (looksLikeNumber(a.c_str())) {
          positional_.push_back(a);
          continue;
        }

        // "-o=value"
        if (a.find('=') == 2) {
          kv_[a.substr(1, 1)].push_back(a.substr(3));
          continue;
        }

        if (a.size() == 2 && arity_.count(a.substr(1)) != 0) {
          const std::string key = a.substr(1);
          const int took = consumeValues(key, argc, argv, i, 0);
          if (took == 0) flags_.push_back(key);
          continue;
        }

        // Grouped short flags (-qv).
        for (std::size_t j = 1; j < a.size(); ++j) {
          const char c = a[j];
          if (std::isalnum((unsigned char)c) || c == '_') flags_.push_back(std::string(1, c));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    if (hasFlag(key)) return true;
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // Typed helpers (return true if provided & fully parsed).
  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const double val = std::strtod(v->c_str(), &end);
    if (end == v->c_str() || *end != '\0') return false;
    out = val;
    return true;
  }

  bool getSize(std::string_view key, std::size_t& out) const {
    const auto v = last(key);
    if (!v || v->empty() || (*v)[0] == '-') return false;
    char* end = nullptr;
    const auto val = std::strtoull(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return false;
    out = static_cast<std::size_t>(val);
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

private:
  static constexpr int kVariadic = -1;

  // Returns how many values were taken for `key` starting after argv[i]; advances i.
  int consumeValues(const std::string& key, int argc, char** argv, int& i, int defaultArity) {
    const auto ar = arity_.find(key);
    const int need = (ar != arity_.end()) ? ar->second : defaultArity;
    if (need == 0) return 0;

    int took = 0;
    while ((need == kVariadic || took < need) && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
      kv_[key].push_back(std::string(argv[++i]));
      ++took;
    }
    return took;
  }

  static bool startsWith(const std::string& s, const char* prefix) {
    const std::size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
  }

  // Accepts forms like: -1, -0.25, -.5, 1e-3, -2.0E+4
  static bool looksLikeNumber(const char* s) {
    if (!s || !*s) return false;

    int i = 0;
    if (s[i] == '+' || s[i] == '-') ++i;
    if (!s[i]) return false;

    bool anyDigit = false;
    bool anyDot = false;

    for (; s[i]; ++i) {
      const unsigned char c = (unsigned char)s[i];
      if (std::isdigit(c)) {
        anyDigit = true;
        continue;
      }
      if (c == '.' && !anyDot) {
        anyDot = true;
        continue;
      }
      if ((c == 'e' || c == 'E') && anyDigit) {
        ++i;
        if (s[i] == '+' || s[i] == '-') ++i;
        bool expDigit = false;
        for (; s[i]; ++i) {
          if (!std::isdigit((unsigned char)s[i])) return false;
          expDigit = true;
        }
        return expDigit;
      }
      return false;
    }

    return anyDigit;
  }

  static bool isSwitch(const char* s) {
    if (!s || s[0] != '-') return false;
    // A lone '-' means stdin/stdout.
    if (s[1] == '\0') return false;
    return !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace haul::core
