#pragma once

#include "haul/core/Types.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace haul::core {

// Typed configuration variables for the planner and its tools.
//
// File format (loadFile/saveFile):
//   # comment
//   data.catalog = "data/stanton.locations"
//   vehicle.defaultCapacity = 168
//
// Assignments to names that are not defined yet are kept as pending values and
// applied when the variable gets defined. Listing order is name-sorted.

enum class ConfigType : u8 {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum ConfigFlags : u32 {
  Config_None     = 0u,
  Config_Archive  = 1u << 0, // written by saveFile()
  Config_ReadOnly = 1u << 1, // cannot be changed after definition
};

using ConfigValue = std::variant<bool, i64, double, std::string>;
using ConfigListener = std::function<void(const struct ConfigVar&)>;

struct ConfigVar {
  std::string name;
  std::string help;
  ConfigType type{ConfigType::String};
  u32 flags{Config_None};

  ConfigValue value{};
  ConfigValue defaultValue{};

  // Called after a successful set/reset.
  std::vector<ConfigListener> listeners;
};

class ConfigRegistry {
public:
  ConfigRegistry() = default;

  ConfigRegistry(const ConfigRegistry&) = delete;
  ConfigRegistry& operator=(const ConfigRegistry&) = delete;

  bool exists(std::string_view name) const;

  // Idempotent for the same type; returns false when the name exists with another type.
  bool defineBool(std::string_view name, bool defaultValue,
                  u32 flags = Config_Archive, std::string_view help = {});
  bool defineInt(std::string_view name, i64 defaultValue,
                 u32 flags = Config_Archive, std::string_view help = {});
  bool defineFloat(std::string_view name, double defaultValue,
                   u32 flags = Config_Archive, std::string_view help = {});
  bool defineString(std::string_view name, std::string defaultValue,
                    u32 flags = Config_Archive, std::string_view help = {});

  bool        getBool(std::string_view name, bool fallback = false) const;
  i64         getInt(std::string_view name, i64 fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  bool setBool(std::string_view name, bool v, std::string* outError = nullptr);
  bool setInt(std::string_view name, i64 v, std::string* outError = nullptr);
  bool setFloat(std::string_view name, double v, std::string* outError = nullptr);
  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parses `value` according to the variable's type.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, ConfigListener cb, std::string* outError = nullptr);

  // Copies of the variables (listeners stripped), name-sorted, filtered by a
  // case-insensitive substring when `filter` is non-empty.
  std::vector<ConfigVar> list(std::string_view filter = {}) const;

  static const char* typeName(ConfigType t);
  static std::string valueToString(const ConfigVar& v);

  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  bool defineImpl(std::string_view name, ConfigType type, ConfigValue def, u32 flags, std::string_view help);
  bool setValueImpl(std::string_view name, const ConfigValue& v, bool force, std::string* outError);

  // Called with mutex held.
  void applyPendingLocked(ConfigVar& var);

  mutable std::mutex mutex_;
  std::map<std::string, ConfigVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

// Process-wide registry used by the CLI.
ConfigRegistry& config();

// Defines the planner's variables on `registry` (safe to call repeatedly):
//   log.level, data.catalog, vehicle.default, vehicle.defaultCapacity,
//   planner.threads, json.pretty
void installDefaultConfig(ConfigRegistry& registry);

} // namespace haul::core
