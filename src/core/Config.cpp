#include "haul/core/Config.h"

#include "haul/core/Log.h"
#include "haul/core/TextParse.h"

#include <fstream>
#include <sstream>

namespace haul::core {

static bool parseAs(ConfigType type, std::string_view text, ConfigValue& out) {
  switch (type) {
    case ConfigType::Bool: {
      bool b = false;
      if (!parseBool(text, b)) return false;
      out = b;
      return true;
    }
    case ConfigType::Int: {
      i64 i = 0;
      if (!parseInt(text, i)) return false;
      out = i;
      return true;
    }
    case ConfigType::Float: {
      double f = 0.0;
      if (!parseDouble(text, f)) return false;
      out = f;
      return true;
    }
    case ConfigType::String:
      out = unquote(text);
      return true;
  }
  return false;
}

static bool holdsType(ConfigType type, const ConfigValue& v) {
  switch (type) {
    case ConfigType::Bool: return std::holds_alternative<bool>(v);
    case ConfigType::Int: return std::holds_alternative<i64>(v);
    case ConfigType::Float: return std::holds_alternative<double>(v);
    case ConfigType::String: return std::holds_alternative<std::string>(v);
  }
  return false;
}

bool ConfigRegistry::exists(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return vars_.find(name) != vars_.end();
}

bool ConfigRegistry::defineImpl(std::string_view name, ConfigType type, ConfigValue def,
                                u32 flags, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it != vars_.end()) {
    if (it->second.type != type) return false;
    it->second.flags = flags;
    if (!help.empty()) it->second.help = std::string(help);
    it->second.defaultValue = std::move(def);
    applyPendingLocked(it->second);
    return true;
  }

  ConfigVar v;
  v.name = std::string(name);
  v.type = type;
  v.flags = flags;
  v.help = std::string(help);
  v.value = def;
  v.defaultValue = std::move(def);

  auto [insIt, inserted] = vars_.emplace(v.name, std::move(v));
  if (!inserted) return false;
  applyPendingLocked(insIt->second);
  return true;
}

bool ConfigRegistry::defineBool(std::string_view name, bool defaultValue, u32 flags, std::string_view help) {
  return defineImpl(name, ConfigType::Bool, ConfigValue{defaultValue}, flags, help);
}

bool ConfigRegistry::defineInt(std::string_view name, i64 defaultValue, u32 flags, std::string_view help) {
  return defineImpl(name, ConfigType::Int, ConfigValue{defaultValue}, flags, help);
}

bool ConfigRegistry::defineFloat(std::string_view name, double defaultValue, u32 flags, std::string_view help) {
  return defineImpl(name, ConfigType::Float, ConfigValue{defaultValue}, flags, help);
}

bool ConfigRegistry::defineString(std::string_view name, std::string defaultValue, u32 flags, std::string_view help) {
  return defineImpl(name, ConfigType::String, ConfigValue{std::move(defaultValue)}, flags, help);
}

bool ConfigRegistry::setValueImpl(std::string_view name, const ConfigValue& v, bool force, std::string* outError) {
  ConfigVar snapshot;
  std::vector<ConfigListener> listeners;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown config var: " + std::string(name);
      return false;
    }
    ConfigVar& var = it->second;
    if (!force && (var.flags & Config_ReadOnly) != 0u) {
      if (outError) *outError = "Config var is read-only: " + var.name;
      return false;
    }
    if (!holdsType(var.type, v)) {
      if (outError) *outError = "Type mismatch for config var: " + var.name;
      return false;
    }

    var.value = v;
    listeners = var.listeners;
    snapshot.name = var.name;
    snapshot.help = var.help;
    snapshot.type = var.type;
    snapshot.flags = var.flags;
    snapshot.value = var.value;
    snapshot.defaultValue = var.defaultValue;
  }

  // Notify outside the lock; listeners may read the registry.
  for (const auto& cb : listeners) {
    if (cb) cb(snapshot);
  }
  return true;
}

bool ConfigRegistry::setBool(std::string_view name, bool v, std::string* outError) {
  return setValueImpl(name, ConfigValue{v}, false, outError);
}

bool ConfigRegistry::setInt(std::string_view name, i64 v, std::string* outError) {
  return setValueImpl(name, ConfigValue{v}, false, outError);
}

bool ConfigRegistry::setFloat(std::string_view name, double v, std::string* outError) {
  return setValueImpl(name, ConfigValue{v}, false, outError);
}

bool ConfigRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return setValueImpl(name, ConfigValue{std::move(v)}, false, outError);
}

bool ConfigRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  ConfigType type = ConfigType::String;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown config var: " + std::string(name);
      return false;
    }
    type = it->second.type;
  }

  ConfigValue parsed;
  if (!parseAs(type, value, parsed)) {
    if (outError) *outError = std::string("Invalid ") + typeName(type) + " for " + std::string(name) + ": " + std::string(value);
    return false;
  }
  return setValueImpl(name, parsed, false, outError);
}

bool ConfigRegistry::reset(std::string_view name, std::string* outError) {
  ConfigValue def;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown config var: " + std::string(name);
      return false;
    }
    def = it->second.defaultValue;
  }
  return setValueImpl(name, def, true, outError);
}

bool ConfigRegistry::addListener(std::string_view name, ConfigListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown config var: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

bool ConfigRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<bool>(it->second.value)) return fallback;
  return std::get<bool>(it->second.value);
}

i64 ConfigRegistry::getInt(std::string_view name, i64 fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<i64>(it->second.value)) return fallback;
  return std::get<i64>(it->second.value);
}

double ConfigRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<double>(it->second.value)) return fallback;
  return std::get<double>(it->second.value);
}

std::string ConfigRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end() || !std::holds_alternative<std::string>(it->second.value)) return std::string(fallback);
  return std::get<std::string>(it->second.value);
}

std::vector<ConfigVar> ConfigRegistry::list(std::string_view filter) const {
  std::vector<ConfigVar> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(vars_.size());
  for (const auto& kv : vars_) {
    if (!filter.empty() && !icontains(kv.first, filter)) continue;
    ConfigVar copy = kv.second;
    copy.listeners.clear();
    out.push_back(std::move(copy));
  }
  return out;
}

const char* ConfigRegistry::typeName(ConfigType t) {
  switch (t) {
    case ConfigType::Bool: return "bool";
    case ConfigType::Int: return "int";
    case ConfigType::Float: return "float";
    case ConfigType::String: return "string";
  }
  return "?";
}

std::string ConfigRegistry::valueToString(const ConfigVar& v) {
  if (!holdsType(v.type, v.value)) return {};
  switch (v.type) {
    case ConfigType::Bool:
      return std::get<bool>(v.value) ? "true" : "false";
    case ConfigType::Int:
      return std::to_string(std::get<i64>(v.value));
    case ConfigType::Float: {
      std::ostringstream oss;
      oss.setf(std::ios::fixed);
      oss.precision(6);
      oss << std::get<double>(v.value);
      return oss.str();
    }
    case ConfigType::String:
      return std::get<std::string>(v.value);
  }
  return {};
}

void ConfigRegistry::applyPendingLocked(ConfigVar& var) {
  auto pit = pending_.find(var.name);
  if (pit == pending_.end()) return;

  ConfigValue parsed;
  if (parseAs(var.type, pit->second, parsed)) {
    var.value = std::move(parsed);
  } else {
    HAUL_LOG_WARN("config: ignoring invalid pending value for " + var.name + ": " + pit->second);
  }
  pending_.erase(pit);
}

bool ConfigRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open config file: " + path;
    return false;
  }

  bool hadErrors = false;
  std::ostringstream errs;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;

    std::string_view name;
    std::string_view val;
    if (!splitAssignment(stripComment(line), name, val)) continue;

    bool known = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      known = (vars_.find(name) != vars_.end());
      if (!known) pending_[std::string(name)] = std::string(val);
    }

    if (known) {
      std::string err;
      if (!setFromString(name, val, &err)) {
        hadErrors = true;
        errs << path << ":" << lineNo << ": " << err << "\n";
      }
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool ConfigRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }

  out << "# haul planner configuration\n\n";

  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto& kv : vars_) {
    const ConfigVar& v = kv.second;
    if ((v.flags & Config_Archive) == 0u) continue;

    out << v.name << " = ";
    if (v.type == ConfigType::String) {
      out << quoteIfNeeded(std::get<std::string>(v.value));
    } else {
      out << valueToString(v);
    }
    out << "\n";
  }

  if (!pending_.empty()) {
    out << "\n# Not defined by this build\n";
    for (const auto& kv : pending_) {
      out << kv.first << " = " << kv.second << "\n";
    }
  }

  return static_cast<bool>(out);
}

bool ConfigRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

std::optional<std::string> ConfigRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

ConfigRegistry& config() {
  static ConfigRegistry g;
  return g;
}

void installDefaultConfig(ConfigRegistry& registry) {
  if (!registry.exists("log.level")) {
    registry.defineString("log.level",
                          std::string(trimView(toString(getLogLevel()))),
                          Config_Archive,
                          "Global log level: trace|debug|info|warn|error|off");
    registry.addListener("log.level", [](const ConfigVar& v) {
      if (!std::holds_alternative<std::string>(v.value)) return;
      LogLevel lvl = LogLevel::Info;
      if (!parseLogLevel(std::get<std::string>(v.value), lvl)) {
        HAUL_LOG_WARN("config log.level: invalid value (expected trace|debug|info|warn|error|off)");
        return;
      }
      setLogLevel(lvl);
    });
  }

  registry.defineString("data.catalog", "data/stanton.locations", Config_Archive,
                        "Location catalog file (name | type | parent | x y z)");
  registry.defineString("vehicle.default", "taurus", Config_Archive,
                        "Vehicle id used when a request names none");
  registry.defineFloat("vehicle.defaultCapacity", 168.0, Config_Archive,
                       "Capacity (SCU) used for unknown vehicle ids");
  registry.defineInt("planner.threads", 0, Config_Archive,
                     "Worker threads for batch planning (0 = hardware concurrency)");
  registry.defineBool("json.pretty", true, Config_Archive,
                      "Indent JSON output");
}

} // namespace haul::core
