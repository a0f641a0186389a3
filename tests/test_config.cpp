#include "haul/core/Config.h"
#include "haul/core/Log.h"

#include "test_harness.h"

#include <cstdio>
#include <fstream>
#include <string>

int test_config() {
  int failures = 0;

  using haul::core::ConfigRegistry;
  using haul::core::ConfigType;

  // ---- Define + typed get/set ----
  {
    ConfigRegistry r;
    CHECK(r.defineBool("a.bool", true, haul::core::Config_Archive, "test"));
    CHECK(r.defineInt("a.int", 42, haul::core::Config_None));
    CHECK(r.defineFloat("a.float", 1.5, haul::core::Config_None));
    CHECK(r.defineString("a.str", "hello"));

    // Same name, other type.
    CHECK(!r.defineInt("a.bool", 1));

    CHECK(r.getBool("a.bool", false) == true);
    CHECK(r.getInt("a.int", 0) == 42);
    CHECK(r.getFloat("a.float", 0.0) == 1.5);
    CHECK(r.getString("a.str", "") == "hello");
    CHECK(r.getInt("missing", 9) == 9);

    std::string err;
    CHECK(r.setFromString("a.bool", "off", &err));
    CHECK(r.getBool("a.bool", true) == false);
    CHECK(r.setFromString("a.int", "-7", &err));
    CHECK(r.getInt("a.int", 0) == -7);
    CHECK(!r.setFromString("a.int", "7.5", &err));
    CHECK(r.getInt("a.int", 0) == -7);
    CHECK(r.setFromString("a.str", "\"Port Olisar\"", &err));
    CHECK(r.getString("a.str", "") == "Port Olisar");

    CHECK(!r.setInt("a.str", 3, &err));
    CHECK(!r.setString("nope", "x", &err));

    CHECK(r.reset("a.int", &err));
    CHECK(r.getInt("a.int", 0) == 42);
  }

  // ---- Read-only vars and listeners ----
  {
    ConfigRegistry r;
    CHECK(r.defineInt("ro.int", 5, haul::core::Config_ReadOnly));
    std::string err;
    CHECK(!r.setInt("ro.int", 6, &err));
    CHECK(!err.empty());

    CHECK(r.defineFloat("cap", 168.0));
    double seen = 0.0;
    int calls = 0;
    CHECK(r.addListener("cap", [&](const haul::core::ConfigVar& v) {
      ++calls;
      seen = std::get<double>(v.value);
    }));
    CHECK(r.setFloat("cap", 576.0));
    CHECK(calls == 1);
    CHECK(seen == 576.0);
  }

  // ---- Listing is name-sorted and filterable ----
  {
    ConfigRegistry r;
    r.defineInt("planner.threads", 0);
    r.defineString("data.catalog", "x");
    r.defineBool("json.pretty", true);
    const auto all = r.list();
    CHECK(all.size() == 3);
    if (all.size() == 3) {
      CHECK(all[0].name == "data.catalog");
      CHECK(all[1].name == "json.pretty");
      CHECK(all[2].name == "planner.threads");
    }
    const auto filtered = r.list("PLANNER");
    CHECK(filtered.size() == 1);
    CHECK(ConfigRegistry::typeName(ConfigType::Float) == std::string("float"));
  }

  // ---- Pending assignment (load before define) and file round trip ----
  {
    const std::string path = "haul_test_config_pending.cfg";
    {
      std::ofstream f(path);
      f << "# test\n";
      f << "pending.int = 123   // trailing comment\n";
      f << "pending.str = \"hello # world\"\n";
    }

    ConfigRegistry r;
    std::string err;
    CHECK(r.loadFile(path, &err));
    CHECK(r.hasPending("pending.int"));
    CHECK(r.pendingValue("pending.str").value_or("") == "\"hello # world\"");

    CHECK(r.defineInt("pending.int", 0));
    CHECK(r.getInt("pending.int", 0) == 123);
    CHECK(!r.hasPending("pending.int"));

    CHECK(r.defineString("pending.str", ""));
    CHECK(r.getString("pending.str", "") == "hello # world");

    const std::string savePath = "haul_test_config_saved.cfg";
    CHECK(r.saveFile(savePath, &err));

    ConfigRegistry r2;
    r2.defineInt("pending.int", 0);
    r2.defineString("pending.str", "");
    CHECK(r2.loadFile(savePath, &err));
    CHECK(r2.getInt("pending.int", 0) == 123);
    CHECK(r2.getString("pending.str", "") == "hello # world");

    std::remove(path.c_str());
    std::remove(savePath.c_str());
  }

  // ---- Bad values in a file are reported with file:line ----
  {
    const std::string path = "haul_test_config_bad.cfg";
    {
      std::ofstream f(path);
      f << "planner.threads = many\n";
    }
    ConfigRegistry r;
    r.defineInt("planner.threads", 0);
    std::string err;
    CHECK(!r.loadFile(path, &err));
    CHECK(err.find(path + ":1") != std::string::npos);
    std::remove(path.c_str());
  }

  // ---- Planner defaults; log.level drives the global level ----
  {
    const auto prev = haul::core::getLogLevel();

    ConfigRegistry r;
    haul::core::installDefaultConfig(r);
    haul::core::installDefaultConfig(r);
    CHECK(r.getString("data.catalog", "") == "data/stanton.locations");
    CHECK(r.getString("vehicle.default", "") == "taurus");
    CHECK(r.getFloat("vehicle.defaultCapacity", 0.0) == 168.0);
    CHECK(r.getInt("planner.threads", -1) == 0);
    CHECK(r.getBool("json.pretty", false) == true);

    CHECK(r.setString("log.level", "error"));
    CHECK(haul::core::getLogLevel() == haul::core::LogLevel::Error);

    haul::core::setLogLevel(prev);
  }

  return failures;
}
