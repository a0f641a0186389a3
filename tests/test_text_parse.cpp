#include "haul/core/TextParse.h"

#include "test_harness.h"

#include <string>
#include <vector>

int test_text_parse() {
  int failures = 0;

  using namespace haul::core;

  // ---- Strict number parsing ----
  {
    double d = 0.0;
    CHECK(parseDouble(" 42.5 ", d) && d == 42.5);
    CHECK(parseDouble("-1e3", d) && d == -1000.0);
    CHECK(!parseDouble("12abc", d));
    CHECK(!parseDouble("", d));
    CHECK(!parseDouble("inf", d));
    CHECK(!parseDouble("nan", d));

    i64 i = 0;
    CHECK(parseInt("-17", i) && i == -17);
    CHECK(!parseInt("1.5", i));

    bool b = false;
    CHECK(parseBool("Yes", b) && b);
    CHECK(parseBool("0", b) && !b);
    CHECK(!parseBool("maybe", b));
  }

  // ---- Quoting ----
  {
    CHECK(unquote("\"Port Olisar\"") == "Port Olisar");
    CHECK(unquote("'Everus Harbor'") == "Everus Harbor");
    CHECK(unquote("\"a \\\"b\\\"\"") == "a \"b\"");
    CHECK(unquote("Area18") == "Area18");

    CHECK(quoteIfNeeded("Area18") == "Area18");
    CHECK(quoteIfNeeded("Port Olisar") == "\"Port Olisar\"");
    CHECK(quoteIfNeeded("a,b") == "\"a,b\"");
    CHECK(quoteIfNeeded("") == "\"\"");
    CHECK(unquote(quoteIfNeeded("say \"hi\"")) == "say \"hi\"");
  }

  // ---- Comments ----
  {
    CHECK(stripComment("a = 1 # note") == "a = 1");
    CHECK(stripComment("a = 1 // note") == "a = 1");
    CHECK(stripComment("a = \"x # y\"") == "a = \"x # y\"");
    CHECK(stripComment("name = O'Brien's Rest # c") == "name = O'Brien's Rest");
    CHECK(stripComment("   # only comment").empty());
  }

  // ---- Quote-aware splitting ----
  {
    const auto a = splitQuoted("Area18, \"Port Olisar\" ,Lorville", ',');
    CHECK(a.size() == 3);
    if (a.size() == 3) {
      CHECK(a[0] == "Area18");
      CHECK(a[1] == "Port Olisar");
      CHECK(a[2] == "Lorville");
    }

    const auto b = splitQuoted("\"Hub, North\", South", ',');
    CHECK(b.size() == 2);
    if (b.size() == 2) CHECK(b[0] == "Hub, North");

    const auto c = splitQuoted("A,,B", ',');
    CHECK(c.size() == 3);
    if (c.size() == 3) CHECK(c[1].empty());

    CHECK(splitQuoted("   ", ',').empty());
  }

  // ---- Assignments ----
  {
    std::string_view name;
    std::string_view value;
    CHECK(splitAssignment("  start = \"Port Olisar\" ", name, value));
    CHECK(name == "start");
    CHECK(value == "\"Port Olisar\"");

    CHECK(splitAssignment("capacity 168", name, value));
    CHECK(name == "capacity");
    CHECK(value == "168");

    CHECK(!splitAssignment("   ", name, value));
  }

  CHECK(icontains("vehicle.defaultCapacity", "CAPACITY"));
  CHECK(lowerAscii("MicroTech") == "microtech");

  return failures;
}
