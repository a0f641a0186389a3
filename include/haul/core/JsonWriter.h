#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>
#include <vector>

namespace haul::core {

// Streaming JSON writer used by the CLI and the route exporters.
//
// The caller drives structure explicitly:
//   w.beginObject(); w.key("route"); w.beginArray(); w.value("Lorville"); w.endArray(); w.endObject();
//
// Doubles are written with 17 significant digits so output is byte-stable for
// identical inputs; non-finite doubles become null.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true, int indentWidth = 2);

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view s);
  void value(const char* s);
  void value(bool b);
  void value(int v);
  void value(long long v);
  void value(unsigned long long v);
  void value(double v);
  void nullValue();

  // True once every opened object/array has been closed.
  bool complete() const { return stack_.empty() && wroteRoot_; }

private:
  struct Frame {
    bool isObject{false};
    std::size_t count{0};
  };

  void beforeValue();
  void newline();
  void writeEscaped(std::string_view s);

  std::ostream& out_;
  bool pretty_{true};
  int indentWidth_{2};
  bool afterKey_{false};
  bool wroteRoot_{false};
  std::vector<Frame> stack_;
};

} // namespace haul::core
