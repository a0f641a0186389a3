#include "haul/core/JsonWriter.h"

#include <cmath>
#include <cstdio>

namespace haul::core {

JsonWriter::JsonWriter(std::ostream& out, bool pretty, int indentWidth)
  : out_(out), pretty_(pretty), indentWidth_(indentWidth < 0 ? 0 : indentWidth) {}

void JsonWriter::newline() {
  if (!pretty_) return;
  out_ << '\n';
  const std::size_t spaces = stack_.size() * (std::size_t)indentWidth_;
  for (std::size_t i = 0; i < spaces; ++i) out_ << ' ';
}

void JsonWriter::beforeValue() {
  if (afterKey_) {
    afterKey_ = false;
    return;
  }
  if (stack_.empty()) {
    wroteRoot_ = true;
    return;
  }
  Frame& f = stack_.back();
  if (f.count > 0) out_ << ',';
  ++f.count;
  newline();
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{true, 0});
}

void JsonWriter::endObject() {
  if (stack_.empty()) return;
  const bool hadItems = stack_.back().count > 0;
  stack_.pop_back();
  if (hadItems) newline();
  out_ << '}';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{false, 0});
}

void JsonWriter::endArray() {
  if (stack_.empty()) return;
  const bool hadItems = stack_.back().count > 0;
  stack_.pop_back();
  if (hadItems) newline();
  out_ << ']';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  writeEscaped(k);
  out_ << (pretty_ ? ": " : ":");
  afterKey_ = true;
}

void JsonWriter::value(std::string_view s) {
  beforeValue();
  writeEscaped(s);
}

void JsonWriter::value(const char* s) {
  if (!s) {
    nullValue();
    return;
  }
  value(std::string_view(s));
}

void JsonWriter::value(bool b) {
  beforeValue();
  out_ << (b ? "true" : "false");
}

void JsonWriter::value(int v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(double v) {
  if (!std::isfinite(v)) {
    nullValue();
    return;
  }
  beforeValue();
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.17g", v);
  if (n > 0) out_.write(buf, n);
}

void JsonWriter::nullValue() {
  beforeValue();
  out_ << "null";
}

void JsonWriter::writeEscaped(std::string_view s) {
  out_ << '"';
  for (char c : s) {
    switch (c) {
      case '"': out_ << "\\\""; break;
      case '\\': out_ << "\\\\"; break;
      case '\n': out_ << "\\n"; break;
      case '\r': out_ << "\\r"; break;
      case '\t': out_ << "\\t"; break;
      case '\b': out_ << "\\b"; break;
      case '\f': out_ << "\\f"; break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          out_ << buf;
        } else {
          out_ << c;
        }
        break;
    }
  }
  out_ << '"';
}

} // namespace haul::core
