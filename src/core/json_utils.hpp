#ifndef TRACR_CORE_JSON_UTILS_HPP_
#define TRACR_CORE_JSON_UTILS_HPP_

#include "core/json_dom.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tracr::core {

// Shared JSON string escaping for every writer in the tree.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Shortest round-trippable rendering for finite doubles (plain notation
// for integral values such as 10 or 1500); non-finite values are emitted
// as 0 so the output stays valid JSON.
inline std::string FormatJsonDouble(double value) {
  if (!std::isfinite(value)) {
    return "0";
  }
  char buffer[64];
  const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "0";
  }
  return std::string(buffer, end);
}

// Incremental single-object writer keeping field order exactly as written.
// Nested objects/arrays are inserted with `Raw` from another writer's output.
class JsonObjectWriter {
public:
  JsonObjectWriter& String(std::string_view key, std::string_view value) {
    Key(key);
    out_ << '"' << EscapeJson(value) << '"';
    return *this;
  }

  JsonObjectWriter& Int(std::string_view key, std::int64_t value) {
    Key(key);
    out_ << value;
    return *this;
  }

  JsonObjectWriter& UInt(std::string_view key, std::uint64_t value) {
    Key(key);
    out_ << value;
    return *this;
  }

  JsonObjectWriter& Double(std::string_view key, double value) {
    Key(key);
    out_ << FormatJsonDouble(value);
    return *this;
  }

  JsonObjectWriter& Bool(std::string_view key, bool value) {
    Key(key);
    out_ << (value ? "true" : "false");
    return *this;
  }

  JsonObjectWriter& Null(std::string_view key) {
    Key(key);
    out_ << "null";
    return *this;
  }

  JsonObjectWriter& Raw(std::string_view key, std::string_view raw_json) {
    Key(key);
    out_ << raw_json;
    return *this;
  }

  JsonObjectWriter& StringArray(std::string_view key, const std::vector<std::string>& values) {
    Key(key);
    out_ << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
      if (i > 0U) {
        out_ << ',';
      }
      out_ << '"' << EscapeJson(values[i]) << '"';
    }
    out_ << ']';
    return *this;
  }

  std::string Finish() const {
    return "{" + out_.str() + "}";
  }

private:
  void Key(std::string_view key) {
    if (!first_) {
      out_ << ',';
    }
    first_ = false;
    out_ << '"' << EscapeJson(key) << "\":";
  }

  std::ostringstream out_;
  bool first_ = true;
};

// Joins already-serialized JSON values into an array literal.
inline std::string JoinJsonArray(const std::vector<std::string>& items) {
  std::string out = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0U) {
      out += ',';
    }
    out += items[i];
  }
  out += ']';
  return out;
}

// Compact rendering of a parsed DOM. Object keys come out sorted, so equal
// documents serialize identically.
inline std::string SerializeJson(const json::Value& value) {
  switch (value.type) {
  case json::Value::Type::kObject: {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out += ',';
      }
      first = false;
      out += '"' + EscapeJson(key) + "\":" + SerializeJson(member);
    }
    return out + '}';
  }
  case json::Value::Type::kArray: {
    std::vector<std::string> items;
    items.reserve(value.array_value.size());
    for (const auto& item : value.array_value) {
      items.push_back(SerializeJson(item));
    }
    return JoinJsonArray(items);
  }
  case json::Value::Type::kString:
    return '"' + EscapeJson(value.string_value) + '"';
  case json::Value::Type::kNumber:
    return FormatJsonDouble(value.number_value);
  case json::Value::Type::kBool:
    return value.bool_value ? "true" : "false";
  case json::Value::Type::kNull:
    return "null";
  }
  return "null";
}

} // namespace tracr::core

#endif // TRACR_CORE_JSON_UTILS_HPP_
