/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cstdio>

namespace playmml {

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  separate();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value that follows belongs to this key: no comma before it.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(std::string_view val) {
  separate();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  markWritten();
}

void JsonWriter::value(int val) {
  separate();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(uint32_t val) {
  separate();
  buffer_ += std::to_string(val);
  markWritten();
}

void JsonWriter::value(bool val) {
  separate();
  buffer_ += val ? "true" : "false";
  markWritten();
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;

      case '{':
      case '[':
        result += chr;
        ++depth;
        // Empty containers stay compact: {} or [].
        if (pos + 1 < buffer_.size() && buffer_[pos + 1] != '}' && buffer_[pos + 1] != ']') {
          newline();
        }
        break;

      case '}':
      case ']':
        --depth;
        if (!result.empty() && result.back() != '{' && result.back() != '[') {
          newline();
        }
        result += chr;
        break;

      case ',':
        result += chr;
        newline();
        break;

      case ':':
        result += ": ";
        break;

      default:
        result += chr;
        break;
    }
  }

  return result;
}

void JsonWriter::open(char bracket) {
  separate();
  buffer_ += bracket;
  needs_comma_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  markWritten();
}

void JsonWriter::separate() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::markWritten() {
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n"; break;
      case '\r': result += "\\r"; break;
      case '\t': result += "\\t"; break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(chr));
          result += buf;
        } else {
          result += chr;
        }
        break;
    }
  }
  return result;
}

}  // namespace playmml
