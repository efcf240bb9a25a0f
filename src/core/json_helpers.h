// Minimal JSON serialization writer (no external dependencies).
//
// Builds the event listings printed by the CLI and returned through the
// C API. Does not parse JSON.

#ifndef PLAYMML_CORE_JSON_HELPERS_H
#define PLAYMML_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace playmml {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("type");
///   writer.value("tone");
///   writer.key("frequency_hz");
///   writer.value(440);
///   writer.endObject();
///   // -> {"type":"tone","frequency_hz":440}
/// @endcode
///
/// Commas are inserted automatically. Structure is not validated.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(int val);
  void value(uint32_t val);
  void value(bool val);

  /// @brief Get the accumulated JSON string.
  const std::string& toString() const { return buffer_; }

  /// @brief Get the accumulated JSON with newlines and indentation.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;

  void open(char bracket);
  void close(char bracket);

  /// Write a comma if the current container already holds an element.
  void separate();

  /// Mark the current container as non-empty after a value.
  void markWritten();

  static std::string escapeString(std::string_view input);
};

}  // namespace playmml

#endif  // PLAYMML_CORE_JSON_HELPERS_H
