/// @file
/// @brief Binary MIDI stream helper implementations (VLQ, big-endian I/O).

#include "midi/midi_stream.h"

namespace playmml {

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > 0x0FFFFFFF) {
    value = 0x0FFFFFFF;
  }

  // 7 bits per byte, least significant group last; continuation bit on all
  // groups but the final one.
  uint8_t groups[4];
  int count = 0;
  do {
    groups[count++] = static_cast<uint8_t>(value & 0x7F);
    value >>= 7;
  } while (value > 0);

  for (int idx = count - 1; idx >= 0; --idx) {
    uint8_t byte = groups[idx];
    if (idx > 0) byte |= 0x80;
    buf.push_back(byte);
  }
}

uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  constexpr int kMaxVlqBytes = 4;
  uint32_t result = 0;

  for (int bytes_read = 0; offset < max_size && bytes_read < kMaxVlqBytes; ++bytes_read) {
    uint8_t byte = data[offset++];
    result = (result << 7) | static_cast<uint32_t>(byte & 0x7F);
    if ((byte & 0x80) == 0) break;
  }
  return result;
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    buf.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t readBE32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
          static_cast<uint32_t>(data[offset + 3]);
}

}  // namespace playmml
