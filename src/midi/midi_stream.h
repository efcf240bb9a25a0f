// Helper for reading/writing binary MIDI data (variable-length quantities,
// big-endian integers).

#ifndef PLAYMML_MIDI_STREAM_H
#define PLAYMML_MIDI_STREAM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace playmml {

/// Microseconds per minute constant for MIDI tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// @brief Write a variable-length quantity (VLQ) to a byte buffer.
/// @param buf Destination buffer (bytes are appended).
/// @param value The unsigned value to encode (clamped to 0x0FFFFFFF).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Read a variable-length quantity from raw MIDI data.
/// @param data Pointer to the raw byte stream.
/// @param offset Current read position; advanced past the VLQ on return.
/// @param max_size Total size of the data buffer (bounds check).
/// @return Decoded value (partial if the data ends early).
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size);

/// @brief Append a big-endian uint16.
void writeBE16(std::vector<uint8_t>& buf, uint16_t value);

/// @brief Append a big-endian uint32.
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Read a big-endian uint16 at `offset`.
uint16_t readBE16(const uint8_t* data, size_t offset);

/// @brief Read a big-endian uint32 at `offset`.
uint32_t readBE32(const uint8_t* data, size_t offset);

}  // namespace playmml

#endif  // PLAYMML_MIDI_STREAM_H
