#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace vpconv {

// Big-endian decoding of fixed-width unsigned integers from a byte buffer.
// The caller guarantees that enough bytes are available.
uint16_t load_u16_be(const uint8_t* p);
uint32_t load_u32_be(const uint8_t* p);

// Decode one unsigned sample of the given byte width (1 or 2).
uint32_t load_uint_be(const uint8_t* p, int width);

// Total size of a seekable stream in bytes. The read position is restored.
// Throws std::runtime_error if the stream cannot be sized.
uint64_t stream_size(std::istream& in);

// Read up to max_bytes starting at an absolute offset.
//
// Returns the bytes actually read; the result is shorter than max_bytes when
// the stream ends first (including when offset lies beyond the end).
// The stream's error state is cleared before returning so that subsequent
// seeks keep working.
std::vector<uint8_t> read_bytes_at(std::istream& in, uint64_t offset, size_t max_bytes);

// Read up to max_bytes from the current position into dst.
// Returns the number of bytes read (0 at end of stream).
size_t read_some(std::istream& in, uint8_t* dst, size_t max_bytes);

} // namespace vpconv
