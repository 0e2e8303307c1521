#include "vpconv/byte_io.hpp"

#include <stdexcept>
#include <string>

namespace vpconv {

uint16_t load_u16_be(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | static_cast<uint16_t>(p[1]));
}

uint32_t load_u32_be(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) |
         static_cast<uint32_t>(p[3]);
}

uint32_t load_uint_be(const uint8_t* p, int width) {
  if (width == 1) return static_cast<uint32_t>(p[0]);
  if (width == 2) return static_cast<uint32_t>(load_u16_be(p));
  throw std::runtime_error("load_uint_be: unsupported sample width " + std::to_string(width));
}

uint64_t stream_size(std::istream& in) {
  in.clear();
  const std::streampos cur = in.tellg();
  in.seekg(0, std::ios::end);
  const std::streampos end = in.tellg();
  if (cur != std::streampos(-1)) in.seekg(cur);
  if (end == std::streampos(-1) || !in) {
    in.clear();
    throw std::runtime_error("stream_size: input is not seekable");
  }
  return static_cast<uint64_t>(end);
}

std::vector<uint8_t> read_bytes_at(std::istream& in, uint64_t offset, size_t max_bytes) {
  const uint64_t size = stream_size(in);
  std::vector<uint8_t> out;
  if (offset >= size || max_bytes == 0) return out;

  const uint64_t avail = size - offset;
  const size_t n = (static_cast<uint64_t>(max_bytes) > avail) ? static_cast<size_t>(avail) : max_bytes;

  out.resize(n);
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in) {
    in.clear();
    throw std::runtime_error("read_bytes_at: seek failed at offset " + std::to_string(offset));
  }
  const size_t got = read_some(in, out.data(), n);
  out.resize(got);
  return out;
}

size_t read_some(std::istream& in, uint8_t* dst, size_t max_bytes) {
  if (max_bytes == 0) return 0;
  in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(max_bytes));
  const std::streamsize got = in.gcount();
  // A short read sets eof/fail; that is the normal end-of-data signal here.
  if (in.bad()) throw std::runtime_error("read_some: I/O error while reading input");
  in.clear();
  return got > 0 ? static_cast<size_t>(got) : 0;
}

} // namespace vpconv
