#pragma once

// Builds small synthetic Varioport files byte by byte for the tests.
//
// Layout produced by VarioportFixture::build():
//   [0, 22)                      file header
//   [table_offset, +40*n)        channel records
//   [header_length, ...)         payload (channel data or interleaved stream)
//
// An explicit header_length must not end inside the channel table.

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vpconv_test {

inline void put_u16_be(std::vector<uint8_t>* b, size_t pos, uint16_t v) {
  (*b)[pos] = static_cast<uint8_t>((v >> 8) & 0xFF);
  (*b)[pos + 1] = static_cast<uint8_t>(v & 0xFF);
}

inline void put_u32_be(std::vector<uint8_t>* b, size_t pos, uint32_t v) {
  (*b)[pos] = static_cast<uint8_t>((v >> 24) & 0xFF);
  (*b)[pos + 1] = static_cast<uint8_t>((v >> 16) & 0xFF);
  (*b)[pos + 2] = static_cast<uint8_t>((v >> 8) & 0xFF);
  (*b)[pos + 3] = static_cast<uint8_t>(v & 0xFF);
}

inline void append_u16_be(std::vector<uint8_t>* b, uint16_t v) {
  b->push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  b->push_back(static_cast<uint8_t>(v & 0xFF));
}

struct FixtureChannel {
  std::string name;
  std::string unit{"uV"};
  int width{2};           // stored as width - 1
  uint8_t scan_factor{1};
  uint8_t stream_factor{1};
  uint16_t mul{1};
  uint16_t zero{0};
  uint16_t div{1};
  uint32_t data_offset{0}; // relative to header_length, as on disk
  uint32_t data_length{0};
};

struct VarioportFixture {
  uint8_t header_type{6};
  uint16_t base_rate{100};
  uint16_t table_offset{24};
  uint16_t header_length{0}; // 0 => directly after the channel table
  std::vector<FixtureChannel> channels;
  std::vector<uint8_t> payload;

  uint16_t effective_header_length() const {
    if (header_length != 0) return header_length;
    return static_cast<uint16_t>(table_offset + 40 * channels.size());
  }

  std::vector<uint8_t> build() const {
    const uint16_t hl = effective_header_length();
    const size_t table_end = static_cast<size_t>(table_offset) + 40 * channels.size();
    std::vector<uint8_t> b(std::max<size_t>(std::max<size_t>(hl, table_end), 22), 0);

    put_u16_be(&b, 2, hl);
    put_u16_be(&b, 4, table_offset);
    b[6] = header_type;
    b[7] = static_cast<uint8_t>(channels.size());
    put_u16_be(&b, 20, base_rate);

    for (size_t i = 0; i < channels.size(); ++i) {
      const FixtureChannel& c = channels[i];
      const size_t r = static_cast<size_t>(table_offset) + 40 * i;
      for (size_t k = 0; k < 6 && k < c.name.size(); ++k) b[r + k] = static_cast<uint8_t>(c.name[k]);
      for (size_t k = 0; k < 4 && k < c.unit.size(); ++k) b[r + 6 + k] = static_cast<uint8_t>(c.unit[k]);
      b[r + 11] = static_cast<uint8_t>(c.width - 1);
      b[r + 12] = c.scan_factor;
      b[r + 14] = c.stream_factor;
      put_u16_be(&b, r + 16, c.mul);
      put_u16_be(&b, r + 18, c.zero);
      put_u16_be(&b, r + 20, c.div);
      put_u32_be(&b, r + 24, c.data_offset);
      put_u32_be(&b, r + 28, c.data_length);
    }

    b.insert(b.end(), payload.begin(), payload.end());
    return b;
  }

  void write(const std::string& path) const {
    write_bytes(path, build());
  }

  static void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("fixture: cannot write " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("fixture: write failed " + path);
  }
};

inline std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace vpconv_test
