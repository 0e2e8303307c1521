#include "vpconv/byte_io.hpp"

#include "test_support.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace vpconv;

int main() {
  const uint8_t b[] = {0x12, 0x34, 0x56, 0x78, 0xFF};
  assert(load_u16_be(b) == 0x1234);
  assert(load_u32_be(b) == 0x12345678u);
  assert(load_uint_be(b + 4, 1) == 0xFF);
  assert(load_uint_be(b + 2, 2) == 0x5678);

  bool threw = false;
  try {
    (void)load_uint_be(b, 3);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // Stream helpers on a 10-byte buffer.
  std::string data;
  for (int i = 0; i < 10; ++i) data.push_back(static_cast<char>(i));
  std::istringstream in(data);
  assert(stream_size(in) == 10);

  // Short read at the end is clamped, not an error.
  std::vector<uint8_t> got = read_bytes_at(in, 7, 8);
  assert(got.size() == 3);
  assert(got[0] == 7 && got[2] == 9);

  // Offset beyond the end yields nothing, and the stream stays usable.
  assert(read_bytes_at(in, 42, 4).empty());
  got = read_bytes_at(in, 2, 2);
  assert(got.size() == 2);
  assert(got[0] == 2 && got[1] == 3);

  uint8_t buf[16];
  in.seekg(5);
  assert(read_some(in, buf, sizeof(buf)) == 5);
  assert(buf[0] == 5);
  assert(read_some(in, buf, sizeof(buf)) == 0);

  return 0;
}
