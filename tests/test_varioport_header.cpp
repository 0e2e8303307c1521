#include "vpconv/byte_io.hpp"
#include "vpconv/decode_error.hpp"
#include "vpconv/varioport_header.hpp"

#include "test_support.hpp"
#include "varioport_fixture.hpp"

#include <cmath>
#include <sstream>
#include <string>

using namespace vpconv;
using namespace vpconv_test;

static std::istringstream as_stream(const std::vector<uint8_t>& bytes) {
  return std::istringstream(std::string(bytes.begin(), bytes.end()));
}

int main() {
  VarioportFixture fx;
  fx.header_type = 6;
  fx.base_rate = 150;
  fx.table_offset = 24;

  FixtureChannel ekg;
  ekg.name = "EKG";
  ekg.unit = "uV";
  ekg.width = 2;
  ekg.scan_factor = 1;
  ekg.stream_factor = 0; // coerced to 1
  ekg.mul = 3;
  ekg.zero = 100;
  ekg.div = 7;
  ekg.data_offset = 16;
  ekg.data_length = 200;
  fx.channels.push_back(ekg);

  FixtureChannel resp;
  resp.name = "Resp";
  resp.unit = "";
  resp.width = 1;
  resp.scan_factor = 2;
  resp.stream_factor = 3;
  fx.channels.push_back(resp);

  const std::vector<uint8_t> bytes = fx.build();

  // Header fields, no override.
  {
    std::istringstream in = as_stream(bytes);
    const FileHeader h = read_varioport_header(in);
    assert(h.header_length == 24 + 80);
    assert(h.channel_table_offset == 24);
    assert(h.header_type == 6);
    assert(h.is_demultiplexed());
    assert(h.channel_count == 2);
    assert(h.file_base_scan_rate == 150);
    assert(h.base_scan_rate_hz == 150.0);
    assert(!h.base_rate_overridden);

    const std::vector<ChannelDescriptor> chs = read_channel_table(in, h);
    assert(chs.size() == 2);

    const ChannelDescriptor& c0 = chs[0];
    assert(c0.index == 0);
    assert(c0.name == "EKG");
    assert(c0.unit == "uV");
    assert(c0.sample_byte_width == 2);
    assert(c0.scan_factor == 1);
    assert(c0.stream_factor == 1);
    assert(c0.scale_multiplier == 3);
    assert(c0.scale_offset == 100);
    assert(c0.scale_divisor == 7);
    assert(c0.data_byte_offset == 16u + 104u);
    assert(c0.data_byte_length == 200u);
    assert(c0.sample_rate_hz == 150.0);

    const ChannelDescriptor& c1 = chs[1];
    assert(c1.name == "Resp");
    assert(c1.unit.empty());
    assert(c1.sample_byte_width == 1);
    assert(std::fabs(c1.sample_rate_hz - 25.0) < 1e-12);
  }

  // Override replaces the base rate for derived channel rates only.
  {
    std::istringstream in = as_stream(bytes);
    const FileHeader h = read_varioport_header(in, kLegacyForcedBaseRateHz);
    assert(h.base_rate_overridden);
    assert(h.base_scan_rate_hz == 512.0);
    assert(h.file_base_scan_rate == 150);
    const std::vector<ChannelDescriptor> chs = read_channel_table(in, h);
    assert(std::fabs(chs[1].sample_rate_hz - 512.0 / 6.0) < 1e-9);
  }

  // A non-positive override is ignored.
  {
    std::istringstream in = as_stream(bytes);
    const FileHeader h = read_varioport_header(in, 0.0);
    assert(!h.base_rate_overridden);
    assert(h.base_scan_rate_hz == 150.0);
  }

  // Fewer than 22 bytes.
  {
    std::istringstream in(std::string(21, '\0'));
    bool threw = false;
    try {
      (void)read_varioport_header(in);
    } catch (const DecodeError& e) {
      threw = (e.code() == DecodeErrorCode::kHeaderTooShort);
    }
    assert(threw);
  }

  // Channel table cut short.
  {
    std::vector<uint8_t> cut = bytes;
    cut.resize(24 + 40 + 10);
    std::istringstream in = as_stream(cut);
    const FileHeader h = read_varioport_header(in);
    bool threw = false;
    try {
      (void)read_channel_table(in, h);
    } catch (const DecodeError& e) {
      threw = (e.code() == DecodeErrorCode::kMalformedChannelTable);
    }
    assert(threw);
  }

  // Offsets near the top of the u32 range do not wrap into the header.
  {
    VarioportFixture far;
    FixtureChannel ch;
    ch.name = "EKG";
    ch.data_offset = 0xFFFFFFF0u;
    ch.data_length = 64;
    far.channels.push_back(ch);
    for (int i = 0; i < 64; ++i) far.payload.push_back(0x7F);
    const std::vector<uint8_t> far_bytes = far.build();

    std::istringstream in = as_stream(far_bytes);
    const FileHeader h = read_varioport_header(in);
    const std::vector<ChannelDescriptor> chs = read_channel_table(in, h);
    assert(chs[0].data_byte_offset == 0xFFFFFFF0ull + 64u);
    assert(read_bytes_at(in, chs[0].data_byte_offset, chs[0].data_byte_length).empty());
  }

  // ASCII field trimming.
  {
    const uint8_t raw[6] = {' ', 'E', 'D', 'A', 0, 0};
    assert(decode_ascii_field(raw, 6) == "EDA");
    const uint8_t hi[4] = {'m', 0xB5, 'V', 0};
    assert(decode_ascii_field(hi, 4) == "mV");
  }

  return 0;
}
