#include "vpconv/varioport_header.hpp"

#include "vpconv/byte_io.hpp"
#include "vpconv/decode_error.hpp"

#include <cctype>
#include <string>

namespace vpconv {

namespace vl = varioport_layout;

static bool is_pad_char(char c) {
  return c == '\0' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string decode_ascii_field(const uint8_t* p, size_t n) {
  std::string s;
  s.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    if (p[i] <= 0x7E) s.push_back(static_cast<char>(p[i]));
  }
  size_t b = 0;
  while (b < s.size() && is_pad_char(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_pad_char(s[e - 1])) --e;
  return s.substr(b, e - b);
}

FileHeader read_varioport_header(std::istream& in, std::optional<double> base_rate_override) {
  const std::vector<uint8_t> h = read_bytes_at(in, 0, vl::kMinHeaderBytes);
  if (h.size() < vl::kMinHeaderBytes) {
    throw DecodeError(DecodeErrorCode::kHeaderTooShort,
                      "Varioport: file too short for header (" + std::to_string(h.size()) +
                          " bytes, need " + std::to_string(vl::kMinHeaderBytes) + ")");
  }

  FileHeader hdr;
  hdr.header_length = load_u16_be(&h[vl::kHeaderLengthOffset]);
  hdr.channel_table_offset = load_u16_be(&h[vl::kChannelTableOffsetOffset]);
  hdr.header_type = h[vl::kHeaderTypeOffset];
  hdr.channel_count = h[vl::kChannelCountOffset];
  hdr.file_base_scan_rate = load_u16_be(&h[vl::kBaseScanRateOffset]);

  if (base_rate_override && *base_rate_override > 0.0) {
    hdr.base_scan_rate_hz = *base_rate_override;
    hdr.base_rate_overridden = true;
  } else {
    hdr.base_scan_rate_hz = static_cast<double>(hdr.file_base_scan_rate);
    hdr.base_rate_overridden = false;
  }
  return hdr;
}

ChannelDescriptor parse_channel_record(const uint8_t* rec, uint32_t index, const FileHeader& header) {
  ChannelDescriptor ch;
  ch.index = index;
  ch.name = decode_ascii_field(rec + vl::kChanNameOffset, vl::kChanNameSize);
  ch.unit = decode_ascii_field(rec + vl::kChanUnitOffset, vl::kChanUnitSize);

  ch.sample_byte_width = static_cast<int>(rec[vl::kChanWidthCodeOffset]) + 1;

  ch.scan_factor = rec[vl::kChanScanFactorOffset];
  ch.stream_factor = rec[vl::kChanStreamFactorOffset];
  if (ch.scan_factor == 0) ch.scan_factor = 1;
  if (ch.stream_factor == 0) ch.stream_factor = 1;

  ch.scale_multiplier = load_u16_be(rec + vl::kChanMultiplierOffset);
  ch.scale_offset = load_u16_be(rec + vl::kChanZeroOffsetOffset);
  ch.scale_divisor = load_u16_be(rec + vl::kChanDivisorOffset);

  // The stored offset counts from the end of the header.
  ch.data_byte_offset = static_cast<uint64_t>(load_u32_be(rec + vl::kChanDataOffsetOffset)) +
                        static_cast<uint64_t>(header.header_length);
  ch.data_byte_length = load_u32_be(rec + vl::kChanDataLengthOffset);

  ch.sample_rate_hz = header.base_scan_rate_hz /
                      (static_cast<double>(ch.scan_factor) * static_cast<double>(ch.stream_factor));
  return ch;
}

std::vector<ChannelDescriptor> read_channel_table(std::istream& in, const FileHeader& header) {
  std::vector<ChannelDescriptor> out;
  out.reserve(header.channel_count);

  for (uint32_t i = 0; i < header.channel_count; ++i) {
    const uint64_t pos = static_cast<uint64_t>(header.channel_table_offset) +
                         static_cast<uint64_t>(i) * vl::kChannelRecordSize;
    const std::vector<uint8_t> rec = read_bytes_at(in, pos, vl::kChannelRecordSize);
    if (rec.size() != vl::kChannelRecordSize) {
      throw DecodeError(DecodeErrorCode::kMalformedChannelTable,
                        "Varioport: channel record " + std::to_string(i) + " at offset " +
                            std::to_string(pos) + " is truncated (" + std::to_string(rec.size()) +
                            " of " + std::to_string(vl::kChannelRecordSize) + " bytes)");
    }
    out.push_back(parse_channel_record(rec.data(), i, header));
  }
  return out;
}

} // namespace vpconv
