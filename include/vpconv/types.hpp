#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vpconv {

// Fixed header fields of a Varioport recording.
//
// Notes:
// - header_length and channel_table_offset are byte offsets from the start of
//   the file. The channel table is not guaranteed to start after the header
//   region.
// - file_base_scan_rate is the value stored in the file. base_scan_rate_hz is
//   the rate actually used to derive channel rates (the caller override when
//   one was supplied, otherwise the file value).
struct FileHeader {
  uint16_t header_length{0};
  uint16_t channel_table_offset{0};
  uint8_t header_type{0};
  uint8_t channel_count{0};
  uint16_t file_base_scan_rate{0};

  double base_scan_rate_hz{0.0};
  bool base_rate_overridden{false};

  // Header type 6 stores each channel as its own contiguous block.
  // Every other value is treated as an interleaved (multiplexed) stream.
  bool is_demultiplexed() const { return header_type == 6; }
};

// One 40-byte channel record from the channel table.
struct ChannelDescriptor {
  uint32_t index{0};
  std::string name;
  std::string unit;

  int sample_byte_width{0}; // raw code + 1; only 1 and 2 are decodable
  uint8_t scan_factor{1};   // 0 in the file is coerced to 1
  uint8_t stream_factor{1}; // 0 in the file is coerced to 1

  uint16_t scale_multiplier{0};
  uint16_t scale_offset{0}; // zero point
  uint16_t scale_divisor{0};

  uint64_t data_byte_offset{0}; // absolute (raw field + header_length), never wraps
  uint32_t data_byte_length{0}; // Type 6 only; 0 means inactive

  double sample_rate_hz{0.0}; // base_scan_rate_hz / (scan_factor * stream_factor)
};

// Raw integer -> physical value: (raw - zero_offset) * multiplier / divisor.
struct ScalingProfile {
  double zero_offset{0.0};
  double multiplier{1.0};
  double divisor{1.0};
};

// Decoded samples of one channel in physical units.
//
// padded_samples counts synthetic zero samples appended at the end to align
// channel lengths (Type 6 layout). They are not part of the recording.
struct DecodedChannel {
  ChannelDescriptor descriptor;
  std::vector<double> samples;
  size_t padded_samples{0};

  size_t n_real_samples() const { return samples.size() - padded_samples; }
};

// A block of samples for all active channels, block[ch][i].
// All inner vectors have the same length.
using SampleBlock = std::vector<std::vector<double>>;

} // namespace vpconv
