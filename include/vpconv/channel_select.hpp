#pragma once

#include "vpconv/diagnostics.hpp"
#include "vpconv/types.hpp"

#include <string>
#include <vector>

namespace vpconv {

enum class SkipReason {
  kInactive,         // data_byte_length == 0 and not a marker channel
  kUnsupportedWidth, // sample_byte_width not in {1, 2}
};

struct SkippedChannel {
  ChannelDescriptor descriptor;
  SkipReason reason{SkipReason::kInactive};
};

// Outcome of active channel selection, in channel-table order.
struct ChannelSelection {
  std::vector<ChannelDescriptor> active;
  std::vector<SkippedChannel> skipped;

  // Channels that were kept only because of the marker-name rule.
  std::vector<std::string> forced_markers;
};

// Marker channels often declare a zero data length while still being present
// in the interleaved stream, so they are kept regardless.
bool is_marker_channel_name(const std::string& name);

bool is_supported_sample_width(int width);

// Select the channels to decode.
//
// A channel is active if data_byte_length != 0 or its name contains "marker"
// (case-insensitive), and its sample width is 1 or 2 bytes. Each width-based
// drop is reported as a warning.
//
// Throws DecodeError(kNoActiveChannels) if nothing remains.
ChannelSelection select_active_channels(const std::vector<ChannelDescriptor>& channels,
                                        DiagnosticLog& log);

// Highest per-channel rate among the active channels.
//
// A low-rate marker channel interleaved 1:1 with a fast signal channel runs at
// the fast rate on disk, so the maximum is the true stream cadence.
double effective_stream_rate(const std::vector<ChannelDescriptor>& active);

// Bytes per interleaved sample group (sum of active sample widths).
size_t multiplexed_block_size(const std::vector<ChannelDescriptor>& active);

const char* skip_reason_name(SkipReason r);

} // namespace vpconv
