#include "vpconv/channel_select.hpp"

#include "vpconv/decode_error.hpp"
#include "vpconv/utils.hpp"

#include <algorithm>

namespace vpconv {

bool is_marker_channel_name(const std::string& name) {
  return icontains(name, "marker");
}

bool is_supported_sample_width(int width) {
  return width == 1 || width == 2;
}

ChannelSelection select_active_channels(const std::vector<ChannelDescriptor>& channels,
                                        DiagnosticLog& log) {
  ChannelSelection sel;

  for (const auto& ch : channels) {
    bool forced = false;
    if (ch.data_byte_length == 0) {
      if (!is_marker_channel_name(ch.name)) {
        sel.skipped.push_back(SkippedChannel{ch, SkipReason::kInactive});
        continue;
      }
      forced = true;
    }

    if (!is_supported_sample_width(ch.sample_byte_width)) {
      log.warning("Skipping channel " + std::to_string(ch.index) + " '" + ch.name +
                  "' with unsupported sample width " + std::to_string(ch.sample_byte_width) + " bytes");
      sel.skipped.push_back(SkippedChannel{ch, SkipReason::kUnsupportedWidth});
      continue;
    }

    if (forced) {
      log.info("Force-including marker channel '" + ch.name + "' despite zero data length");
      sel.forced_markers.push_back(ch.name);
    }
    sel.active.push_back(ch);
  }

  if (sel.active.empty()) {
    throw DecodeError(DecodeErrorCode::kNoActiveChannels,
                      "Varioport: no active channels with a supported sample width (" +
                          std::to_string(channels.size()) + " channel records)");
  }
  return sel;
}

double effective_stream_rate(const std::vector<ChannelDescriptor>& active) {
  double fs = 0.0;
  for (const auto& ch : active) fs = std::max(fs, ch.sample_rate_hz);
  return fs;
}

size_t multiplexed_block_size(const std::vector<ChannelDescriptor>& active) {
  size_t n = 0;
  for (const auto& ch : active) n += static_cast<size_t>(ch.sample_byte_width);
  return n;
}

const char* skip_reason_name(SkipReason r) {
  switch (r) {
    case SkipReason::kInactive: return "inactive";
    case SkipReason::kUnsupportedWidth: return "unsupported-width";
  }
  return "inactive";
}

} // namespace vpconv
