#include "vpconv/channel_select.hpp"
#include "vpconv/decode_error.hpp"

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace vpconv;

static ChannelDescriptor make_channel(uint32_t index, const std::string& name, int width, uint32_t len,
                                      double fs) {
  ChannelDescriptor ch;
  ch.index = index;
  ch.name = name;
  ch.sample_byte_width = width;
  ch.data_byte_length = len;
  ch.sample_rate_hz = fs;
  return ch;
}

int main() {
  assert(is_marker_channel_name("Marker"));
  assert(is_marker_channel_name("EVMARKER"));
  assert(!is_marker_channel_name("Mark"));
  assert(is_supported_sample_width(1));
  assert(is_supported_sample_width(2));
  assert(!is_supported_sample_width(3));
  assert(!is_supported_sample_width(4));

  {
    std::vector<ChannelDescriptor> chs = {
        make_channel(0, "EKG", 2, 1000, 512.0),
        make_channel(1, "Marker", 1, 0, 32.0),   // forced in
        make_channel(2, "Resp", 2, 0, 64.0),     // inactive
        make_channel(3, "Temp", 3, 300, 1024.0), // unsupported width
        make_channel(4, "EDA", 1, 500, 128.0),
    };

    DiagnosticLog log;
    const ChannelSelection sel = select_active_channels(chs, log);

    assert(sel.active.size() == 3);
    assert(sel.active[0].name == "EKG");
    assert(sel.active[1].name == "Marker");
    assert(sel.active[2].name == "EDA");

    assert(sel.skipped.size() == 2);
    assert(sel.skipped[0].descriptor.name == "Resp");
    assert(sel.skipped[0].reason == SkipReason::kInactive);
    assert(sel.skipped[1].descriptor.name == "Temp");
    assert(sel.skipped[1].reason == SkipReason::kUnsupportedWidth);

    assert(sel.forced_markers.size() == 1);
    assert(sel.forced_markers[0] == "Marker");

    assert(log.count(DiagnosticSeverity::kWarning) == 1);
    assert(log.contains(DiagnosticSeverity::kWarning, "Temp"));

    // The unsupported 1024 Hz channel does not count towards the stream rate.
    assert(effective_stream_rate(sel.active) == 512.0);
    assert(multiplexed_block_size(sel.active) == 2 + 1 + 1);
  }

  // A marker channel with an unsupported width is still dropped.
  {
    std::vector<ChannelDescriptor> chs = {
        make_channel(0, "Marker", 4, 0, 32.0),
        make_channel(1, "EKG", 2, 10, 256.0),
    };
    DiagnosticLog log;
    const ChannelSelection sel = select_active_channels(chs, log);
    assert(sel.active.size() == 1);
    assert(sel.forced_markers.empty());
    assert(sel.skipped[0].reason == SkipReason::kUnsupportedWidth);
  }

  // Nothing decodable.
  {
    std::vector<ChannelDescriptor> chs = {
        make_channel(0, "Resp", 2, 0, 64.0),
        make_channel(1, "Temp", 4, 100, 64.0),
    };
    DiagnosticLog log;
    bool threw = false;
    try {
      (void)select_active_channels(chs, log);
    } catch (const DecodeError& e) {
      threw = (e.code() == DecodeErrorCode::kNoActiveChannels);
    }
    assert(threw);
  }

  assert(effective_stream_rate({}) == 0.0);
  assert(std::string(skip_reason_name(SkipReason::kUnsupportedWidth)) == "unsupported-width");
  return 0;
}
