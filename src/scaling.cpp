#include "vpconv/scaling.hpp"

#include "vpconv/utils.hpp"

namespace vpconv {

const std::vector<DefaultScalingEntry>& default_scaling_table() {
  // {zero_offset, multiplier, divisor}
  static const std::vector<DefaultScalingEntry> table = {
      {"EDA", {32767.0, 10.0, 6400.0}},
      {"EMG1", {32767.0, 1297.0, 10000.0}},
      {"EMG2", {32767.0, 1297.0, 10000.0}},
      {"AUX", {32767.0, 1.0, 1.0}},
      // Battery voltage is not offset-corrected.
      {"UBATT", {0.0, 127.0, 10000.0}},
      {"BATT", {0.0, 127.0, 10000.0}},
  };
  return table;
}

// First table entry whose prefix starts the channel name, or null.
static const DefaultScalingEntry* match_default_scaling(const std::string& channel_name) {
  for (const auto& e : default_scaling_table()) {
    if (istarts_with(channel_name, e.prefix)) return &e;
  }
  return nullptr;
}

std::optional<ScalingProfile> find_default_scaling(const std::string& channel_name) {
  const DefaultScalingEntry* e = match_default_scaling(channel_name);
  if (!e) return std::nullopt;
  return e->profile;
}

ScalingResolution resolve_scaling(const ChannelDescriptor& ch) {
  ScalingResolution r;

  if (ch.scale_multiplier != 0 && ch.scale_divisor != 0) {
    r.source = ScalingSource::kHeader;
    r.profile.zero_offset = static_cast<double>(ch.scale_offset);
    r.profile.multiplier = static_cast<double>(ch.scale_multiplier);
    r.profile.divisor = static_cast<double>(ch.scale_divisor);
    return r;
  }

  if (const DefaultScalingEntry* e = match_default_scaling(ch.name)) {
    r.source = ScalingSource::kDefaultTable;
    r.profile = e->profile;
    r.matched_prefix = e->prefix;
  } else {
    r.source = ScalingSource::kPassthrough;
    r.profile = ScalingProfile{0.0, 1.0, 1.0};
  }

  if (r.profile.divisor == 0.0) r.profile.divisor = 1.0;
  return r;
}

const char* scaling_source_name(ScalingSource s) {
  switch (s) {
    case ScalingSource::kHeader: return "header";
    case ScalingSource::kDefaultTable: return "default-table";
    case ScalingSource::kPassthrough: return "passthrough";
  }
  return "header";
}

const std::vector<PhysicalRangeEntry>& physical_range_table() {
  static const std::vector<PhysicalRangeEntry> table = {
      {"ekg", {-50000.0, 50000.0}},
      {"marker", {0.0, 255.0}},
      {"batt", {0.0, 20.0}},
  };
  return table;
}

PhysicalRange physical_range_for(const std::string& channel_name) {
  for (const auto& e : physical_range_table()) {
    if (icontains(channel_name, e.name_substring)) return e.range;
  }
  return PhysicalRange{};
}

} // namespace vpconv
