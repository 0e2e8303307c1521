#pragma once

#include "vpconv/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vpconv {

// Where a channel's scaling came from.
enum class ScalingSource {
  kHeader,       // the channel record's own triple
  kDefaultTable, // substituted by channel-name prefix
  kPassthrough,  // invalid triple and no table entry: {0, 1, 1}
};

struct ScalingResolution {
  ScalingProfile profile;
  ScalingSource source{ScalingSource::kHeader};
  std::string matched_prefix; // set for kDefaultTable
};

struct DefaultScalingEntry {
  std::string prefix; // matched case-insensitively against the channel name start
  ScalingProfile profile;
};

// Built-in fallback scaling for channels whose record carries multiplier 0 or
// divisor 0. Values follow the vendor's toolbox defaults. Entries are tried in
// order; the first prefix match wins.
const std::vector<DefaultScalingEntry>& default_scaling_table();

std::optional<ScalingProfile> find_default_scaling(const std::string& channel_name);

// Resolve the scaling profile for a channel.
//
// The record's triple is used unless its multiplier or divisor is 0, in which
// case the default table is consulted (passthrough if no entry matches).
// The resulting divisor is never 0.
ScalingResolution resolve_scaling(const ChannelDescriptor& ch);

inline double apply_scaling(double raw, const ScalingProfile& p) {
  return (raw - p.zero_offset) * p.multiplier / p.divisor;
}

const char* scaling_source_name(ScalingSource s);

// ---- EDF physical ranges ----

struct PhysicalRange {
  double min{-32768.0};
  double max{32767.0};
};

struct PhysicalRangeEntry {
  std::string name_substring; // matched case-insensitively anywhere in the name
  PhysicalRange range;
};

// Channel-name based physical ranges for the EDF signal headers
// ("ekg", "marker", "batt"). First match wins.
const std::vector<PhysicalRangeEntry>& physical_range_table();

// Range for a channel label; [-32768, 32767] if no table entry matches.
PhysicalRange physical_range_for(const std::string& channel_name);

} // namespace vpconv
