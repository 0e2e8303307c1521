#include "vpconv/scaling.hpp"

#include "test_support.hpp"

#include <cmath>
#include <string>

using namespace vpconv;

static bool near(double a, double b, double tol = 1e-9) {
  return std::fabs(a - b) <= tol;
}

static ChannelDescriptor make_channel(const std::string& name, uint16_t mul, uint16_t offs, uint16_t div) {
  ChannelDescriptor ch;
  ch.name = name;
  ch.sample_byte_width = 2;
  ch.scale_multiplier = mul;
  ch.scale_offset = offs;
  ch.scale_divisor = div;
  return ch;
}

int main() {
  // Valid triple from the record is used as is.
  {
    const ScalingResolution r = resolve_scaling(make_channel("EDA", 5, 10, 2));
    assert(r.source == ScalingSource::kHeader);
    assert(r.profile.zero_offset == 10.0);
    assert(r.profile.multiplier == 5.0);
    assert(r.profile.divisor == 2.0);
    assert(near(apply_scaling(30.0, r.profile), 50.0));
  }

  // Multiplier 0 on an EDA channel -> table values.
  {
    const ScalingResolution r = resolve_scaling(make_channel("EDA", 0, 0, 1));
    assert(r.source == ScalingSource::kDefaultTable);
    assert(r.matched_prefix == "EDA");
    assert(r.profile.zero_offset == 32767.0);
    assert(r.profile.multiplier == 10.0);
    assert(r.profile.divisor == 6400.0);
    assert(near(apply_scaling(32767.0 + 640.0, r.profile), 1.0));
  }

  // Divisor 0 alone also triggers substitution; prefix match is case-insensitive.
  {
    const ScalingResolution r = resolve_scaling(make_channel("emg2x", 3, 0, 0));
    assert(r.source == ScalingSource::kDefaultTable);
    assert(r.profile.multiplier == 1297.0);
    assert(r.profile.divisor == 10000.0);
  }

  // The longer UBATT prefix is listed first.
  {
    const ScalingResolution r = resolve_scaling(make_channel("UBatt", 0, 0, 0));
    assert(r.source == ScalingSource::kDefaultTable);
    assert(r.matched_prefix == "UBATT");
    assert(r.profile.zero_offset == 0.0);
    assert(r.profile.multiplier == 127.0);
  }

  // No table entry -> passthrough, raw integer returned exactly.
  {
    const ScalingResolution r = resolve_scaling(make_channel("Resp", 0, 77, 0));
    assert(r.source == ScalingSource::kPassthrough);
    assert(r.profile.divisor == 1.0);
    assert(apply_scaling(12345.0, r.profile) == 12345.0);
    assert(apply_scaling(0.0, r.profile) == 0.0);
  }

  // Identity triple from the record.
  {
    const ScalingResolution r = resolve_scaling(make_channel("X", 1, 0, 1));
    assert(r.source == ScalingSource::kHeader);
    assert(apply_scaling(65535.0, r.profile) == 65535.0);
  }

  assert(find_default_scaling("AUX3").has_value());
  assert(!find_default_scaling("EKG").has_value());
  assert(default_scaling_table().size() == 6);

  // Physical ranges.
  {
    const PhysicalRange ekg = physical_range_for("EKG");
    assert(ekg.min == -50000.0 && ekg.max == 50000.0);
    const PhysicalRange marker = physical_range_for("Marker");
    assert(marker.min == 0.0 && marker.max == 255.0);
    const PhysicalRange batt = physical_range_for("UBATT");
    assert(batt.min == 0.0 && batt.max == 20.0);
    const PhysicalRange other = physical_range_for("EDA");
    assert(other.min == -32768.0 && other.max == 32767.0);
  }

  assert(std::string(scaling_source_name(ScalingSource::kDefaultTable)) == "default-table");
  return 0;
}
