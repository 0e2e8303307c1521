#pragma once

#include "vpconv/types.hpp"

#include <string>
#include <vector>

namespace vpconv {

// Metadata written next to the converted EDF file.
struct OutputSidecar {
  std::string task_name;
  double sampling_frequency_hz{0.0};
  std::vector<std::string> channel_labels;
  std::string manufacturer{"Becker Meditec"};
  std::string model_name{"Varioport"};
  std::string note;
};

// "task-rest" -> "rest"; other names are returned unchanged.
std::string strip_task_prefix(const std::string& task_name);

// Human-readable provenance of the base scan rate, e.g.
//   "Converted from VPDATA.RAW. Base rate 512 Hz (override; file header declares 150 Hz).
//    Effective sampling rate 256 Hz."
std::string describe_base_rate(const FileHeader& header, double effective_rate_hz,
                               const std::string& source_name);

// Render the sidecar JSON document:
//   TaskName, SamplingFrequency, StartTime (always 0), Columns,
//   Manufacturer, ManufacturersModelName, Note
std::string render_sidecar_json(const OutputSidecar& sidecar);

// Write the sidecar atomically (temp file + rename).
// Throws DecodeError(kSidecarWriteFailed) on failure.
void write_sidecar_json(const std::string& path, const OutputSidecar& sidecar);

} // namespace vpconv
