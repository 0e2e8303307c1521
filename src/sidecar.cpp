#include "vpconv/sidecar.hpp"

#include "vpconv/decode_error.hpp"
#include "vpconv/utils.hpp"

#include <sstream>

namespace vpconv {

std::string strip_task_prefix(const std::string& task_name) {
  const std::string prefix = "task-";
  if (starts_with(task_name, prefix)) return task_name.substr(prefix.size());
  return task_name;
}

std::string describe_base_rate(const FileHeader& header, double effective_rate_hz,
                               const std::string& source_name) {
  std::ostringstream oss;
  oss << "Converted from " << (source_name.empty() ? std::string("Varioport raw file") : source_name) << ". ";
  if (header.base_rate_overridden) {
    oss << "Base rate " << json_number(header.base_scan_rate_hz)
        << " Hz (override; file header declares " << header.file_base_scan_rate << " Hz). ";
  } else {
    oss << "Base rate " << header.file_base_scan_rate << " Hz (from file header). ";
  }
  oss << "Effective sampling rate " << json_number(effective_rate_hz) << " Hz.";
  return oss.str();
}

std::string render_sidecar_json(const OutputSidecar& sidecar) {
  std::ostringstream f;
  f << "{\n";
  f << "    \"TaskName\": \"" << json_escape(strip_task_prefix(sidecar.task_name)) << "\",\n";
  f << "    \"SamplingFrequency\": " << json_number(sidecar.sampling_frequency_hz) << ",\n";
  f << "    \"StartTime\": 0,\n";

  f << "    \"Columns\": [";
  for (size_t i = 0; i < sidecar.channel_labels.size(); ++i) {
    f << (i == 0 ? "\n" : ",\n") << "        \"" << json_escape(sidecar.channel_labels[i]) << "\"";
  }
  f << (sidecar.channel_labels.empty() ? "],\n" : "\n    ],\n");

  f << "    \"Manufacturer\": \"" << json_escape(sidecar.manufacturer) << "\",\n";
  f << "    \"ManufacturersModelName\": \"" << json_escape(sidecar.model_name) << "\",\n";
  f << "    \"Note\": \"" << json_escape(sidecar.note) << "\"\n";
  f << "}\n";
  return f.str();
}

void write_sidecar_json(const std::string& path, const OutputSidecar& sidecar) {
  if (path.empty()) {
    throw DecodeError(DecodeErrorCode::kSidecarWriteFailed, "Sidecar: output path is empty");
  }
  if (!write_text_file_atomic(path, render_sidecar_json(sidecar))) {
    throw DecodeError(DecodeErrorCode::kSidecarWriteFailed, "Sidecar: failed to write " + path);
  }
}

} // namespace vpconv
