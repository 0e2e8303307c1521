#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vpconv {

struct EDFSignalInfo {
  std::string label;
  std::string transducer;
  std::string physical_dimension;
  double physical_min{0.0};
  double physical_max{0.0};
  int digital_min{0};
  int digital_max{0};
  int samples_per_record{0};
  bool is_annotation{false};
};

struct EDFHeaderInfo {
  std::string patient_id;
  std::string recording_id;
  std::string reserved; // "EDF+C" for continuous EDF+
  int header_bytes{0};
  int num_records{0};   // as stored; -1 if the writer never finalized it
  double record_duration_seconds{0.0};
  std::vector<EDFSignalInfo> signals;

  bool is_edfplus() const { return reserved.rfind("EDF+", 0) == 0; }
};

// Data signals of an EDF file in physical units, plus the onset of each
// datarecord taken from the EDF+ timekeeping annotations (empty for plain EDF).
struct EDFRecording {
  EDFHeaderInfo header;
  std::vector<std::string> labels;
  std::vector<std::string> units;
  double fs_hz{0.0};
  std::vector<std::vector<double>> data; // data[ch][sample]
  std::vector<double> record_onsets_sec;

  size_t n_samples() const { return data.empty() ? 0 : data[0].size(); }
};

// Minimal EDF/EDF+ (16-bit) reader for the files this project writes.
// - parses all header fields
// - reads data signals into physical units using per-signal scaling
// - reads EDF+ timekeeping TALs ("+<onset>\x14\x14") from the annotation signal
// - infers the record count from the file size if the header says -1
// - requires all data signals to share one sampling rate
class EDFReader {
public:
  EDFHeaderInfo read_header(const std::string& path);
  EDFRecording read(const std::string& path);
};

} // namespace vpconv
