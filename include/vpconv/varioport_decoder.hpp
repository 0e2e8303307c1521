#pragma once

#include "vpconv/channel_select.hpp"
#include "vpconv/diagnostics.hpp"
#include "vpconv/edf_writer.hpp"
#include "vpconv/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vpconv {

// Writer options used for converted recordings: EDF+C, the shortest
// whole-second datarecord that fits the stream rate (1 s for integral rates),
// anonymous patient field and "Startdate X X X X Varioport" as recording id.
EDFWriterOptions default_edf_options();

struct DecodeOptions {
  // Duration of one multiplexed read chunk. Memory use of the multiplexed
  // path is proportional to this, not to the file size.
  double chunk_duration_seconds{60.0};

  // EDF datarecord duration, EDF+ on/off, header identification fields.
  EDFWriterOptions edf{default_edf_options()};

  std::string transducer{"Varioport"};
  std::string manufacturer{"Becker Meditec"};
  std::string model_name{"Varioport"};
};

struct DecodeResult {
  FileHeader header;
  std::vector<ChannelDescriptor> channels; // full channel table
  ChannelSelection selection;
  std::string layout; // "demultiplexed" or "multiplexed"

  double effective_rate_hz{0.0};

  // Real (non-padding) samples written per channel. For the demultiplexed
  // layout this is the longest channel; shorter channels are zero-padded and
  // the pad length is listed in padded_samples (same order as
  // selection.active).
  size_t samples_per_channel{0};
  std::vector<size_t> padded_samples;
  size_t discarded_tail_bytes{0};

  int edf_records_written{0};
  double edf_record_duration_seconds{0.0};
  size_t edf_tail_padding_samples{0};

  bool sidecar_written{false};
  std::string sidecar_error;

  std::vector<Diagnostic> diagnostics;
};

// Convert one Varioport recording into an EDF(+) file and a JSON sidecar.
//
// - task_name goes into the sidecar (a leading "task-" is stripped)
// - base_rate_override replaces the file's base scan rate when set; otherwise
//   the file's own value is used
// - parent directories of the outputs must exist
// - progress and problems are reported to `log` (may be null)
//
// Throws DecodeError for fatal problems. After a fatal error no EDF written by
// this call remains at output_edf_path, and no sidecar is written.
// A sidecar failure is NOT fatal: the EDF stays in place, any older file at
// output_sidecar_path is removed and the failure is reported in
// DecodeResult::sidecar_written / sidecar_error.
DecodeResult decode_varioport(const std::string& input_path,
                              const std::string& output_edf_path,
                              const std::string& output_sidecar_path,
                              const std::string& task_name,
                              std::optional<double> base_rate_override = std::nullopt,
                              const DecodeOptions& opts = DecodeOptions{},
                              DiagnosticLog* log = nullptr);

// Parsed header and channel table of a Varioport file (no conversion).
struct VarioportInfo {
  FileHeader header;
  std::vector<ChannelDescriptor> channels;
  uint64_t file_size{0};
};

VarioportInfo inspect_varioport(const std::string& input_path,
                                std::optional<double> base_rate_override = std::nullopt);

// EDF signal headers for the active channels: label/unit from the channel
// record, the shared stream rate, the name-based physical range and the
// full int16 digital range.
std::vector<EDFSignalHeader> build_edf_signal_headers(const std::vector<ChannelDescriptor>& active,
                                                      double stream_rate_hz,
                                                      const std::string& transducer = "Varioport");

} // namespace vpconv
