#include "vpconv/varioport_decoder.hpp"

#include "vpconv/byte_io.hpp"
#include "vpconv/decode_error.hpp"
#include "vpconv/layout.hpp"
#include "vpconv/scaling.hpp"
#include "vpconv/sidecar.hpp"
#include "vpconv/utils.hpp"
#include "vpconv/varioport_header.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace vpconv {

namespace {

// Forwards decoded blocks to the EDF writer. Writer failures are reported as
// kChunkWriteFailed so they can be told apart from input read failures.
class EDFBlockSink : public ISampleSink {
public:
  explicit EDFBlockSink(EDFStreamWriter& writer) : writer_(writer) {}

  void write_block(const SampleBlock& block) override {
    try {
      writer_.write_block(block);
    } catch (const std::exception& e) {
      throw DecodeError(DecodeErrorCode::kChunkWriteFailed, e.what());
    }
  }

private:
  EDFStreamWriter& writer_;
};

std::ifstream open_input(const std::string& input_path) {
  std::ifstream in(input_path, std::ios::binary);
  if (!in) {
    throw DecodeError(DecodeErrorCode::kInputOpenFailed, "Failed to open input file: " + input_path);
  }
  return in;
}

std::string base_name(const std::string& path) {
  const std::string name = std::filesystem::path(path).filename().string();
  return name.empty() ? path : name;
}

void report_header(const FileHeader& h, DiagnosticLog& log) {
  std::ostringstream oss;
  oss << "Header: length=" << h.header_length << " channel_table=" << h.channel_table_offset
      << " type=" << static_cast<int>(h.header_type) << " channels=" << static_cast<int>(h.channel_count);
  log.info(oss.str());

  if (h.base_rate_overridden) {
    log.info("Base scan rate " + json_number(h.base_scan_rate_hz) + " Hz (override; file declares " +
             std::to_string(h.file_base_scan_rate) + " Hz)");
  } else {
    log.info("Base scan rate " + std::to_string(h.file_base_scan_rate) + " Hz (from file header)");
  }
}

// Close the writer without finalizing and remove everything this call may
// have produced.
void discard_outputs(EDFStreamWriter& writer, const std::string& edf_path, const std::string& sidecar_path,
                     DiagnosticLog& log) {
  writer.abandon();
  if (!remove_file_quiet(edf_path)) {
    log.warning("Could not remove partial EDF file: " + edf_path);
  }
  if (!sidecar_path.empty() && !remove_file_quiet(sidecar_path)) {
    log.warning("Could not remove sidecar file: " + sidecar_path);
  }
}

} // namespace

EDFWriterOptions default_edf_options() {
  EDFWriterOptions o;
  o.record_duration_seconds = 0.0; // chosen from the stream rate
  o.write_edfplus = true;
  o.patient_id = "X X X X";
  o.recording_id = "Startdate X X X X Varioport";
  return o;
}

std::vector<EDFSignalHeader> build_edf_signal_headers(const std::vector<ChannelDescriptor>& active,
                                                      double stream_rate_hz,
                                                      const std::string& transducer) {
  std::vector<EDFSignalHeader> out;
  out.reserve(active.size());
  for (const auto& ch : active) {
    EDFSignalHeader s;
    s.label = ch.name.empty() ? ("Ch" + std::to_string(ch.index + 1)) : ch.name;
    s.physical_dimension = ch.unit;
    s.transducer = transducer;
    s.sample_rate_hz = stream_rate_hz;
    const PhysicalRange r = physical_range_for(ch.name);
    s.physical_min = r.min;
    s.physical_max = r.max;
    s.digital_min = -32768;
    s.digital_max = 32767;
    out.push_back(s);
  }
  return out;
}

VarioportInfo inspect_varioport(const std::string& input_path, std::optional<double> base_rate_override) {
  std::ifstream in = open_input(input_path);

  VarioportInfo info;
  try {
    info.file_size = stream_size(in);
  } catch (const std::exception& e) {
    throw DecodeError(DecodeErrorCode::kInputReadFailed, e.what());
  }
  info.header = read_varioport_header(in, base_rate_override);
  info.channels = read_channel_table(in, info.header);
  return info;
}

DecodeResult decode_varioport(const std::string& input_path,
                              const std::string& output_edf_path,
                              const std::string& output_sidecar_path,
                              const std::string& task_name,
                              std::optional<double> base_rate_override,
                              const DecodeOptions& opts,
                              DiagnosticLog* log) {
  DiagnosticLog local_log;
  DiagnosticLog& dlog = log ? *log : local_log;

  std::ifstream in = open_input(input_path);

  DecodeResult res;
  res.header = read_varioport_header(in, base_rate_override);
  report_header(res.header, dlog);

  res.channels = read_channel_table(in, res.header);
  res.selection = select_active_channels(res.channels, dlog);
  for (const auto& sk : res.selection.skipped) {
    if (sk.reason == SkipReason::kInactive) {
      dlog.info("Channel '" + sk.descriptor.name + "' is inactive (no data); skipped");
    }
  }

  const std::vector<ChannelDescriptor>& active = res.selection.active;
  const double fs = effective_stream_rate(active);
  if (!(fs > 0.0) || !std::isfinite(fs)) {
    throw DecodeError(DecodeErrorCode::kInvalidSampleRate,
                      "Effective sampling rate is not positive (base scan rate " +
                          json_number(res.header.base_scan_rate_hz) + " Hz)");
  }
  res.effective_rate_hz = fs;
  dlog.info("Effective sampling rate " + json_number(fs) + " Hz for " + std::to_string(active.size()) +
            " active channel(s)");

  const std::vector<EDFSignalHeader> signals = build_edf_signal_headers(active, fs, opts.transducer);
  std::unique_ptr<ILayoutStrategy> layout = make_layout_strategy(res.header, opts.chunk_duration_seconds);
  res.layout = layout->name();

  EDFStreamWriter writer;
  try {
    writer.open(output_edf_path, signals, opts.edf);
  } catch (const std::exception& e) {
    throw DecodeError(DecodeErrorCode::kWaveformWriterInitFailed, e.what());
  }

  try {
    EDFBlockSink sink(writer);
    const LayoutStats stats = layout->decode(in, res.header, active, sink, dlog);
    res.samples_per_channel = stats.samples_per_channel;
    res.padded_samples = stats.padded_samples;
    res.discarded_tail_bytes = stats.discarded_tail_bytes;

    try {
      writer.close();
    } catch (const std::exception& e) {
      throw DecodeError(DecodeErrorCode::kChunkWriteFailed, e.what());
    }
  } catch (const DecodeError&) {
    discard_outputs(writer, output_edf_path, output_sidecar_path, dlog);
    throw;
  } catch (const std::exception& e) {
    discard_outputs(writer, output_edf_path, output_sidecar_path, dlog);
    throw DecodeError(DecodeErrorCode::kInputReadFailed, e.what());
  }

  res.edf_records_written = writer.records_written();
  res.edf_record_duration_seconds = writer.record_duration_seconds();
  res.edf_tail_padding_samples = writer.tail_padding_samples();
  dlog.info("Wrote EDF" + std::string(opts.edf.write_edfplus ? "+" : "") + ": " + output_edf_path + " (" +
            std::to_string(res.edf_records_written) + " records of " +
            json_number(res.edf_record_duration_seconds) + " s)");
  if (res.edf_tail_padding_samples > 0) {
    dlog.info("Last datarecord zero-padded with " + std::to_string(res.edf_tail_padding_samples) +
              " samples per channel");
  }

  OutputSidecar sidecar;
  sidecar.task_name = task_name;
  sidecar.sampling_frequency_hz = fs;
  for (const auto& s : signals) sidecar.channel_labels.push_back(s.label);
  sidecar.manufacturer = opts.manufacturer;
  sidecar.model_name = opts.model_name;
  sidecar.note = describe_base_rate(res.header, fs, base_name(input_path));

  try {
    write_sidecar_json(output_sidecar_path, sidecar);
    res.sidecar_written = true;
    dlog.info("Wrote sidecar: " + output_sidecar_path);
  } catch (const DecodeError& e) {
    // An older sidecar must not end up paired with the new EDF.
    res.sidecar_error = e.what();
    dlog.error(e.what());
    if (file_exists(output_sidecar_path) && !remove_file_quiet(output_sidecar_path)) {
      dlog.warning("Could not remove stale sidecar file: " + output_sidecar_path);
    }
  }

  res.diagnostics = dlog.entries();
  return res;
}

} // namespace vpconv
