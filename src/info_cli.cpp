#include "vpconv/channel_select.hpp"
#include "vpconv/decode_error.hpp"
#include "vpconv/diagnostics.hpp"
#include "vpconv/edf_reader.hpp"
#include "vpconv/scaling.hpp"
#include "vpconv/utils.hpp"
#include "vpconv/varioport_decoder.hpp"
#include "vpconv/varioport_header.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vpconv;

namespace {

struct Args {
  std::string input_path;
  std::string edf_path;
  std::optional<double> base_freq;
  bool json{false};
};

static void print_help() {
  std::cout
    << "vpconv_info_cli\n\n"
    << "Print the header and channel table of a Varioport raw file without converting it,\n"
    << "or summarise an EDF file written by vpconv_convert_cli.\n\n"
    << "Usage:\n"
    << "  vpconv_info_cli --input VPDATA.RAW\n"
    << "  vpconv_info_cli --input VPDATA.RAW --base-freq 512 --json\n"
    << "  vpconv_info_cli --edf out.edf\n\n"
    << "Options:\n"
    << "  --input PATH             Varioport raw file\n"
    << "  --base-freq HZ           Override the base scan rate stored in the header\n"
    << "  --legacy-base-rate       Same as --base-freq " << kLegacyForcedBaseRateHz << "\n"
    << "  --edf PATH               Summarise an EDF/EDF+ file instead\n"
    << "  --json                   Output JSON (useful for scripts)\n"
    << "  -h, --help               Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--edf" && i + 1 < argc) {
      a.edf_path = argv[++i];
    } else if (arg == "--base-freq" && i + 1 < argc) {
      a.base_freq = to_double(argv[++i]);
    } else if (arg == "--legacy-base-rate") {
      a.base_freq = kLegacyForcedBaseRateHz;
    } else if (arg == "--json") {
      a.json = true;
    } else if (!arg.empty() && arg[0] != '-' && a.input_path.empty()) {
      a.input_path = arg;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

struct ChannelRow {
  ChannelDescriptor ch;
  ScalingResolution scaling;
  bool active{false};
  std::string status; // "active", "active (marker)", or the skip reason
};

static std::vector<ChannelRow> build_rows(const std::vector<ChannelDescriptor>& channels,
                                          const ChannelSelection& sel) {
  std::vector<ChannelRow> rows;
  rows.reserve(channels.size());
  for (const auto& ch : channels) {
    ChannelRow r;
    r.ch = ch;
    r.scaling = resolve_scaling(ch);
    r.status = "inactive";
    for (const auto& a : sel.active) {
      if (a.index == ch.index) {
        r.active = true;
        r.status = (ch.data_byte_length == 0 && is_marker_channel_name(ch.name)) ? "active (marker)" : "active";
      }
    }
    for (const auto& s : sel.skipped) {
      if (s.descriptor.index == ch.index) r.status = skip_reason_name(s.reason);
    }
    rows.push_back(r);
  }
  return rows;
}

static int print_varioport(const Args& args) {
  const VarioportInfo info = inspect_varioport(args.input_path, args.base_freq);
  const FileHeader& h = info.header;

  DiagnosticLog log;
  ChannelSelection sel;
  bool any_active = true;
  try {
    sel = select_active_channels(info.channels, log);
  } catch (const DecodeError& e) {
    if (e.code() != DecodeErrorCode::kNoActiveChannels) throw;
    any_active = false;
  }
  const double fs = any_active ? effective_stream_rate(sel.active) : 0.0;
  const std::vector<ChannelRow> rows = build_rows(info.channels, sel);

  if (args.json) {
    std::ostringstream o;
    o << "{\n";
    o << "  \"file\": \"" << json_escape(args.input_path) << "\",\n";
    o << "  \"file_size\": " << info.file_size << ",\n";
    o << "  \"header_length\": " << h.header_length << ",\n";
    o << "  \"channel_table_offset\": " << h.channel_table_offset << ",\n";
    o << "  \"header_type\": " << static_cast<int>(h.header_type) << ",\n";
    o << "  \"layout\": \"" << (h.is_demultiplexed() ? "demultiplexed" : "multiplexed") << "\",\n";
    o << "  \"channel_count\": " << static_cast<int>(h.channel_count) << ",\n";
    o << "  \"file_base_scan_rate\": " << h.file_base_scan_rate << ",\n";
    o << "  \"base_scan_rate_hz\": " << json_number(h.base_scan_rate_hz) << ",\n";
    o << "  \"base_rate_overridden\": " << (h.base_rate_overridden ? "true" : "false") << ",\n";
    o << "  \"effective_rate_hz\": " << json_number(fs) << ",\n";
    o << "  \"block_size\": " << (any_active ? multiplexed_block_size(sel.active) : 0) << ",\n";
    o << "  \"channels\": [";
    for (size_t i = 0; i < rows.size(); ++i) {
      const ChannelRow& r = rows[i];
      o << (i == 0 ? "\n" : ",\n");
      o << "    {\"index\": " << r.ch.index
        << ", \"name\": \"" << json_escape(r.ch.name) << "\""
        << ", \"unit\": \"" << json_escape(r.ch.unit) << "\""
        << ", \"width\": " << r.ch.sample_byte_width
        << ", \"scan_factor\": " << static_cast<int>(r.ch.scan_factor)
        << ", \"stream_factor\": " << static_cast<int>(r.ch.stream_factor)
        << ", \"mul\": " << r.ch.scale_multiplier
        << ", \"offset\": " << r.ch.scale_offset
        << ", \"div\": " << r.ch.scale_divisor
        << ", \"scaling\": \"" << scaling_source_name(r.scaling.source) << "\""
        << ", \"data_offset\": " << r.ch.data_byte_offset
        << ", \"data_length\": " << r.ch.data_byte_length
        << ", \"rate_hz\": " << json_number(r.ch.sample_rate_hz)
        << ", \"active\": " << (r.active ? "true" : "false")
        << ", \"status\": \"" << json_escape(r.status) << "\"}";
    }
    o << (rows.empty() ? "]\n" : "\n  ]\n");
    o << "}\n";
    std::cout << o.str();
  } else {
    std::cout << "File: " << args.input_path << " (" << info.file_size << " bytes)\n";
    std::cout << "Header type: " << static_cast<int>(h.header_type)
              << (h.is_demultiplexed() ? " (demultiplexed)" : " (multiplexed)") << "\n";
    std::cout << "Header length: " << h.header_length << "\n";
    std::cout << "Channel table offset: " << h.channel_table_offset << "\n";
    std::cout << "Channels: " << static_cast<int>(h.channel_count) << "\n";
    std::cout << "Base scan rate: " << json_number(h.base_scan_rate_hz) << " Hz";
    if (h.base_rate_overridden) std::cout << " (override; file declares " << h.file_base_scan_rate << " Hz)";
    std::cout << "\n";
    std::cout << "Effective sampling rate: " << json_number(fs) << " Hz\n\n";

    std::cout << std::left
              << std::setw(4) << "#" << std::setw(8) << "Name" << std::setw(6) << "Unit"
              << std::setw(3) << "W" << std::setw(5) << "Scan" << std::setw(5) << "Strm"
              << std::setw(20) << "mul/offs/div" << std::setw(14) << "scaling"
              << std::setw(11) << "offset" << std::setw(11) << "length"
              << std::setw(10) << "rate" << "status\n";
    for (const auto& r : rows) {
      std::ostringstream triple;
      triple << r.ch.scale_multiplier << "/" << r.ch.scale_offset << "/" << r.ch.scale_divisor;
      std::string scaling = scaling_source_name(r.scaling.source);
      if (r.scaling.source == ScalingSource::kDefaultTable) scaling += ":" + r.scaling.matched_prefix;
      std::cout << std::left
                << std::setw(4) << r.ch.index << std::setw(8) << r.ch.name << std::setw(6) << r.ch.unit
                << std::setw(3) << r.ch.sample_byte_width
                << std::setw(5) << static_cast<int>(r.ch.scan_factor)
                << std::setw(5) << static_cast<int>(r.ch.stream_factor)
                << std::setw(20) << triple.str() << std::setw(14) << scaling
                << std::setw(11) << r.ch.data_byte_offset << std::setw(11) << r.ch.data_byte_length
                << std::setw(10) << json_number(r.ch.sample_rate_hz) << r.status << "\n";
    }
    if (!any_active) std::cout << "\nNo decodable channels.\n";
  }

  for (const auto& d : log.entries()) {
    if (d.severity != DiagnosticSeverity::kInfo) std::cerr << format_diagnostic(d.severity, d.message) << "\n";
  }
  return 0;
}

static int print_edf(const Args& args) {
  EDFReader reader;
  const EDFRecording rec = reader.read(args.edf_path);
  const EDFHeaderInfo& h = rec.header;

  std::vector<const EDFSignalInfo*> data_signals;
  for (const auto& s : h.signals) {
    if (!s.is_annotation) data_signals.push_back(&s);
  }

  if (args.json) {
    std::ostringstream o;
    o << "{\n";
    o << "  \"file\": \"" << json_escape(args.edf_path) << "\",\n";
    o << "  \"edfplus\": " << (h.is_edfplus() ? "true" : "false") << ",\n";
    o << "  \"patient_id\": \"" << json_escape(h.patient_id) << "\",\n";
    o << "  \"recording_id\": \"" << json_escape(h.recording_id) << "\",\n";
    o << "  \"num_records\": " << h.num_records << ",\n";
    o << "  \"record_duration_seconds\": " << json_number(h.record_duration_seconds) << ",\n";
    o << "  \"fs_hz\": " << json_number(rec.fs_hz) << ",\n";
    o << "  \"n_samples\": " << rec.n_samples() << ",\n";
    o << "  \"signals\": [";
    for (size_t i = 0; i < data_signals.size(); ++i) {
      const EDFSignalInfo& s = *data_signals[i];
      o << (i == 0 ? "\n" : ",\n");
      o << "    {\"label\": \"" << json_escape(s.label) << "\""
        << ", \"unit\": \"" << json_escape(s.physical_dimension) << "\""
        << ", \"physical_min\": " << json_number(s.physical_min)
        << ", \"physical_max\": " << json_number(s.physical_max) << "}";
    }
    o << (data_signals.empty() ? "]\n" : "\n  ]\n");
    o << "}\n";
    std::cout << o.str();
    return 0;
  }

  std::cout << "File: " << args.edf_path << (h.is_edfplus() ? " (EDF+)" : " (EDF)") << "\n";
  std::cout << "Patient: " << h.patient_id << "\n";
  std::cout << "Recording: " << h.recording_id << "\n";
  std::cout << "Records: " << h.num_records << " x " << json_number(h.record_duration_seconds) << " s\n";
  std::cout << "Sampling rate: " << json_number(rec.fs_hz) << " Hz\n";
  std::cout << "Samples per channel: " << rec.n_samples() << "\n\n";
  for (const auto* s : data_signals) {
    std::cout << "  " << std::left << std::setw(17) << s->label << std::setw(9) << s->physical_dimension
              << "[" << json_number(s->physical_min) << ", " << json_number(s->physical_max) << "]\n";
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (!args.edf_path.empty()) return print_edf(args);
    if (args.input_path.empty()) {
      print_help();
      return 1;
    }
    return print_varioport(args);
  } catch (const DecodeError& e) {
    std::cerr << "Error [" << decode_error_code_name(e.code()) << "]: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
