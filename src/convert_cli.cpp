#include "vpconv/decode_error.hpp"
#include "vpconv/diagnostics.hpp"
#include "vpconv/utils.hpp"
#include "vpconv/varioport_decoder.hpp"
#include "vpconv/varioport_header.hpp"
#include "vpconv/version.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vpconv;

namespace {

struct Args {
  std::string input_path;
  std::string output_edf;
  std::string output_sidecar;
  std::string task{"rest"};
  std::optional<double> base_freq;
  bool legacy_base_rate{false};
  double chunk_seconds{60.0};
  std::optional<double> record_duration_seconds; // unset => chosen from the rate
  bool plain_edf{false};
  bool quiet{false};
};

static void print_help() {
  std::cout
      << "vpconv_convert_cli\n\n"
      << "Convert a Varioport raw recording (e.g. VPDATA.RAW) into an EDF+ file and a JSON sidecar.\n\n"
      << "Usage:\n"
      << "  vpconv_convert_cli --input VPDATA.RAW --output out.edf --sidecar out.json [options]\n"
      << "  vpconv_convert_cli <input> <output_edf> <output_json> [options]\n\n"
      << "Options:\n"
      << "  --task <name>              Task name for the sidecar (leading 'task-' is stripped; default 'rest').\n"
      << "  --base-freq <Hz>           Override the base scan rate stored in the file header.\n"
      << "  --legacy-base-rate         Use the fixed " << kLegacyForcedBaseRateHz
      << " Hz base rate some recorders need.\n"
      << "  --chunk-seconds <sec>      Read chunk duration for interleaved files (default 60).\n"
      << "  --record-duration <sec>    EDF datarecord duration in seconds (default: shortest whole\n"
      << "                             second that holds an integral number of samples).\n"
      << "  --plain-edf                Write classic EDF (no EDF+ annotations channel).\n"
      << "  --quiet                    Only print warnings and errors.\n"
      << "  --version                  Print the version and exit.\n"
      << "  -h, --help                 Show this help.\n\n"
      << "Exit codes:\n"
      << "  0  success\n"
      << "  2  conversion failed (no output left behind)\n"
      << "  3  EDF written, but the sidecar could not be written\n";
}

static bool is_flag(const std::string& a, const char* s1, const char* s2 = nullptr) {
  if (a == s1) return true;
  if (s2 && a == s2) return true;
  return false;
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

} // namespace

int main(int argc, char** argv) {
  try {
    Args args;

    if (argc <= 1) {
      print_help();
      return 1;
    }

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];

      if (is_flag(a, "-h", "--help")) {
        print_help();
        return 0;
      } else if (a == "--version") {
        std::cout << software_tag() << "\n";
        return 0;
      } else if (is_flag(a, "--input", "-i")) {
        args.input_path = require_value(i, argc, argv, a);
      } else if (is_flag(a, "--output", "-o")) {
        args.output_edf = require_value(i, argc, argv, a);
      } else if (a == "--sidecar") {
        args.output_sidecar = require_value(i, argc, argv, a);
      } else if (a == "--task") {
        args.task = require_value(i, argc, argv, a);
      } else if (a == "--base-freq") {
        args.base_freq = to_double(require_value(i, argc, argv, a));
      } else if (a == "--legacy-base-rate") {
        args.legacy_base_rate = true;
      } else if (a == "--chunk-seconds") {
        args.chunk_seconds = to_double(require_value(i, argc, argv, a));
      } else if (a == "--record-duration") {
        args.record_duration_seconds = to_double(require_value(i, argc, argv, a));
      } else if (a == "--plain-edf") {
        args.plain_edf = true;
      } else if (a == "--quiet") {
        args.quiet = true;
      } else if (!a.empty() && a[0] == '-') {
        throw std::runtime_error("Unknown argument: " + a);
      } else {
        positional.push_back(a);
      }
    }

    if (!positional.empty()) {
      if (positional.size() != 3) {
        throw std::runtime_error("Expected 3 positional arguments: <input> <output_edf> <output_json>");
      }
      if (args.input_path.empty()) args.input_path = positional[0];
      if (args.output_edf.empty()) args.output_edf = positional[1];
      if (args.output_sidecar.empty()) args.output_sidecar = positional[2];
    }

    if (args.input_path.empty() || args.output_edf.empty() || args.output_sidecar.empty()) {
      throw std::runtime_error("Missing required arguments. Need --input, --output and --sidecar.");
    }
    if (args.base_freq && args.legacy_base_rate) {
      throw std::runtime_error("--base-freq and --legacy-base-rate are mutually exclusive");
    }
    if (args.base_freq && !(*args.base_freq > 0.0)) {
      throw std::runtime_error("--base-freq must be > 0");
    }
    if (!(args.chunk_seconds > 0.0)) throw std::runtime_error("--chunk-seconds must be > 0");
    if (args.record_duration_seconds && !(*args.record_duration_seconds > 0.0)) {
      throw std::runtime_error("--record-duration must be > 0");
    }

    std::optional<double> override_hz = args.base_freq;
    if (args.legacy_base_rate) override_hz = kLegacyForcedBaseRateHz;

    DecodeOptions opts;
    opts.chunk_duration_seconds = args.chunk_seconds;
    if (args.record_duration_seconds) opts.edf.record_duration_seconds = *args.record_duration_seconds;
    opts.edf.write_edfplus = !args.plain_edf;

    const bool quiet = args.quiet;
    DiagnosticLog log([quiet](DiagnosticSeverity sev, const std::string& msg) {
      if (sev == DiagnosticSeverity::kInfo) {
        if (!quiet) std::cout << format_diagnostic(sev, msg) << "\n";
      } else {
        std::cerr << format_diagnostic(sev, msg) << "\n";
      }
    });

    const DecodeResult res = decode_varioport(args.input_path, args.output_edf, args.output_sidecar,
                                              args.task, override_hz, opts, &log);

    if (!quiet) {
      std::cout << "Converted " << res.selection.active.size() << " channel(s), "
                << res.samples_per_channel << " samples each at " << json_number(res.effective_rate_hz)
                << " Hz (" << res.layout << " layout)\n";
    }
    if (!res.sidecar_written) return 3;
    return 0;
  } catch (const DecodeError& e) {
    std::cerr << "Error [" << decode_error_code_name(e.code()) << "]: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
