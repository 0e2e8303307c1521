#include "vpconv/edf_reader.hpp"

#include "vpconv/utils.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vpconv {

static std::string read_fixed(std::ifstream& f, size_t n) {
  std::string s(n, '\0');
  f.read(&s[0], static_cast<std::streamsize>(n));
  if (!f) throw std::runtime_error("EDF parse error: unexpected EOF");
  return s;
}

static int16_t read_i16_le(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

static EDFHeaderInfo parse_header(std::ifstream& f) {
  EDFHeaderInfo h;

  (void)read_fixed(f, 8); // version
  h.patient_id = trim(read_fixed(f, 80));
  h.recording_id = trim(read_fixed(f, 80));
  (void)read_fixed(f, 8); // start date
  (void)read_fixed(f, 8); // start time
  h.header_bytes = to_int(read_fixed(f, 8));
  h.reserved = trim(read_fixed(f, 44));
  h.num_records = to_int(read_fixed(f, 8));
  h.record_duration_seconds = to_double(read_fixed(f, 8));
  const int ns = to_int(read_fixed(f, 4));
  if (ns <= 0) throw std::runtime_error("EDF: invalid number of signals");

  h.signals.resize(static_cast<size_t>(ns));
  for (auto& s : h.signals) s.label = trim(read_fixed(f, 16));
  for (auto& s : h.signals) s.transducer = trim(read_fixed(f, 80));
  for (auto& s : h.signals) s.physical_dimension = trim(read_fixed(f, 8));
  for (auto& s : h.signals) s.physical_min = to_double(read_fixed(f, 8));
  for (auto& s : h.signals) s.physical_max = to_double(read_fixed(f, 8));
  for (auto& s : h.signals) s.digital_min = to_int(read_fixed(f, 8));
  for (auto& s : h.signals) s.digital_max = to_int(read_fixed(f, 8));
  for (size_t i = 0; i < h.signals.size(); ++i) (void)read_fixed(f, 80); // prefiltering
  for (auto& s : h.signals) s.samples_per_record = to_int(read_fixed(f, 8));
  for (size_t i = 0; i < h.signals.size(); ++i) (void)read_fixed(f, 32);

  for (auto& s : h.signals) {
    s.is_annotation = (to_lower(s.label) == "edf annotations");
    if (s.samples_per_record < 0) throw std::runtime_error("EDF: negative samples_per_record");
  }
  return h;
}

// First TAL onset in an annotation record ("+12.5\x14\x14...").
static bool parse_record_onset(const std::vector<uint8_t>& bytes, double* out) {
  std::string onset;
  for (uint8_t b : bytes) {
    if (b == 0x14 || b == 0x15 || b == 0x00) break;
    onset.push_back(static_cast<char>(b));
  }
  if (onset.empty()) return false;
  try {
    *out = to_double(onset);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

EDFHeaderInfo EDFReader::read_header(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open EDF: " + path);
  return parse_header(f);
}

EDFRecording EDFReader::read(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open EDF: " + path);

  EDFRecording rec;
  rec.header = parse_header(f);
  const EDFHeaderInfo& h = rec.header;

  if (!(h.record_duration_seconds > 0.0)) {
    throw std::runtime_error("EDF: record_duration must be > 0");
  }

  size_t bytes_per_record = 0;
  for (const auto& s : h.signals) bytes_per_record += static_cast<size_t>(s.samples_per_record) * 2u;
  if (bytes_per_record == 0) throw std::runtime_error("EDF: bytes_per_record computed as 0");

  int num_records = h.num_records;
  if (num_records < 0) {
    const std::uintmax_t file_size = std::filesystem::file_size(std::filesystem::u8path(path));
    const std::uintmax_t hdr = static_cast<std::uintmax_t>(h.header_bytes);
    if (file_size < hdr) throw std::runtime_error("EDF: file smaller than header");
    num_records = static_cast<int>((file_size - hdr) / bytes_per_record);
  }

  int data_spr = -1;
  std::vector<int> data_index(h.signals.size(), -1);
  for (size_t i = 0; i < h.signals.size(); ++i) {
    const auto& s = h.signals[i];
    if (s.is_annotation) continue;
    if (data_spr < 0) data_spr = s.samples_per_record;
    if (s.samples_per_record != data_spr) {
      throw std::runtime_error("EDF: mixed sampling rates are not supported");
    }
    data_index[i] = static_cast<int>(rec.labels.size());
    rec.labels.push_back(s.label);
    rec.units.push_back(s.physical_dimension);
  }
  if (rec.labels.empty()) throw std::runtime_error("EDF: no data signals found");
  rec.fs_hz = static_cast<double>(data_spr) / h.record_duration_seconds;

  std::vector<double> scale(h.signals.size(), 1.0);
  std::vector<double> offset(h.signals.size(), 0.0);
  for (size_t i = 0; i < h.signals.size(); ++i) {
    const auto& s = h.signals[i];
    if (s.digital_max == s.digital_min) {
      scale[i] = 0.0;
      offset[i] = 0.0;
    } else {
      scale[i] = (s.physical_max - s.physical_min) / static_cast<double>(s.digital_max - s.digital_min);
      offset[i] = s.physical_min - static_cast<double>(s.digital_min) * scale[i];
    }
  }

  rec.data.resize(rec.labels.size());
  for (auto& x : rec.data) x.reserve(static_cast<size_t>(num_records) * static_cast<size_t>(data_spr));

  f.seekg(static_cast<std::streamoff>(h.header_bytes), std::ios::beg);
  if (!f) throw std::runtime_error("EDF: failed to seek to data");

  std::vector<uint8_t> buf(bytes_per_record);
  for (int r = 0; r < num_records; ++r) {
    f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (!f) throw std::runtime_error("EDF parse error: unexpected EOF while reading record " + std::to_string(r));

    size_t pos = 0;
    for (size_t s = 0; s < h.signals.size(); ++s) {
      const size_t n = static_cast<size_t>(h.signals[s].samples_per_record);
      if (h.signals[s].is_annotation) {
        // TAL bytes are stored as raw bytes (two per sample).
        std::vector<uint8_t> bytes(buf.begin() + static_cast<std::ptrdiff_t>(pos),
                                   buf.begin() + static_cast<std::ptrdiff_t>(pos + n * 2));
        double onset = 0.0;
        if (parse_record_onset(bytes, &onset)) rec.record_onsets_sec.push_back(onset);
      } else {
        auto& out = rec.data[static_cast<size_t>(data_index[s])];
        for (size_t j = 0; j < n; ++j) {
          const int16_t dig = read_i16_le(&buf[pos + j * 2]);
          out.push_back(static_cast<double>(dig) * scale[s] + offset[s]);
        }
      }
      pos += n * 2;
    }
  }

  return rec;
}

} // namespace vpconv
