#include "vpconv/edf_writer.hpp"

#include "vpconv/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <locale>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vpconv {

static std::string fit_field(const std::string& s, size_t width) {
  std::string out = s;
  if (out.size() > width) out = out.substr(0, width);
  if (out.size() < width) out.append(width - out.size(), ' ');
  return out;
}

static void write_field(std::ofstream& f, const std::string& s, size_t width) {
  const std::string out = fit_field(s, width);
  f.write(out.data(), static_cast<std::streamsize>(out.size()));
  if (!f) throw std::runtime_error("EDFWriter: failed writing header field");
}

static std::string format_double_fixed_width(double v, size_t width) {
  // EDF header numeric fields are ASCII. We try a few fixed precisions and fall back to integer.
  for (int prec = 6; prec >= 0; --prec) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.setf(std::ios::fixed);
    oss << std::setprecision(prec) << v;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos) {
      while (!s.empty() && s.back() == '0') s.pop_back();
      if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s.size() <= width) return s;
  }
  {
    long long iv = static_cast<long long>(std::llround(v));
    std::string s = std::to_string(iv);
    if (s.size() <= width) return s;
  }
  std::string s = std::to_string(static_cast<long long>(std::llround(v)));
  return s.substr(0, width);
}

static void put_i16_le(std::vector<char>* buf, int16_t v) {
  buf->push_back(static_cast<char>(v & 0xFF));
  buf->push_back(static_cast<char>((static_cast<uint16_t>(v) >> 8) & 0xFF));
}

// TAL onset, e.g. "+0", "+1.5". Always carries a sign.
static std::string format_tal_onset(double onset_sec) {
  if (!std::isfinite(onset_sec) || std::fabs(onset_sec) < 1e-12) onset_sec = 0.0;

  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss.setf(std::ios::fixed);
  oss << std::setprecision(6) << onset_sec;
  std::string s = oss.str();
  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  if (!s.empty() && s.front() != '-') s.insert(s.begin(), '+');
  return s;
}

// Timekeeping TAL for one datarecord, padded with 0x00 to nbytes.
static std::vector<uint8_t> build_timekeeping_tal(double record_onset_sec, size_t nbytes) {
  const std::string onset = format_tal_onset(record_onset_sec);
  if (onset.size() + 2 > nbytes) {
    throw std::runtime_error(
        "EDFWriter: annotation record overflow (increase annotation_samples_per_record)");
  }
  std::vector<uint8_t> out(nbytes, 0);
  size_t pos = 0;
  for (unsigned char uc : onset) out[pos++] = static_cast<uint8_t>(uc);
  out[pos++] = 0x14;
  out[pos++] = 0x14;
  return out;
}

std::optional<double> pick_record_duration(double fs, int max_seconds) {
  if (!(fs > 0.0) || !std::isfinite(fs)) return std::nullopt;
  for (int d = 1; d <= max_seconds; ++d) {
    const double spr = fs * static_cast<double>(d);
    if (std::fabs(spr - std::round(spr)) <= 1e-6) return static_cast<double>(d);
  }
  return std::nullopt;
}

EDFStreamWriter::~EDFStreamWriter() {
  if (open_) abandon();
}

void EDFStreamWriter::open(const std::string& path,
                           const std::vector<EDFSignalHeader>& signals,
                           const EDFWriterOptions& opts) {
  if (open_) throw std::runtime_error("EDFWriter: already open");
  if (signals.empty()) throw std::runtime_error("EDFWriter: no signals");

  const double fs = signals.front().sample_rate_hz;
  if (!(fs > 0.0) || !std::isfinite(fs)) {
    throw std::runtime_error("EDFWriter: invalid sampling rate");
  }
  for (const auto& s : signals) {
    if (std::fabs(s.sample_rate_hz - fs) > 1e-9) {
      throw std::runtime_error("EDFWriter: all signals must share one sampling rate ('" + s.label + "')");
    }
    if (!(s.physical_max > s.physical_min)) {
      throw std::runtime_error("EDFWriter: physical_max must exceed physical_min ('" + s.label + "')");
    }
    if (!(s.digital_max > s.digital_min) || s.digital_min < -32768 || s.digital_max > 32767) {
      throw std::runtime_error("EDFWriter: invalid digital range ('" + s.label + "')");
    }
  }

  double record_duration = opts.record_duration_seconds;
  if (record_duration == 0.0) {
    const std::optional<double> d = pick_record_duration(fs);
    if (!d) {
      throw std::runtime_error("EDFWriter: no record duration of 1.." +
                               std::to_string(kMaxAutoRecordDurationSeconds) +
                               " s holds a whole number of samples (fs=" + format_double_fixed_width(fs, 16) +
                               " Hz)");
    }
    record_duration = *d;
  }
  if (!(record_duration > 0.0) || !std::isfinite(record_duration)) {
    throw std::runtime_error("EDFWriter: record_duration_seconds must be > 0 for streaming");
  }
  const double spr_d = fs * record_duration;
  const long long spr = std::llround(spr_d);
  if (std::fabs(spr_d - static_cast<double>(spr)) > 1e-6) {
    throw std::runtime_error(
        "EDFWriter: sampling rate * record_duration_seconds must be an integer (fs=" +
        format_double_fixed_width(fs, 16) + " Hz)");
  }
  if (spr <= 0 || spr > std::numeric_limits<int>::max()) {
    throw std::runtime_error("EDFWriter: invalid samples_per_record");
  }

  edfplus_ = opts.write_edfplus;
  ann_spr_ = 0;
  if (edfplus_) {
    // Timekeeping TAL: sign, up to ~10 onset digits, decimals, two 0x14.
    const int kAutoAnnSpr = 16;
    ann_spr_ = opts.annotation_samples_per_record > 0 ? opts.annotation_samples_per_record : kAutoAnnSpr;
  }

  const int ns_data = static_cast<int>(signals.size());
  const int ns_total = ns_data + (edfplus_ ? 1 : 0);
  const int header_bytes = 256 + ns_total * 256;

  scale_.assign(signals.size(), 1.0);
  offset_.assign(signals.size(), 0.0);
  for (size_t ch = 0; ch < signals.size(); ++ch) {
    const auto& s = signals[ch];
    const double dig_range = static_cast<double>(s.digital_max) - static_cast<double>(s.digital_min);
    scale_[ch] = (s.physical_max - s.physical_min) / dig_range;
    offset_[ch] = s.physical_min - static_cast<double>(s.digital_min) * scale_[ch];
  }

  // Allocate the record buffer before the file exists so a failure here
  // leaves nothing on disk.
  pending_.assign(signals.size(), std::vector<double>(static_cast<size_t>(spr), 0.0));

  f_.open(path, std::ios::binary | std::ios::trunc);
  if (!f_) {
    pending_.clear();
    throw std::runtime_error("EDFWriter: failed to open for writing: " + path);
  }
  path_ = path;
  open_ = true;

  std::vector<std::string> labels;
  std::vector<std::string> dims;
  std::vector<std::string> transducers;
  std::vector<std::string> prefilters;
  std::vector<std::string> pmins, pmaxs, dmins, dmaxs, sprs;
  for (const auto& s : signals) {
    labels.push_back(s.label);
    dims.push_back(s.physical_dimension);
    transducers.push_back(s.transducer);
    prefilters.push_back(s.prefilter);
    pmins.push_back(format_double_fixed_width(s.physical_min, 8));
    pmaxs.push_back(format_double_fixed_width(s.physical_max, 8));
    dmins.push_back(std::to_string(s.digital_min));
    dmaxs.push_back(std::to_string(s.digital_max));
    sprs.push_back(std::to_string(spr));
  }
  if (edfplus_) {
    labels.emplace_back("EDF Annotations");
    dims.emplace_back("");
    transducers.emplace_back("");
    prefilters.emplace_back("");
    pmins.emplace_back("-1");
    pmaxs.emplace_back("1");
    dmins.emplace_back("-32768");
    dmaxs.emplace_back("32767");
    sprs.push_back(std::to_string(ann_spr_));
  }

  try {
    // --- Fixed header (256 bytes) ---
    write_field(f_, "0", 8);
    write_field(f_, opts.patient_id, 80);
    write_field(f_, opts.recording_id, 80);
    write_field(f_, opts.start_date_dd_mm_yy, 8);
    write_field(f_, opts.start_time_hh_mm_ss, 8);
    write_field(f_, std::to_string(header_bytes), 8);
    write_field(f_, edfplus_ ? "EDF+C" : "", 44);
    write_field(f_, "-1", 8); // patched by close()
    write_field(f_, format_double_fixed_width(record_duration, 8), 8);
    write_field(f_, std::to_string(ns_total), 4);

    // --- Per-signal header (ns_total * 256 bytes), stored field-by-field ---
    for (int s = 0; s < ns_total; ++s) write_field(f_, labels[static_cast<size_t>(s)], 16);
    for (int s = 0; s < ns_total; ++s) write_field(f_, transducers[static_cast<size_t>(s)], 80);
    for (int s = 0; s < ns_total; ++s) write_field(f_, dims[static_cast<size_t>(s)], 8);
    for (int s = 0; s < ns_total; ++s) write_field(f_, pmins[static_cast<size_t>(s)], 8);
    for (int s = 0; s < ns_total; ++s) write_field(f_, pmaxs[static_cast<size_t>(s)], 8);
    for (int s = 0; s < ns_total; ++s) write_field(f_, dmins[static_cast<size_t>(s)], 8);
    for (int s = 0; s < ns_total; ++s) write_field(f_, dmaxs[static_cast<size_t>(s)], 8);
    for (int s = 0; s < ns_total; ++s) write_field(f_, prefilters[static_cast<size_t>(s)], 80);
    for (int s = 0; s < ns_total; ++s) write_field(f_, sprs[static_cast<size_t>(s)], 8);
    for (int s = 0; s < ns_total; ++s) write_field(f_, "", 32);
  } catch (const std::exception&) {
    abandon();
    remove_file_quiet(path);
    throw;
  }

  signals_ = signals;
  record_duration_ = record_duration;
  spr_ = static_cast<int>(spr);
  fill_ = 0;
  samples_written_ = 0;
  records_written_ = 0;
  tail_padding_ = 0;
}

void EDFStreamWriter::write_block(const SampleBlock& block) {
  if (!open_) throw std::runtime_error("EDFWriter: write on a closed writer");
  if (block.size() != signals_.size()) {
    throw std::runtime_error("EDFWriter: block has " + std::to_string(block.size()) +
                             " channels, expected " + std::to_string(signals_.size()));
  }
  const size_t n = block.front().size();
  for (const auto& x : block) {
    if (x.size() != n) throw std::runtime_error("EDFWriter: all channels in a block must have the same length");
  }

  const size_t spr = static_cast<size_t>(spr_);
  size_t i = 0;
  while (i < n) {
    const size_t take = std::min(spr - fill_, n - i);
    for (size_t ch = 0; ch < block.size(); ++ch) {
      std::copy(block[ch].begin() + static_cast<std::ptrdiff_t>(i),
                block[ch].begin() + static_cast<std::ptrdiff_t>(i + take),
                pending_[ch].begin() + static_cast<std::ptrdiff_t>(fill_));
    }
    fill_ += take;
    i += take;
    if (fill_ == spr) flush_record();
  }
  samples_written_ += n;
}

void EDFStreamWriter::flush_record() {
  const size_t spr = static_cast<size_t>(spr_);

  std::vector<char> buf;
  buf.reserve((signals_.size() * spr + static_cast<size_t>(ann_spr_)) * 2);

  for (size_t ch = 0; ch < signals_.size(); ++ch) {
    const auto& s = signals_[ch];
    for (size_t i = 0; i < spr; ++i) {
      double phys = (i < fill_) ? pending_[ch][i] : 0.0;
      if (!std::isfinite(phys)) phys = 0.0;
      const double d = (phys - offset_[ch]) / scale_[ch];
      long long di = std::llround(d);
      if (di < s.digital_min) di = s.digital_min;
      if (di > s.digital_max) di = s.digital_max;
      put_i16_le(&buf, static_cast<int16_t>(di));
    }
  }

  // EDF+ annotation signal comes last. TAL bytes are stored as raw bytes.
  if (edfplus_) {
    const double t0 = static_cast<double>(records_written_) * record_duration_;
    const std::vector<uint8_t> tal = build_timekeeping_tal(t0, static_cast<size_t>(ann_spr_) * 2);
    for (uint8_t b : tal) buf.push_back(static_cast<char>(b));
  }

  f_.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  if (!f_) throw std::runtime_error("EDFWriter: failed writing sample data to " + path_);

  ++records_written_;
  fill_ = 0;
}

void EDFStreamWriter::close() {
  if (!open_) return;

  if (fill_ > 0) {
    tail_padding_ = static_cast<size_t>(spr_) - fill_;
    flush_record();
  }

  f_.seekp(kEdfNumRecordsFieldOffset, std::ios::beg);
  write_field(f_, std::to_string(records_written_), 8);
  f_.flush();
  f_.close();
  open_ = false;
  if (f_.fail()) throw std::runtime_error("EDFWriter: failed to finalize " + path_);
}

void EDFStreamWriter::abandon() {
  if (f_.is_open()) f_.close();
  f_.clear();
  open_ = false;
}

} // namespace vpconv
