#pragma once

#include "vpconv/types.hpp"

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace vpconv {

// Per-signal EDF header fields supplied by the caller.
struct EDFSignalHeader {
  std::string label;              // 16 chars
  std::string physical_dimension; // 8 chars, e.g. "uV", "mV"
  std::string transducer;         // 80 chars
  std::string prefilter;          // 80 chars
  double sample_rate_hz{0.0};
  double physical_min{-32768.0};
  double physical_max{32767.0};
  int digital_min{-32768};
  int digital_max{32767};
};

// Upper bound for automatically chosen datarecord durations.
constexpr int kMaxAutoRecordDurationSeconds = 60;

// Streaming EDF (16-bit) writer with optional EDF+ timekeeping annotations.
//
// Samples are supplied in physical units as blocks of equal-length channel
// vectors and are converted to int16 using each signal's physical/digital
// range (values outside the physical range are clipped).
//
// Data are written in fixed-duration datarecords as soon as a record is
// complete, so memory use is one datarecord regardless of recording length.
// close() zero-pads the final partial record and rewrites the header's
// record count with the number of records actually written.
//
// EDF vs EDF+:
// - With write_edfplus=true the reserved field is "EDF+C" and an
//   "EDF Annotations" signal is appended. Each record's annotation area holds
//   only the timekeeping TAL ("+<onset>\x14\x14").
// - Otherwise a plain EDF file is written.
//
// Limitations:
// - all signals must share one sampling rate
// - sample_rate_hz * record_duration_seconds must be (close to) an integer
struct EDFWriterOptions {
  // 0 => the shortest whole-second duration for which the rate gives an
  // integral number of samples per record (see pick_record_duration).
  double record_duration_seconds{1.0};

  // Header identification fields (ASCII, space-padded). The defaults are the
  // EDF+ "unknown" forms of the patient and recording subfields.
  std::string patient_id{"X X X X"};
  std::string recording_id{"Startdate X X X X"};

  // EDF expects "dd.mm.yy" and "hh.mm.ss". Defaults are arbitrary but valid.
  std::string start_date_dd_mm_yy{"01.01.85"};
  std::string start_time_hh_mm_ss{"00.00.00"};

  bool write_edfplus{true};

  // Annotation samples (2 TAL bytes each) per datarecord; 0 => auto.
  int annotation_samples_per_record{0};
};

// Shortest d in {1, 2, ..., max_seconds} with fs * d integral (within 1e-6).
// Returns std::nullopt if there is none, e.g. for fs = 100/7 Hz.
std::optional<double> pick_record_duration(double fs, int max_seconds = kMaxAutoRecordDurationSeconds);

class EDFStreamWriter {
public:
  EDFStreamWriter() = default;
  ~EDFStreamWriter();

  EDFStreamWriter(const EDFStreamWriter&) = delete;
  EDFStreamWriter& operator=(const EDFStreamWriter&) = delete;

  // Validate the signal headers, create the file and write the header with an
  // unknown (-1) record count. Throws std::runtime_error on any failure; no
  // file is left behind if the headers are rejected.
  void open(const std::string& path,
            const std::vector<EDFSignalHeader>& signals,
            const EDFWriterOptions& opts = EDFWriterOptions{});

  // Append samples; block[ch] holds the next samples of signal ch.
  // Every complete datarecord is written immediately.
  void write_block(const SampleBlock& block);

  // Flush the last (zero-padded) record, patch the record count and close.
  void close();

  // Close the file without finalizing the header (used on error paths).
  void abandon();

  bool is_open() const { return open_; }

  size_t samples_written() const { return samples_written_; }
  int records_written() const { return records_written_; }
  int samples_per_record() const { return spr_; }
  double record_duration_seconds() const { return record_duration_; }

  // Zero samples appended to the last record by close().
  size_t tail_padding_samples() const { return tail_padding_; }

private:
  void flush_record();

  std::ofstream f_;
  std::string path_;
  bool open_{false};

  std::vector<EDFSignalHeader> signals_;
  std::vector<double> scale_;
  std::vector<double> offset_;

  double record_duration_{1.0};
  int spr_{0};
  int ann_spr_{0};
  bool edfplus_{false};

  std::vector<std::vector<double>> pending_;
  size_t fill_{0};

  size_t samples_written_{0};
  int records_written_{0};
  size_t tail_padding_{0};
};

// Byte offset of the "number of data records" field in the EDF header.
constexpr std::streamoff kEdfNumRecordsFieldOffset = 236;

} // namespace vpconv
