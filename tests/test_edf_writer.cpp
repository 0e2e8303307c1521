#include "vpconv/edf_reader.hpp"
#include "vpconv/edf_writer.hpp"
#include "vpconv/utils.hpp"

#include "test_support.hpp"

#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vpconv;

static bool approx(double a, double b, double eps) {
  return std::fabs(a - b) <= eps;
}

static std::vector<EDFSignalHeader> two_signals(double fs) {
  EDFSignalHeader ekg;
  ekg.label = "EKG";
  ekg.physical_dimension = "uV";
  ekg.transducer = "Varioport";
  ekg.sample_rate_hz = fs;
  ekg.physical_min = -50000.0;
  ekg.physical_max = 50000.0;

  EDFSignalHeader resp;
  resp.label = "Resp";
  resp.physical_dimension = "";
  resp.sample_rate_hz = fs;
  return {ekg, resp};
}

static bool open_throws(const std::string& path, const std::vector<EDFSignalHeader>& sig,
                        const EDFWriterOptions& opts) {
  EDFStreamWriter w;
  try {
    w.open(path, sig, opts);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

int main() {
  const std::string out = (std::filesystem::temp_directory_path() / "vpconv_test_edf_writer.edf").string();
  remove_file_quiet(out);

  // 250 samples at 100 Hz in two blocks -> 3 one-second records, last one padded.
  {
    EDFWriterOptions opts;
    opts.patient_id = "X X X X";
    opts.recording_id = "Startdate X X X X test";

    EDFStreamWriter w;
    w.open(out, two_signals(100.0), opts);
    assert(w.is_open());
    assert(w.samples_per_record() == 100);

    std::vector<double> ekg(250), resp(250);
    for (size_t i = 0; i < 250; ++i) {
      ekg[i] = 1000.0 * std::sin(0.1 * static_cast<double>(i));
      resp[i] = static_cast<double>(i) - 100.0;
    }
    SampleBlock first = {std::vector<double>(ekg.begin(), ekg.begin() + 130),
                         std::vector<double>(resp.begin(), resp.begin() + 130)};
    SampleBlock second = {std::vector<double>(ekg.begin() + 130, ekg.end()),
                          std::vector<double>(resp.begin() + 130, resp.end())};
    w.write_block(first);
    assert(w.records_written() == 1);
    w.write_block(second);
    assert(w.records_written() == 2);
    w.close();
    assert(!w.is_open());
    assert(w.records_written() == 3);
    assert(w.samples_written() == 250);
    assert(w.tail_padding_samples() == 50);

    EDFReader r;
    const EDFRecording rec = r.read(out);
    const EDFHeaderInfo& h = rec.header;
    assert(h.num_records == 3);
    assert(h.record_duration_seconds == 1.0);
    assert(h.is_edfplus());
    assert(h.reserved == "EDF+C");
    assert(h.patient_id == "X X X X");
    assert(h.recording_id == "Startdate X X X X test");
    assert(h.signals.size() == 3);
    assert(h.signals[2].is_annotation);
    assert(h.signals[0].transducer == "Varioport");
    assert(h.signals[0].physical_min == -50000.0);
    assert(h.signals[1].digital_max == 32767);

    assert(rec.labels.size() == 2);
    assert(rec.labels[0] == "EKG");
    assert(rec.units[0] == "uV");
    assert(rec.fs_hz == 100.0);
    assert(rec.n_samples() == 300);

    const double ekg_step = 100000.0 / 65535.0;
    for (size_t i = 0; i < 250; ++i) {
      assert(approx(rec.data[0][i], ekg[i], ekg_step));
      assert(rec.data[1][i] == resp[i]);
    }
    for (size_t i = 250; i < 300; ++i) assert(rec.data[1][i] == 0.0);

    assert(rec.record_onsets_sec.size() == 3);
    assert(rec.record_onsets_sec[0] == 0.0);
    assert(rec.record_onsets_sec[2] == 2.0);
  }

  // Plain EDF, half-second records, clipping.
  {
    EDFWriterOptions opts;
    opts.write_edfplus = false;
    opts.record_duration_seconds = 0.5;

    EDFStreamWriter w;
    w.open(out, two_signals(50.0), opts);
    assert(w.samples_per_record() == 25);
    SampleBlock blk = {std::vector<double>(50, 60000.0), std::vector<double>(50, -40000.0)};
    w.write_block(blk);
    w.close();
    assert(w.records_written() == 2);
    assert(w.tail_padding_samples() == 0);

    EDFReader r;
    const EDFRecording rec = r.read(out);
    assert(!rec.header.is_edfplus());
    assert(rec.header.signals.size() == 2);
    assert(rec.record_onsets_sec.empty());
    assert(rec.n_samples() == 50);
    assert(approx(rec.data[0][0], 50000.0, 1e-6));
    assert(rec.data[1][0] == -32768.0);
  }

  // Nothing written: header is still finalized with zero records.
  {
    EDFStreamWriter w;
    w.open(out, two_signals(100.0));
    w.close();
    EDFReader r;
    const EDFHeaderInfo h = r.read_header(out);
    assert(h.num_records == 0);
  }

  // Abandon leaves the unknown record count in place.
  {
    EDFStreamWriter w;
    w.open(out, two_signals(100.0));
    w.write_block({std::vector<double>(100, 1.0), std::vector<double>(100, 2.0)});
    w.abandon();
    assert(!w.is_open());
    EDFReader r;
    assert(r.read_header(out).num_records == -1);
    const EDFRecording rec = r.read(out);
    assert(rec.n_samples() == 100);
  }

  // Rejected configurations leave no file behind.
  remove_file_quiet(out);
  {
    EDFWriterOptions opts;
    assert(open_throws(out, two_signals(33.3), opts));
    assert(!file_exists(out));

    assert(open_throws(out, {}, opts));

    std::vector<EDFSignalHeader> bad_range = two_signals(100.0);
    bad_range[1].physical_max = bad_range[1].physical_min;
    assert(open_throws(out, bad_range, opts));

    std::vector<EDFSignalHeader> mixed = two_signals(100.0);
    mixed[1].sample_rate_hz = 50.0;
    assert(open_throws(out, mixed, opts));

    assert(open_throws(out, two_signals(0.0), opts));
    assert(!file_exists(out));

    // A missing parent directory is not created.
    const std::string nested =
        (std::filesystem::temp_directory_path() / "vpconv_no_such_dir" / "x.edf").string();
    assert(open_throws(nested, two_signals(100.0), opts));
  }

  // Automatic record duration.
  {
    assert(pick_record_duration(100.0) == 1.0);
    assert(pick_record_duration(37.5) == 2.0);
    assert(pick_record_duration(512.0 / 3.0) == 3.0);
    assert(!pick_record_duration(1000.0 / 61.0).has_value());
    assert(!pick_record_duration(0.0).has_value());

    EDFWriterOptions opts;
    opts.record_duration_seconds = 0.0;
    EDFStreamWriter w;
    w.open(out, two_signals(37.5), opts);
    assert(w.record_duration_seconds() == 2.0);
    assert(w.samples_per_record() == 75);
    w.write_block({std::vector<double>(80, 1.0), std::vector<double>(80, 2.0)});
    w.close();
    assert(w.records_written() == 2);
    assert(w.tail_padding_samples() == 70);

    EDFReader r;
    const EDFRecording rec = r.read(out);
    assert(rec.header.record_duration_seconds == 2.0);
    assert(rec.fs_hz == 37.5);
    assert(rec.n_samples() == 150);

    remove_file_quiet(out);
    assert(open_throws(out, two_signals(1000.0 / 61.0), opts));
    assert(!file_exists(out));
  }

  // Block shape errors.
  {
    EDFStreamWriter w;
    w.open(out, two_signals(100.0));
    bool threw = false;
    try {
      w.write_block({std::vector<double>(10, 0.0)});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
    threw = false;
    try {
      w.write_block({std::vector<double>(10, 0.0), std::vector<double>(9, 0.0)});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
    w.close();
  }

  remove_file_quiet(out);
  return 0;
}
