#include "vpconv/layout.hpp"

#include "vpconv/byte_io.hpp"
#include "vpconv/channel_select.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace vpconv {

std::vector<double> decode_packed_samples(const uint8_t* p, size_t nbytes, int width,
                                          const ScalingProfile& scaling) {
  if (!is_supported_sample_width(width)) {
    throw std::runtime_error("decode_packed_samples: unsupported sample width " + std::to_string(width));
  }
  const size_t w = static_cast<size_t>(width);
  const size_t n = nbytes / w;
  std::vector<double> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = apply_scaling(static_cast<double>(load_uint_be(p + i * w, width)), scaling);
  }
  return out;
}

std::vector<ScalingProfile> resolve_channel_scalings(const std::vector<ChannelDescriptor>& active,
                                                     DiagnosticLog& log) {
  std::vector<ScalingProfile> out;
  out.reserve(active.size());
  for (const auto& ch : active) {
    const ScalingResolution r = resolve_scaling(ch);
    if (r.source != ScalingSource::kHeader) {
      std::ostringstream oss;
      oss << "Invalid scaling for '" << ch.name << "' (mul=" << ch.scale_multiplier
          << ", div=" << ch.scale_divisor << "); ";
      if (r.source == ScalingSource::kDefaultTable) {
        oss << "applied " << r.matched_prefix << " defaults: doffs=" << r.profile.zero_offset
            << ", mul=" << r.profile.multiplier << ", div=" << r.profile.divisor;
      } else {
        oss << "no defaults found, using raw values (doffs=0, mul=1, div=1)";
      }
      log.warning(oss.str());
    }
    out.push_back(r.profile);
  }
  return out;
}

// ---- Type 6 ----

std::vector<DecodedChannel> DemultiplexedLayout::decode_channels(std::istream& in,
                                                                 const std::vector<ChannelDescriptor>& active,
                                                                 DiagnosticLog& log) const {
  const std::vector<ScalingProfile> scaling = resolve_channel_scalings(active, log);

  std::vector<DecodedChannel> out;
  out.reserve(active.size());

  for (size_t k = 0; k < active.size(); ++k) {
    const ChannelDescriptor& ch = active[k];

    const std::vector<uint8_t> raw = read_bytes_at(in, ch.data_byte_offset, ch.data_byte_length);
    if (raw.size() < ch.data_byte_length) {
      log.warning("Channel '" + ch.name + "' declares " + std::to_string(ch.data_byte_length) +
                  " bytes at offset " + std::to_string(ch.data_byte_offset) + " but the file holds " +
                  std::to_string(raw.size()) + "; decoding what is present");
    }

    DecodedChannel dc;
    dc.descriptor = ch;
    dc.samples = decode_packed_samples(raw.data(), raw.size(), ch.sample_byte_width, scaling[k]);
    log.info("Channel '" + ch.name + "': " + std::to_string(dc.samples.size()) + " samples");
    out.push_back(std::move(dc));
  }

  size_t max_len = 0;
  for (const auto& dc : out) max_len = std::max(max_len, dc.samples.size());

  for (auto& dc : out) {
    if (dc.samples.size() < max_len) {
      dc.padded_samples = max_len - dc.samples.size();
      dc.samples.resize(max_len, 0.0);
      log.info("Channel '" + dc.descriptor.name + "' zero-padded with " +
               std::to_string(dc.padded_samples) + " samples to match the longest channel");
    }
  }
  return out;
}

LayoutStats DemultiplexedLayout::decode(std::istream& in,
                                        const FileHeader& header,
                                        const std::vector<ChannelDescriptor>& active,
                                        ISampleSink& sink,
                                        DiagnosticLog& log) {
  log.info("Header type " + std::to_string(header.header_type) +
           " (demultiplexed): reading channels independently");

  std::vector<DecodedChannel> decoded = decode_channels(in, active, log);

  LayoutStats stats;
  stats.padded_samples.reserve(decoded.size());
  for (const auto& dc : decoded) stats.padded_samples.push_back(dc.padded_samples);
  stats.samples_per_channel = decoded.empty() ? 0 : decoded.front().samples.size();

  if (stats.samples_per_channel == 0) {
    log.warning("No sample data found for any active channel");
    return stats;
  }

  SampleBlock block;
  block.reserve(decoded.size());
  for (auto& dc : decoded) block.push_back(std::move(dc.samples));
  decoded.clear();

  sink.write_block(block);
  stats.blocks_written = 1;
  return stats;
}

// ---- multiplexed ----

MultiplexedChunkReader::MultiplexedChunkReader(std::istream& in,
                                               uint64_t data_offset,
                                               const std::vector<ChannelDescriptor>& active,
                                               std::vector<ScalingProfile> scaling,
                                               size_t samples_per_chunk)
    : in_(in), scaling_(std::move(scaling)) {
  if (active.empty()) throw std::runtime_error("MultiplexedChunkReader: no channels");
  if (scaling_.size() != active.size()) {
    throw std::runtime_error("MultiplexedChunkReader: scaling/channel count mismatch");
  }
  if (samples_per_chunk == 0) samples_per_chunk = 1;

  for (const auto& ch : active) {
    if (!is_supported_sample_width(ch.sample_byte_width)) {
      throw std::runtime_error("MultiplexedChunkReader: unsupported sample width for '" + ch.name + "'");
    }
    widths_.push_back(ch.sample_byte_width);
    field_offsets_.push_back(block_size_);
    block_size_ += static_cast<size_t>(ch.sample_byte_width);
  }
  buf_.resize(samples_per_chunk * block_size_);

  in_.clear();
  in_.seekg(static_cast<std::streamoff>(data_offset), std::ios::beg);
  if (!in_) {
    in_.clear();
    throw std::runtime_error("MultiplexedChunkReader: failed to seek to data offset " +
                             std::to_string(data_offset));
  }
}

bool MultiplexedChunkReader::next(SampleBlock* out) {
  if (done_ || !out) return false;

  const size_t got = read_some(in_, buf_.data(), buf_.size());
  if (got < buf_.size()) done_ = true;
  if (got == 0) return false;

  const size_t n_groups = got / block_size_;
  discarded_tail_bytes_ += got - n_groups * block_size_;
  if (n_groups == 0) {
    done_ = true;
    return false;
  }

  const size_t nch = widths_.size();
  out->resize(nch);
  for (size_t ch = 0; ch < nch; ++ch) {
    std::vector<double>& x = (*out)[ch];
    x.resize(n_groups);
    const uint8_t* p = buf_.data() + field_offsets_[ch];
    const int w = widths_[ch];
    const ScalingProfile& s = scaling_[ch];
    for (size_t i = 0; i < n_groups; ++i) {
      x[i] = apply_scaling(static_cast<double>(load_uint_be(p + i * block_size_, w)), s);
    }
  }

  groups_read_ += n_groups;
  return true;
}

MultiplexedLayout::MultiplexedLayout(double chunk_duration_seconds)
    : chunk_duration_seconds_(chunk_duration_seconds > 0.0 ? chunk_duration_seconds : 60.0) {}

LayoutStats MultiplexedLayout::decode(std::istream& in,
                                      const FileHeader& header,
                                      const std::vector<ChannelDescriptor>& active,
                                      ISampleSink& sink,
                                      DiagnosticLog& log) {
  log.info("Header type " + std::to_string(header.header_type) +
           " (multiplexed): streaming interleaved data");

  const double fs = effective_stream_rate(active);
  const long long spc = std::llround(chunk_duration_seconds_ * fs);
  const size_t samples_per_chunk = spc > 0 ? static_cast<size_t>(spc) : 1;

  MultiplexedChunkReader reader(in, header.header_length, active,
                                resolve_channel_scalings(active, log), samples_per_chunk);

  LayoutStats stats;
  stats.padded_samples.assign(active.size(), 0);

  SampleBlock chunk;
  while (reader.next(&chunk)) {
    sink.write_block(chunk);
    ++stats.blocks_written;
  }

  stats.samples_per_channel = reader.groups_read();
  stats.discarded_tail_bytes = reader.discarded_tail_bytes();
  if (stats.discarded_tail_bytes > 0) {
    log.warning("Discarded " + std::to_string(stats.discarded_tail_bytes) +
                " trailing bytes (incomplete sample group of " + std::to_string(reader.block_size()) +
                " bytes)");
  }
  log.info("Finished streaming " + std::to_string(stats.blocks_written) + " chunk(s), " +
           std::to_string(stats.samples_per_channel) + " samples per channel");
  return stats;
}

std::unique_ptr<ILayoutStrategy> make_layout_strategy(const FileHeader& header,
                                                      double chunk_duration_seconds) {
  if (header.is_demultiplexed()) return std::make_unique<DemultiplexedLayout>();
  return std::make_unique<MultiplexedLayout>(chunk_duration_seconds);
}

} // namespace vpconv
