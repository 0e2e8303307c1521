#pragma once

#include "vpconv/diagnostics.hpp"
#include "vpconv/scaling.hpp"
#include "vpconv/types.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <vector>

namespace vpconv {

// Receives decoded samples, one call per block (all active channels).
class ISampleSink {
public:
  virtual ~ISampleSink() = default;
  virtual void write_block(const SampleBlock& block) = 0;
};

struct LayoutStats {
  size_t samples_per_channel{0};      // real samples handed to the sink per channel
  std::vector<size_t> padded_samples; // per active channel (Type 6 alignment pad)
  size_t blocks_written{0};           // sink calls
  size_t discarded_tail_bytes{0};     // multiplexed: trailing partial sample group
};

// Decode strategy for one on-disk sample layout.
class ILayoutStrategy {
public:
  virtual ~ILayoutStrategy() = default;

  virtual const char* name() const = 0;

  // Decode all active channels (channel-table order) and feed the sink.
  virtual LayoutStats decode(std::istream& in,
                             const FileHeader& header,
                             const std::vector<ChannelDescriptor>& active,
                             ISampleSink& sink,
                             DiagnosticLog& log) = 0;
};

// Header type 6: each channel is a contiguous block of packed big-endian
// samples at its own absolute offset. Channels are decoded independently,
// right-padded with zeros to the longest channel and written as one block.
// Memory use is proportional to the channel data size.
class DemultiplexedLayout : public ILayoutStrategy {
public:
  const char* name() const override { return "demultiplexed"; }

  LayoutStats decode(std::istream& in,
                     const FileHeader& header,
                     const std::vector<ChannelDescriptor>& active,
                     ISampleSink& sink,
                     DiagnosticLog& log) override;

  // Decode and pad without writing anything.
  std::vector<DecodedChannel> decode_channels(std::istream& in,
                                              const std::vector<ChannelDescriptor>& active,
                                              DiagnosticLog& log) const;
};

// Reads an interleaved sample stream in bounded chunks.
//
// One sample group holds one value per active channel in channel-table order,
// each with its channel's byte width. Every chunk covers up to
// samples_per_chunk groups; a trailing partial group at the end of the data is
// discarded.
class MultiplexedChunkReader {
public:
  MultiplexedChunkReader(std::istream& in,
                         uint64_t data_offset,
                         const std::vector<ChannelDescriptor>& active,
                         std::vector<ScalingProfile> scaling,
                         size_t samples_per_chunk);

  // Decode the next chunk into out[ch][i] (physical units).
  // Returns false when no complete sample group is left.
  bool next(SampleBlock* out);

  size_t block_size() const { return block_size_; }
  size_t bytes_per_chunk() const { return buf_.size(); }
  size_t groups_read() const { return groups_read_; }
  size_t discarded_tail_bytes() const { return discarded_tail_bytes_; }

private:
  std::istream& in_;
  std::vector<int> widths_;
  std::vector<size_t> field_offsets_;
  std::vector<ScalingProfile> scaling_;
  size_t block_size_{0};
  std::vector<uint8_t> buf_;
  bool done_{false};
  size_t groups_read_{0};
  size_t discarded_tail_bytes_{0};
};

// Every header type other than 6: one interleaved stream starting at
// header_length, streamed chunk by chunk (one sink call per chunk).
class MultiplexedLayout : public ILayoutStrategy {
public:
  explicit MultiplexedLayout(double chunk_duration_seconds = 60.0);

  const char* name() const override { return "multiplexed"; }

  LayoutStats decode(std::istream& in,
                     const FileHeader& header,
                     const std::vector<ChannelDescriptor>& active,
                     ISampleSink& sink,
                     DiagnosticLog& log) override;

  double chunk_duration_seconds() const { return chunk_duration_seconds_; }

private:
  double chunk_duration_seconds_;
};

std::unique_ptr<ILayoutStrategy> make_layout_strategy(const FileHeader& header,
                                                      double chunk_duration_seconds = 60.0);

// Decode packed big-endian unsigned samples and scale them.
// Remainder bytes (nbytes not a multiple of width) are ignored.
std::vector<double> decode_packed_samples(const uint8_t* p, size_t nbytes, int width,
                                          const ScalingProfile& scaling);

// Resolve scaling for every active channel, reporting substitutions.
std::vector<ScalingProfile> resolve_channel_scalings(const std::vector<ChannelDescriptor>& active,
                                                     DiagnosticLog& log);

} // namespace vpconv
