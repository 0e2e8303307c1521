#pragma once

#include "vpconv/types.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

namespace vpconv {

// Varioport file layout constants.
//
// All multi-byte integers in the header and channel table are big-endian.
// Offsets are absolute (from file start) for the file header, and relative to
// the start of each record for the channel table.
namespace varioport_layout {

constexpr size_t kHeaderLengthOffset = 2;        // u16
constexpr size_t kChannelTableOffsetOffset = 4;  // u16
constexpr size_t kHeaderTypeOffset = 6;          // u8
constexpr size_t kChannelCountOffset = 7;        // u8
constexpr size_t kBaseScanRateOffset = 20;       // u16
constexpr size_t kMinHeaderBytes = 22;

constexpr size_t kChannelRecordSize = 40;
constexpr size_t kChanNameOffset = 0;
constexpr size_t kChanNameSize = 6;
constexpr size_t kChanUnitOffset = 6;
constexpr size_t kChanUnitSize = 4;
constexpr size_t kChanWidthCodeOffset = 11;      // u8, bytes = code + 1
constexpr size_t kChanScanFactorOffset = 12;     // u8
constexpr size_t kChanStreamFactorOffset = 14;   // u8
constexpr size_t kChanMultiplierOffset = 16;     // u16
constexpr size_t kChanZeroOffsetOffset = 18;     // u16
constexpr size_t kChanDivisorOffset = 20;        // u16
constexpr size_t kChanDataOffsetOffset = 24;     // u32, relative to header_length
constexpr size_t kChanDataLengthOffset = 28;     // u32

constexpr uint8_t kDemultiplexedHeaderType = 6;

} // namespace varioport_layout

// Base rate that one recorder batch needed in place of its (wrong) header
// value. Only applied when a caller asks for it explicitly.
constexpr double kLegacyForcedBaseRateHz = 512.0;

// Parse the fixed header fields.
//
// If base_rate_override is set (and > 0) it replaces the file's base scan rate
// for all derived channel rates; the file's own value stays available in
// FileHeader::file_base_scan_rate.
//
// Throws DecodeError(kHeaderTooShort) if the input holds fewer than
// kMinHeaderBytes bytes.
FileHeader read_varioport_header(std::istream& in,
                                 std::optional<double> base_rate_override = std::nullopt);

// Decode one 40-byte channel record.
//
// `record` must point to kChannelRecordSize bytes.
ChannelDescriptor parse_channel_record(const uint8_t* record, uint32_t index, const FileHeader& header);

// Read all channel records starting at header.channel_table_offset.
//
// Throws DecodeError(kMalformedChannelTable) if any record is incomplete.
std::vector<ChannelDescriptor> read_channel_table(std::istream& in, const FileHeader& header);

// Trim a fixed-width ASCII field: non-ASCII bytes are dropped and leading or
// trailing NUL/whitespace is removed.
std::string decode_ascii_field(const uint8_t* p, size_t n);

} // namespace vpconv
