#include "vpconv/decode_error.hpp"

namespace vpconv {

DecodeError::DecodeError(DecodeErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

const char* decode_error_code_name(DecodeErrorCode code) {
  switch (code) {
    case DecodeErrorCode::kInputOpenFailed: return "InputOpenFailed";
    case DecodeErrorCode::kHeaderTooShort: return "HeaderTooShort";
    case DecodeErrorCode::kMalformedChannelTable: return "MalformedChannelTable";
    case DecodeErrorCode::kInputReadFailed: return "InputReadFailed";
    case DecodeErrorCode::kUnsupportedChannelWidth: return "UnsupportedChannelWidth";
    case DecodeErrorCode::kNoActiveChannels: return "NoActiveChannels";
    case DecodeErrorCode::kInvalidSampleRate: return "InvalidSampleRate";
    case DecodeErrorCode::kWaveformWriterInitFailed: return "WaveformWriterInitFailed";
    case DecodeErrorCode::kChunkWriteFailed: return "ChunkWriteFailed";
    case DecodeErrorCode::kSidecarWriteFailed: return "SidecarWriteFailed";
  }
  return "Unknown";
}

} // namespace vpconv
