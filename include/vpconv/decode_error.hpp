#pragma once

#include <stdexcept>
#include <string>

namespace vpconv {

// Failure categories of a Varioport decode.
//
// kUnsupportedChannelWidth is never thrown: unsupported channels are skipped
// and reported through the diagnostics log. kSidecarWriteFailed is thrown by
// the sidecar writer but does not invalidate an already written EDF file.
enum class DecodeErrorCode {
  kInputOpenFailed,
  kHeaderTooShort,
  kMalformedChannelTable,
  kInputReadFailed,
  kUnsupportedChannelWidth,
  kNoActiveChannels,
  kInvalidSampleRate,
  kWaveformWriterInitFailed,
  kChunkWriteFailed,
  kSidecarWriteFailed,
};

// Stable identifier, e.g. "HeaderTooShort".
const char* decode_error_code_name(DecodeErrorCode code);

class DecodeError : public std::runtime_error {
public:
  DecodeError(DecodeErrorCode code, const std::string& message);

  DecodeErrorCode code() const { return code_; }

private:
  DecodeErrorCode code_;
};

} // namespace vpconv
