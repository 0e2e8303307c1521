#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace vpconv {

enum class DiagnosticSeverity {
  kInfo,
  kWarning,
  kError,
};

struct Diagnostic {
  DiagnosticSeverity severity{DiagnosticSeverity::kInfo};
  std::string message;
};

using DiagnosticCallback = std::function<void(DiagnosticSeverity, const std::string&)>;

// Collects progress and problem reports from the decoder.
//
// The library never prints. Every entry is stored and, if a callback is
// installed, forwarded to it immediately (CLI tools print from there).
class DiagnosticLog {
public:
  DiagnosticLog() = default;
  explicit DiagnosticLog(DiagnosticCallback cb);

  void set_callback(DiagnosticCallback cb);

  void report(DiagnosticSeverity severity, const std::string& message);
  void info(const std::string& message) { report(DiagnosticSeverity::kInfo, message); }
  void warning(const std::string& message) { report(DiagnosticSeverity::kWarning, message); }
  void error(const std::string& message) { report(DiagnosticSeverity::kError, message); }

  const std::vector<Diagnostic>& entries() const { return entries_; }
  size_t count(DiagnosticSeverity severity) const;

  // True if any entry of the given severity contains `needle`.
  bool contains(DiagnosticSeverity severity, const std::string& needle) const;

private:
  DiagnosticCallback callback_;
  std::vector<Diagnostic> entries_;
};

const char* diagnostic_severity_name(DiagnosticSeverity severity);

// "Warning: <message>" / "Error: <message>" / "<message>" for info.
std::string format_diagnostic(DiagnosticSeverity severity, const std::string& message);

} // namespace vpconv
