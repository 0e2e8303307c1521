#include "vpconv/diagnostics.hpp"

#include <utility>

namespace vpconv {

DiagnosticLog::DiagnosticLog(DiagnosticCallback cb) : callback_(std::move(cb)) {}

void DiagnosticLog::set_callback(DiagnosticCallback cb) {
  callback_ = std::move(cb);
}

void DiagnosticLog::report(DiagnosticSeverity severity, const std::string& message) {
  entries_.push_back(Diagnostic{severity, message});
  if (callback_) callback_(severity, message);
}

size_t DiagnosticLog::count(DiagnosticSeverity severity) const {
  size_t n = 0;
  for (const auto& d : entries_) {
    if (d.severity == severity) ++n;
  }
  return n;
}

bool DiagnosticLog::contains(DiagnosticSeverity severity, const std::string& needle) const {
  for (const auto& d : entries_) {
    if (d.severity == severity && d.message.find(needle) != std::string::npos) return true;
  }
  return false;
}

const char* diagnostic_severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::kInfo: return "info";
    case DiagnosticSeverity::kWarning: return "warning";
    case DiagnosticSeverity::kError: return "error";
  }
  return "info";
}

std::string format_diagnostic(DiagnosticSeverity severity, const std::string& message) {
  switch (severity) {
    case DiagnosticSeverity::kWarning: return "Warning: " + message;
    case DiagnosticSeverity::kError: return "Error: " + message;
    case DiagnosticSeverity::kInfo: break;
  }
  return message;
}

} // namespace vpconv
