#include "sqlterm/diagnostics.h"

#include <exception>
#include <iostream>
#include <mutex>

namespace sqlterm {

namespace {

std::mutex& sink_mutex() {
  static std::mutex mutex;
  return mutex;
}

DiagnosticSink& sink_slot() {
  static DiagnosticSink sink;
  return sink;
}

void write_to_stderr(Severity severity, const std::string& message) {
  std::cerr << severity_label(severity) << ": " << message << std::endl;
}

}  // namespace

const char* severity_label(Severity severity) {
  switch (severity) {
    case Severity::Info:
      return "Info";
    case Severity::Warning:
      return "Warning";
    case Severity::Error:
      return "Error";
  }
  return "Info";
}

DiagnosticSink set_diagnostic_sink(DiagnosticSink sink) {
  std::lock_guard<std::mutex> lock(sink_mutex());
  DiagnosticSink previous = std::move(sink_slot());
  sink_slot() = std::move(sink);
  return previous;
}

void report(Severity severity, const std::string& message) {
  DiagnosticSink sink;
  {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink = sink_slot();
  }
  if (!sink) {
    write_to_stderr(severity, message);
    return;
  }
  try {
    sink(severity, message);
  } catch (const std::exception& ex) {
    write_to_stderr(Severity::Error, std::string("diagnostic sink failed: ") + ex.what());
    write_to_stderr(severity, message);
  }
}

}  // namespace sqlterm
