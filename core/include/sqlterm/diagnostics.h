#pragma once

#include <functional>
#include <string>

namespace sqlterm {

enum class Severity { Info, Warning, Error };

/// Receives diagnostics emitted by core components that must not fail their caller.
/// MUST be cheap and non-throwing; it may be invoked from the query worker thread.
using DiagnosticSink = std::function<void(Severity, const std::string&)>;

/// Installs the process-wide diagnostic sink and returns the previous one.
/// MUST accept an empty function to restore the default stderr sink.
/// Inputs are a sink; side effects replace the global sink under a lock.
DiagnosticSink set_diagnostic_sink(DiagnosticSink sink);

/// Reports a diagnostic through the installed sink.
/// MUST never throw, even if the sink does.
void report(Severity severity, const std::string& message);

/// Returns the user-facing prefix for a severity ("Error", "Warning", "Info").
const char* severity_label(Severity severity);

}  // namespace sqlterm
