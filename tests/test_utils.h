#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <string>
#include <utility>
#include <vector>

#include "sqlterm/diagnostics.h"
#include "sqlterm/key_input.h"
#include "sqlterm/query.h"

namespace sqlterm {
class ModalEditor;
}  // namespace sqlterm

/// Sends each character of keys to the editor as an unmodified key press.
void type_keys(sqlterm::ModalEditor& editor, const std::string& keys);

std::string read_file_to_string(const std::filesystem::path& path);
void write_string_to_file(const std::filesystem::path& path, const std::string& content);

/// Collects diagnostics for the lifetime of the object and restores the previous sink.
struct DiagnosticCapture {
  DiagnosticCapture();
  ~DiagnosticCapture();

  std::vector<std::pair<sqlterm::Severity, std::string>> messages;

 private:
  sqlterm::DiagnosticSink previous_;
};

/// In-memory DatabaseSession with scripted results and call counters.
class FakeSession : public sqlterm::DatabaseSession {
 public:
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
  size_t affected = 0;
  /// When non-empty, fetch and modify throw QueryError with this message.
  std::string error;
  /// When valid, fetch and modify block until it is ready.
  std::shared_future<void> gate;

  std::atomic<int> fetch_calls{0};
  std::atomic<int> modify_calls{0};
  std::string last_sql;

  std::string backend_name() const override { return "fake"; }

 protected:
  FetchResult fetch(const std::string& sql) override;
  size_t modify(const std::string& sql) override;
};
