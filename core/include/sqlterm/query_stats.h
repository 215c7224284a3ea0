#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>

namespace sqlterm {

/// Row count and duration of the most recently completed statement.
struct QueryStats {
  size_t rows = 0;
  std::chrono::milliseconds elapsed{0};
};

/// Holds the last query statistics, shared between the UI loop and the query worker.
/// MUST replace the value atomically; readers never observe a partial update.
class QueryStatsContext {
 public:
  void update(size_t rows, std::chrono::milliseconds elapsed);
  std::optional<QueryStats> last() const;
  void reset();

 private:
  mutable std::shared_mutex mutex_;
  std::optional<QueryStats> stats_;
};

}  // namespace sqlterm
