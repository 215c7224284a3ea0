#include "sqlterm/query_stats.h"

#include <mutex>

namespace sqlterm {

void QueryStatsContext::update(size_t rows, std::chrono::milliseconds elapsed) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  stats_ = QueryStats{rows, elapsed};
}

std::optional<QueryStats> QueryStatsContext::last() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return stats_;
}

void QueryStatsContext::reset() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  stats_.reset();
}

}  // namespace sqlterm
