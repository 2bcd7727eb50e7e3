#pragma once

#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace sqlcli {

class QueryExecutor;
class SchemaIndex;

enum class LoadState {
    Pending,
    Loaded,
    // The executor reported a QueryError; the index stays empty.
    Failed,
    // A contract violation escaped the load; see rethrow_if_faulted().
    Faulted,
};

// Runs the introspection query once on a background thread and publishes into the index.
class SchemaLoader {
  public:
    static constexpr std::string_view kIntrospectionQuery =
        "SELECT table_name, column_name, data_type FROM information_schema.columns";

    SchemaLoader(QueryExecutor &executor, SchemaIndex &index);
    ~SchemaLoader();

    SchemaLoader(const SchemaLoader &) = delete;
    SchemaLoader &operator=(const SchemaLoader &) = delete;

    [[nodiscard]] LoadState state() const noexcept;
    [[nodiscard]] std::optional<std::string> failure_message() const;

    // Blocks until the load finished; rethrows a captured contract violation.
    void wait() const;
    void rethrow_if_faulted() const;

  private:
    QueryExecutor &executor_;
    SchemaIndex &index_;
    std::atomic<LoadState> state_{LoadState::Pending};

    mutable std::mutex mutex_;
    std::optional<std::string> failure_message_;

    std::promise<void> completion_;
    std::shared_future<void> done_;
    std::thread thread_;

    void run() noexcept;
    void load();
};

} // namespace sqlcli
