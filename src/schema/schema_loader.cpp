#include "schema/schema_loader.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <vector>

#include "query/query_executor.hpp"
#include "schema/schema_index.hpp"
#include "schema/schema_row.hpp"

namespace sqlcli {

SchemaLoader::SchemaLoader(QueryExecutor &executor, SchemaIndex &index)
    : executor_(executor), index_(index), done_(completion_.get_future().share()) {
    thread_ = std::thread(&SchemaLoader::run, this);
}

SchemaLoader::~SchemaLoader() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

LoadState SchemaLoader::state() const noexcept { return state_.load(std::memory_order_acquire); }

std::optional<std::string> SchemaLoader::failure_message() const {
    std::lock_guard lock(mutex_);
    return failure_message_;
}

void SchemaLoader::wait() const { done_.get(); }

void SchemaLoader::rethrow_if_faulted() const {
    if (done_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        done_.get();
    }
}

void SchemaLoader::run() noexcept {
    try {
        load();
    } catch (...) {
        state_.store(LoadState::Faulted, std::memory_order_release);
        completion_.set_exception(std::current_exception());
        return;
    }

    completion_.set_value();
}

void SchemaLoader::load() {
    auto result = executor_.execute(kIntrospectionQuery);
    if (!result.has_value()) {
        {
            std::lock_guard lock(mutex_);
            failure_message_ = std::move(result.error().message);
        }
        state_.store(LoadState::Failed, std::memory_order_release);
        return;
    }

    std::vector<SchemaRow> rows;
    rows.reserve(result->size());
    for (const auto &row : *result) {
        rows.push_back(SchemaRow::from_result_row(row));
    }

    index_.publish(std::move(rows));
    state_.store(LoadState::Loaded, std::memory_order_release);
}

} // namespace sqlcli
