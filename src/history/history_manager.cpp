#include "history/history_manager.hpp"

#include <cstring>
#include <utility>

#include <readline/history.h>

namespace sqlcli {

HistoryManager::HistoryManager(std::string history_file_path) : history_file_path_(std::move(history_file_path)) {}

void HistoryManager::initialize() const {
    using_history();

    // A missing file is the normal first-run case.
    read_history(history_file_path_.c_str());
}

void HistoryManager::save() const { write_history(history_file_path_.c_str()); }

void HistoryManager::record_input(const std::string &input) const {
    if (input.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    if (history_length == 0) {
        add_history(input.c_str());
        return;
    }

    const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
    if (last_entry == nullptr || std::strcmp(input.c_str(), last_entry->line) != 0) {
        add_history(input.c_str());
    }
}

} // namespace sqlcli
