#pragma once

#include <string>

namespace sqlcli {

class HistoryManager {
  public:
    explicit HistoryManager(std::string history_file_path);

    void initialize() const;
    void save() const;
    void record_input(const std::string &input) const;

    [[nodiscard]] const std::string &history_file_path() const noexcept { return history_file_path_; }

  private:
    std::string history_file_path_;
};

} // namespace sqlcli
