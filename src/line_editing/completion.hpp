#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "completion/completer.hpp"

namespace sqlcli {

// Bridges Completer into GNU readline's completion hooks.
class ReadlineCompletion {
  public:
    explicit ReadlineCompletion(const Completer &completer);

    void install();

    // Earlier lines of a statement still being typed; they take part in table-name matching.
    void set_pending_text(std::string text);

  private:
    const Completer &completer_;
    std::string pending_text_;
    std::vector<RenderedCompletion> last_completions_;

    static ReadlineCompletion *instance_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);
    static void display_callback(char **matches, int num_matches, int max_length);

    [[nodiscard]] std::vector<RenderedCompletion> collect(std::string_view line, std::size_t point) const;
    void print_matches(std::ostream &out, char **matches, int num_matches, int max_length) const;

    [[nodiscard]] static std::string highlight(const RenderedCompletion &completion);
};

} // namespace sqlcli
