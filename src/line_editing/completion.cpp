#include "line_editing/completion.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <format>
#include <iostream>
#include <ostream>
#include <string>
#include <unordered_set>
#include <utility>

#include <readline/readline.h>

namespace sqlcli {

namespace {

constexpr std::string_view kHighlightOn = "\033[1;31m";
constexpr std::string_view kHighlightOff = "\033[0m";

// Same characters as Tokenizer::kWordDelimiters; readline wants a mutable buffer.
char word_break_characters[] = " ,\n);(.";

} // namespace

ReadlineCompletion *ReadlineCompletion::instance_ = nullptr;

ReadlineCompletion::ReadlineCompletion(const Completer &completer) : completer_(completer) {}

void ReadlineCompletion::install() {
    instance_ = this;

    rl_completer_word_break_characters = word_break_characters;
    rl_attempted_completion_function = &ReadlineCompletion::completion_callback;
    rl_completion_display_matches_hook = &ReadlineCompletion::display_callback;
    rl_sort_completion_matches = 0;
    rl_variable_bind("completion-ignore-case", "on");
}

void ReadlineCompletion::set_pending_text(std::string text) { pending_text_ = std::move(text); }

char **ReadlineCompletion::completion_callback(const char *text, int /*start*/, int /*end*/) {
    rl_attempted_completion_over = 1;

    if (instance_ == nullptr || rl_line_buffer == nullptr) {
        return nullptr;
    }

    instance_->last_completions_ = instance_->collect(rl_line_buffer, static_cast<std::size_t>(std::max(rl_point, 0)));
    if (instance_->last_completions_.empty()) {
        return nullptr;
    }

    return rl_completion_matches(text, &ReadlineCompletion::generator_callback);
}

char *ReadlineCompletion::generator_callback(const char * /*text*/, int state) {
    static std::size_t index = 0;

    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        index = 0;
    }

    if (index >= instance_->last_completions_.size()) {
        return nullptr;
    }

    return ::strdup(instance_->last_completions_[index++].label.c_str());
}

void ReadlineCompletion::display_callback(char **matches, int num_matches, int max_length) {
    if (instance_ == nullptr) {
        return;
    }

    instance_->print_matches(std::cout, matches, num_matches, max_length);
    rl_forced_update_display();
}

void ReadlineCompletion::print_matches(std::ostream &out, char **matches, int num_matches, int max_length) const {
    // Labels are not unique: two tables can share a column name. Every candidate carrying a kept label is listed.
    std::unordered_set<std::string_view> kept;
    for (int i = 1; i <= num_matches; ++i) {
        kept.insert(matches[i]);
    }

    const auto width = static_cast<std::size_t>(std::max(max_length, 0));

    out << '\n';
    for (const auto &completion : last_completions_) {
        if (!kept.contains(completion.label)) {
            continue;
        }

        const auto padding = width > completion.label.size() ? width - completion.label.size() : 0;
        out << highlight(completion) << std::string(padding + 2, ' ') << completion.meta << '\n';
    }
    out << std::flush;
}

std::vector<RenderedCompletion> ReadlineCompletion::collect(std::string_view line, std::size_t point) const {
    if (pending_text_.empty()) {
        return completer_.complete(line, point);
    }

    const std::string full_text = std::format("{}\n{}", pending_text_, line);
    return completer_.complete(full_text, pending_text_.size() + 1 + point);
}

std::string ReadlineCompletion::highlight(const RenderedCompletion &completion) {
    const auto split = std::min(static_cast<std::size_t>(-completion.insertion_offset), completion.label.size());

    std::string out;
    out.reserve(completion.label.size() + kHighlightOn.size() + kHighlightOff.size());
    out += kHighlightOn;
    out += std::string_view(completion.label).substr(0, split);
    out += kHighlightOff;
    out += std::string_view(completion.label).substr(split);

    return out;
}

} // namespace sqlcli
