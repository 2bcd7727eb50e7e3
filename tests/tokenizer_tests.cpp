#include <cassert>
#include <string>
#include <vector>

#include "core/tokenizer.hpp"

using sqlcli::Tokenizer;

namespace {

void test_extract_last_word_after_each_delimiter() {
    assert(Tokenizer::extract_last_word("SELECT a, b") == "b");
    assert(Tokenizer::extract_last_word("SELECT a,b") == "b");
    assert(Tokenizer::extract_last_word("SELECT\nFR") == "FR");
    assert(Tokenizer::extract_last_word("COUNT(us") == "us");
    assert(Tokenizer::extract_last_word("f(x)y") == "y");
    assert(Tokenizer::extract_last_word("SELECT 1;SEL") == "SEL");
    assert(Tokenizer::extract_last_word("users.na") == "na");
}

void test_extract_last_word_uses_rightmost_delimiter() {
    assert(Tokenizer::extract_last_word("a (b, c.d") == "d");
    assert(Tokenizer::extract_last_word("x.y z") == "z");
}

void test_extract_last_word_without_active_word() {
    assert(Tokenizer::extract_last_word("SELECT ").empty());
    assert(Tokenizer::extract_last_word("").empty());
    assert(Tokenizer::extract_last_word("a,").empty());
    assert(Tokenizer::extract_last_word("(").empty());
}

void test_extract_last_word_without_delimiter() {
    assert(Tokenizer::extract_last_word("SEL") == "SEL");
    // Tabs are not word delimiters.
    assert(Tokenizer::extract_last_word("SELECT\tFR") == "SELECT\tFR");
}

void test_split_arguments_handles_quotes() {
    Tokenizer tokenizer;

    const auto plain = tokenizer.split_arguments("psql -At  -F, -c");
    assert(plain.has_value());
    assert(*plain == std::vector<std::string>({"psql", "-At", "-F,", "-c"}));

    const auto quoted = tokenizer.split_arguments(R"(sqlite3 -separator '|' "my db.sqlite" a\ b)");
    assert(quoted.has_value());
    assert(*quoted == std::vector<std::string>({"sqlite3", "-separator", "|", "my db.sqlite", "a b"}));

    const auto empty_argument = tokenizer.split_arguments(R"(client "" x)");
    assert(empty_argument.has_value());
    assert(*empty_argument == std::vector<std::string>({"client", "", "x"}));

    const auto escaped_in_double = tokenizer.split_arguments(R"("a\"b\n")");
    assert(escaped_in_double.has_value());
    assert(*escaped_in_double == std::vector<std::string>({"a\"b\\n"}));
}

void test_split_arguments_rejects_unterminated_input() {
    Tokenizer tokenizer;

    assert(!tokenizer.split_arguments("psql 'unterminated").has_value());
    assert(!tokenizer.split_arguments("psql \"unterminated").has_value());
    assert(!tokenizer.split_arguments("psql \\").has_value());

    const auto blank = tokenizer.split_arguments("   ");
    assert(blank.has_value());
    assert(blank->empty());
}

} // namespace

int main() {
    test_extract_last_word_after_each_delimiter();
    test_extract_last_word_uses_rightmost_delimiter();
    test_extract_last_word_without_active_word();
    test_extract_last_word_without_delimiter();
    test_split_arguments_handles_quotes();
    test_split_arguments_rejects_unterminated_input();

    return 0;
}
