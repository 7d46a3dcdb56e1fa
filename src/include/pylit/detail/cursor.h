#pragma once

#include <pylit/parse_error.h>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pylit {
namespace detail {

// Read position over the source text, shared by the readers and the grammar
// driver. Errors are raised through fail() so every one carries a location.
struct Cursor {
    struct Opener {
        char ch;
        size_t offset;
    };

    const std::string& s;
    size_t i = 0;
    std::vector<Opener> opener_stack;

    explicit Cursor(const std::string& str) : s(str) {}

    bool at_end() const { return i >= s.size(); }
    char peek(size_t ahead = 0) const { return i + ahead < s.size() ? s[i + ahead] : '\0'; }
    char get() { return i < s.size() ? s[i++] : '\0'; }

    // Skip whitespace, '#' comments and backslash-newline continuations.
    void skip_ws();

    void push_opener(char ch) { opener_stack.push_back(Opener{ch, i}); }
    void pop_opener() {
        if (!opener_stack.empty()) opener_stack.pop_back();
    }

    std::pair<size_t, size_t> line_col_from_index(size_t idx) const;

    [[noreturn]] void fail(ErrorKind kind, const std::string& detail, size_t at) const;
    [[noreturn]] void fail(ErrorKind kind, const std::string& detail) const { fail(kind, detail, i); }
};

}  // namespace detail
}  // namespace pylit
