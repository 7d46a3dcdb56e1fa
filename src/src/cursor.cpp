#include <pylit/detail/cursor.h>
#include <cctype>
#include <sstream>

namespace pylit {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedNumber: return "MalformedNumber";
        case ErrorKind::MalformedString: return "MalformedString";
        case ErrorKind::MalformedCollection: return "MalformedCollection";
        case ErrorKind::UnexpectedToken: return "UnexpectedToken";
        case ErrorKind::TrailingInput: return "TrailingInput";
        case ErrorKind::UnexpectedEndOfInput: return "UnexpectedEndOfInput";
    }
    return "ParseError";
}

namespace detail {

void Cursor::skip_ws() {
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isspace(c)) {
            ++i;
            continue;
        }
        if (c == '#') {
            while (i < s.size() and s[i] != '\n') ++i;
            continue;
        }
        if (c == '\\') {
            if (peek(1) == '\n') {
                i += 2;
                continue;
            }
            if (peek(1) == '\r' and peek(2) == '\n') {
                i += 3;
                continue;
            }
        }
        break;
    }
}

std::pair<size_t, size_t> Cursor::line_col_from_index(size_t idx) const {
    size_t pos = 0;
    size_t line = 1;
    size_t col = 1;
    while (pos < idx and pos < s.size()) {
        if (s[pos] == '\n') {
            ++line;
            col = 1;
        } else
            ++col;
        ++pos;
    }
    return {line, col};
}

void Cursor::fail(ErrorKind kind, const std::string& detail, size_t at) const {
    if (at > s.size()) at = s.size();
    auto [line, col] = line_col_from_index(at);

    size_t line_start = at;
    while (line_start > 0 and s[line_start - 1] != '\n') --line_start;
    size_t line_end = at;
    while (line_end < s.size() and s[line_end] != '\n') ++line_end;
    std::string line_text = s.substr(line_start, line_end - line_start);
    if (!line_text.empty() and line_text.back() == '\r') line_text.pop_back();

    std::ostringstream ss;
    ss << to_string(kind) << ": " << detail << " (line " << line << ", column " << col << ")\n";
    ss << line_text << "\n" << std::string(at - line_start, ' ') << '^';
    if (!opener_stack.empty()) {
        auto o = opener_stack.back();
        auto [oline, ocol] = line_col_from_index(o.offset);
        ss << "\n('" << o.ch << "' opened at line " << oline << ", column " << ocol << ")";
    }
    throw ParseError(kind, ss.str(), at, line, col);
}

}  // namespace detail
}  // namespace pylit
