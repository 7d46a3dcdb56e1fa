#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pylit {

enum class ErrorKind {
    MalformedNumber,
    MalformedString,
    MalformedCollection,
    UnexpectedToken,
    TrailingInput,
    UnexpectedEndOfInput
};

const char* to_string(ErrorKind kind) noexcept;

// Thrown by pylit::parse. what() holds the kind, the detail, the location and
// the offending source line with a caret under the failing column.
class ParseError : public std::runtime_error {
  public:
    ParseError(ErrorKind kind, const std::string& message, size_t offset, size_t line, size_t column)
        : std::runtime_error(message), m_kind(kind), m_offset(offset), m_line(line), m_column(column) {}

    ErrorKind kind() const noexcept { return m_kind; }
    // 0-based byte offset into the parsed text
    size_t offset() const noexcept { return m_offset; }
    // 1-based
    size_t line() const noexcept { return m_line; }
    size_t column() const noexcept { return m_column; }

  private:
    ErrorKind m_kind;
    size_t m_offset;
    size_t m_line;
    size_t m_column;
};

}  // namespace pylit
