#pragma once

#include <pylit/value.h>
#include <string>

namespace pylit {

struct FormatOptions {
    // Delimiter for str and bytes literals: '"' or '\''.
    char quote = '"';
    // Escape every non-ASCII code point (\xhh, \uhhhh, \Uhhhhhhhh).
    bool ascii_only = false;
};

// Serialize a Value as canonical Python literal text. parse(format(v)) == v for
// every value parse can produce. Two values have no literal spelling: an empty
// set is written "set()" and a NaN float "nan".
std::string format(const Value& v);
// Throws std::invalid_argument for an unsupported quote character.
std::string format(const Value& v, const FormatOptions& options);

}  // namespace pylit
