#pragma once

#include <pylit/detail/cursor.h>
#include <pylit/value.h>

namespace pylit {
namespace detail {

// A quote, or a string prefix (r, u, b, rb, br in any case) directly followed by one.
bool starts_text(const Cursor& c);

// Read a string or bytes literal and every adjacent literal of the same kind
// after it, concatenated. Fails with MalformedString.
Value read_text(Cursor& c);

}  // namespace detail
}  // namespace pylit
