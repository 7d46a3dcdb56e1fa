#pragma once

#include <pylit/detail/cursor.h>
#include <pylit/value.h>
#include <string>

namespace pylit {
namespace detail {

// A digit, or a '.' followed by a digit.
bool starts_number(const Cursor& c);

// Read the unsigned numeric literal at the cursor. Integers (decimal, 0x,
// 0o, 0b) become Integer, literals with a fraction or exponent become Float,
// a trailing j/J makes an imaginary Complex. Fails with MalformedNumber.
Value read_number(Cursor& c);

// Correctly rounded value of a plain decimal token ("1.5", "2e-3", "-7"),
// read in the classic locale. Overflow gives +/-infinity.
double decimal_to_double(const std::string& token);

// Nearest double to n. Returns false when n is too large for a double.
bool integer_to_double(const mpz_class& n, double& out);

}  // namespace detail
}  // namespace pylit
