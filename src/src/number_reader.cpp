#include <pylit/detail/number_reader.h>
#include <cctype>
#include <cmath>
#include <limits>
#include <locale>
#include <sstream>
#include <string>

namespace pylit {
namespace detail {

namespace {
    bool is_digit_in(char ch, int base) {
        unsigned char u = static_cast<unsigned char>(ch);
        switch (base) {
            case 2: return ch == '0' or ch == '1';
            case 8: return ch >= '0' and ch <= '7';
            case 16: return std::isxdigit(u) != 0;
            default: return std::isdigit(u) != 0;
        }
    }

    bool is_ident_char(char ch) {
        unsigned char u = static_cast<unsigned char>(ch);
        return std::isalnum(u) or ch == '_' or u >= 0x80;
    }

    // Digits of one group with single interior underscores removed. A leading
    // underscore is accepted only right after a radix prefix (0x_ff).
    std::string read_digits(Cursor& c, int base, bool leading_underscore) {
        std::string out;
        while (true) {
            char ch = c.peek();
            if (is_digit_in(ch, base)) {
                out.push_back(c.get());
                continue;
            }
            if (ch == '_' and is_digit_in(c.peek(1), base) and (!out.empty() or leading_underscore)) {
                c.get();
                continue;
            }
            break;
        }
        return out;
    }

    // A number must not run straight into a name or another digit (123abc, 0b12, 1_).
    void reject_suffix(Cursor& c, size_t start, const char* what) {
        if (c.at_end() or !is_ident_char(c.peek())) return;
        size_t end = c.i;
        while (end < c.s.size() and is_ident_char(c.s[end])) ++end;
        c.fail(ErrorKind::MalformedNumber,
               std::string("invalid ") + what + " literal '" + c.s.substr(start, end - start) + "'", start);
    }
}

double decimal_to_double(const std::string& token) {
    std::istringstream in(token);
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    // num_get reports overflow as failbit with the largest finite value
    if (in.fail() and std::fabs(d) == std::numeric_limits<double>::max())
        return std::copysign(std::numeric_limits<double>::infinity(), d);
    return d;
}

bool starts_number(const Cursor& c) {
    char ch = c.peek();
    if (std::isdigit(static_cast<unsigned char>(ch))) return true;
    return ch == '.' and std::isdigit(static_cast<unsigned char>(c.peek(1)));
}

bool integer_to_double(const mpz_class& n, double& out) {
    out = decimal_to_double(n.get_str(10));
    return std::isfinite(out);
}

Value read_number(Cursor& c) {
    size_t start = c.i;
    if (!starts_number(c)) c.fail(ErrorKind::MalformedNumber, "expected a number");

    if (c.peek() == '0') {
        int base = 0;
        const char* what = "";
        switch (c.peek(1)) {
            case 'x': case 'X': base = 16; what = "hexadecimal"; break;
            case 'o': case 'O': base = 8; what = "octal"; break;
            case 'b': case 'B': base = 2; what = "binary"; break;
            default: break;
        }
        if (base != 0) {
            c.i += 2;
            std::string digits = read_digits(c, base, true);
            if (digits.empty()) {
                reject_suffix(c, start, what);
                c.fail(ErrorKind::MalformedNumber, std::string("missing digits in ") + what + " literal", start);
            }
            reject_suffix(c, start, what);
            return Value(mpz_class(digits, base));
        }
    }

    std::string int_part = read_digits(c, 10, false);
    std::string frac_part;
    std::string exponent;
    bool is_float = false;

    if (c.peek() == '.') {
        c.get();
        is_float = true;
        if (std::isdigit(static_cast<unsigned char>(c.peek()))) frac_part = read_digits(c, 10, false);
    }

    if (c.peek() == 'e' or c.peek() == 'E') {
        size_t e_at = c.i;
        c.get();
        if (c.peek() == '+' or c.peek() == '-') exponent.push_back(c.get());
        if (!std::isdigit(static_cast<unsigned char>(c.peek())))
            c.fail(ErrorKind::MalformedNumber, "exponent has no digits", e_at);
        exponent += read_digits(c, 10, false);
        is_float = true;
    }

    std::string token = int_part.empty() ? std::string("0") : int_part;
    if (!frac_part.empty()) token += "." + frac_part;
    if (!exponent.empty()) token += "e" + exponent;

    if (c.peek() == 'j' or c.peek() == 'J') {
        c.get();
        reject_suffix(c, start, "imaginary");
        return Value(std::complex<double>(0.0, decimal_to_double(token)));
    }

    if (is_float) {
        reject_suffix(c, start, "decimal");
        return Value(decimal_to_double(token));
    }

    reject_suffix(c, start, "decimal");
    if (int_part.size() > 1 and int_part[0] == '0' and int_part.find_first_not_of('0') != std::string::npos)
        c.fail(ErrorKind::MalformedNumber,
               "leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers",
               start);
    return Value(mpz_class(int_part, 10));
}

}  // namespace detail
}  // namespace pylit
