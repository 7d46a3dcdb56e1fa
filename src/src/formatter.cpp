#include <pylit/format.h>
#include <pylit/detail/number_reader.h>
#include <pylit/detail/utf8.h>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pylit {

namespace {
    void hex_escape(std::ostringstream& out, char kind, uint32_t v, int width) {
        static const char* digits = "0123456789abcdef";
        out << '\\' << kind;
        for (int shift = (width - 1) * 4; shift >= 0; shift -= 4) out << digits[(v >> shift) & 0xF];
    }

    // Shortest digits that round-trip, laid out like Python's float repr.
    std::string format_float(double d) {
        if (std::isnan(d)) return "nan";
        // 1e999 overflows to infinity when read back
        if (std::isinf(d)) return d < 0 ? "-1e999" : "1e999";

        std::string sci;
        for (int prec = 0; prec <= 16; ++prec) {
            std::ostringstream ss;
            ss.imbue(std::locale::classic());
            ss << std::scientific << std::setprecision(prec) << d;
            sci = ss.str();
            if (detail::decimal_to_double(sci) == d) break;
        }

        bool negative = sci[0] == '-';
        size_t epos = sci.find('e');
        int exp = std::atoi(sci.c_str() + epos + 1);
        std::string digits;
        for (size_t k = negative ? 1 : 0; k < epos; ++k)
            if (sci[k] != '.') digits.push_back(sci[k]);
        while (digits.size() > 1 and digits.back() == '0') digits.pop_back();

        std::string out = negative ? "-" : "";
        if (exp >= -4 and exp < 16) {
            if (exp < 0) {
                out += "0." + std::string(static_cast<size_t>(-exp - 1), '0') + digits;
            } else {
                size_t int_len = static_cast<size_t>(exp) + 1;
                if (digits.size() <= int_len)
                    out += digits + std::string(int_len - digits.size(), '0') + ".0";
                else
                    out += digits.substr(0, int_len) + "." + digits.substr(int_len);
            }
        } else {
            out += digits.substr(0, 1);
            if (digits.size() > 1) out += "." + digits.substr(1);
            out += exp < 0 ? "e-" : "e+";
            int mag = std::abs(exp);
            if (mag < 10) out += '0';
            out += std::to_string(mag);
        }
        return out;
    }

    std::string format_complex(std::complex<double> z) {
        double re = z.real(), im = z.imag();
        // "2.0j" reads back with real +0.0; "-2.0j" would not, so keep the real part there
        bool omit_real = re == 0.0 and !std::signbit(re) and !std::signbit(im);
        std::string out;
        if (!omit_real) out += format_float(re);
        if (std::signbit(im))
            out += "-" + format_float(-im);
        else if (!omit_real)
            out += "+" + format_float(im);
        else
            out += format_float(im);
        out += 'j';
        return out;
    }

    struct Printer {
        std::ostringstream out;
        const FormatOptions& opts;

        explicit Printer(const FormatOptions& o) : opts(o) {}

        void emit_string(const std::string& s) {
            char q = opts.quote;
            out << q;
            size_t i = 0;
            while (i < s.size()) {
                uint32_t cp;
                size_t n = detail::decode_utf8(s, i, cp);
                if (n == 0) {
                    // not reachable for a constructed Value; keep the output well-formed
                    cp = 0xFFFD;
                    n = 1;
                }
                i += n;
                if (cp == '\\')
                    out << "\\\\";
                else if (cp == static_cast<unsigned char>(q))
                    out << '\\' << q;
                else if (cp == '\n')
                    out << "\\n";
                else if (cp == '\r')
                    out << "\\r";
                else if (cp == '\t')
                    out << "\\t";
                else if (cp < 0x20 or cp == 0x7F or (cp >= 0x80 and cp <= 0x9F))
                    hex_escape(out, 'x', cp, 2);
                else if (cp == 0x2028 or cp == 0x2029)
                    hex_escape(out, 'u', cp, 4);
                else if (cp >= 0x80 and opts.ascii_only) {
                    if (cp <= 0xFF)
                        hex_escape(out, 'x', cp, 2);
                    else if (cp <= 0xFFFF)
                        hex_escape(out, 'u', cp, 4);
                    else
                        hex_escape(out, 'U', cp, 8);
                } else {
                    std::string utf8;
                    detail::encode_utf8(cp, utf8);
                    out << utf8;
                }
            }
            out << q;
        }

        void emit_bytes(const Bytes& b) {
            char q = opts.quote;
            out << 'b' << q;
            for (std::uint8_t byte : b) {
                if (byte == '\\')
                    out << "\\\\";
                else if (byte == static_cast<unsigned char>(q))
                    out << '\\' << q;
                else if (byte == '\n')
                    out << "\\n";
                else if (byte == '\r')
                    out << "\\r";
                else if (byte == '\t')
                    out << "\\t";
                else if (byte < 0x20 or byte >= 0x7F)
                    hex_escape(out, 'x', byte, 2);
                else
                    out << static_cast<char>(byte);
            }
            out << q;
        }

        void emit_items(const std::vector<Value>& items) {
            for (size_t k = 0; k < items.size(); ++k) {
                if (k) out << ", ";
                emit(items[k]);
            }
        }

        void emit(const Value& v) {
            switch (v.kind()) {
                case Value::Kind::None:
                    out << "None";
                    break;
                case Value::Kind::Boolean:
                    out << (v.as_bool() ? "True" : "False");
                    break;
                case Value::Kind::Integer:
                    out << v.as_integer().get_str(10);
                    break;
                case Value::Kind::Float:
                    out << format_float(v.as_float());
                    break;
                case Value::Kind::Complex:
                    out << format_complex(v.as_complex());
                    break;
                case Value::Kind::Bytes:
                    emit_bytes(v.as_bytes());
                    break;
                case Value::Kind::String:
                    emit_string(v.as_string());
                    break;
                case Value::Kind::Tuple: {
                    const auto& items = v.as_tuple().items;
                    out << '(';
                    emit_items(items);
                    if (items.size() == 1) out << ',';
                    out << ')';
                    break;
                }
                case Value::Kind::List:
                    out << '[';
                    emit_items(v.as_list().items);
                    out << ']';
                    break;
                case Value::Kind::Set:
                    if (v.as_set().items.empty()) {
                        out << "set()";
                        break;
                    }
                    out << '{';
                    emit_items(v.as_set().items);
                    out << '}';
                    break;
                case Value::Kind::Dict: {
                    const auto& items = v.as_dict().items;
                    out << '{';
                    for (size_t k = 0; k < items.size(); ++k) {
                        if (k) out << ", ";
                        emit(items[k].first);
                        out << ": ";
                        emit(items[k].second);
                    }
                    out << '}';
                    break;
                }
            }
        }
    };
}

std::string format(const Value& v) { return format(v, FormatOptions{}); }

std::string format(const Value& v, const FormatOptions& options) {
    if (options.quote != '"' and options.quote != '\'')
        throw std::invalid_argument(std::string("unsupported quote character '") + options.quote + "'");
    Printer p(options);
    p.emit(v);
    return p.out.str();
}

}  // namespace pylit
