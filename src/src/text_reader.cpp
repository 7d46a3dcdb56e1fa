#include <pylit/detail/text_reader.h>
#include <pylit/detail/utf8.h>
#include <cctype>
#include <sstream>
#include <string>

namespace pylit {
namespace detail {

namespace {
    struct Literal {
        bool bytes = false;
        std::string body;
    };

    bool is_quote(char ch) { return ch == '\'' or ch == '"'; }

    int hex_val(char c) {
        if ('0' <= c and c <= '9') return c - '0';
        if ('a' <= c and c <= 'f') return 10 + (c - 'a');
        if ('A' <= c and c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    std::string printable(char ch) {
        unsigned char u = static_cast<unsigned char>(ch);
        if (u >= 0x20 and u < 0x7F) return std::string(1, ch);
        std::ostringstream ss;
        ss << "0x" << std::hex << static_cast<int>(u);
        return ss.str();
    }

    uint32_t read_hex(Cursor& c, int count, size_t esc_at, char kind) {
        uint32_t v = 0;
        for (int k = 0; k < count; ++k) {
            int hv = c.at_end() ? -1 : hex_val(c.peek());
            if (hv < 0)
                c.fail(ErrorKind::MalformedString,
                       std::string("truncated \\") + kind + " escape: expected " + std::to_string(count) +
                           " hex digits",
                       esc_at);
            c.get();
            v = (v << 4) | static_cast<uint32_t>(hv);
        }
        return v;
    }

    // Decode the escape sequence at the backslash under the cursor into out.
    void decode_escape(Cursor& c, bool bytes, std::string& out, size_t start) {
        size_t esc_at = c.i;
        c.get();
        if (c.at_end()) c.fail(ErrorKind::MalformedString, "unterminated string literal", start);
        char e = c.get();
        switch (e) {
            case '\n': return;
            case '\r':
                if (c.peek() == '\n') c.get();
                return;
            case '\\': out.push_back('\\'); return;
            case '\'': out.push_back('\''); return;
            case '"': out.push_back('"'); return;
            case 'a': out.push_back('\a'); return;
            case 'b': out.push_back('\b'); return;
            case 'f': out.push_back('\f'); return;
            case 'n': out.push_back('\n'); return;
            case 'r': out.push_back('\r'); return;
            case 't': out.push_back('\t'); return;
            case 'v': out.push_back('\v'); return;
            default: break;
        }

        if (e >= '0' and e <= '7') {
            uint32_t v = static_cast<uint32_t>(e - '0');
            for (int k = 0; k < 2 and c.peek() >= '0' and c.peek() <= '7'; ++k)
                v = v * 8 + static_cast<uint32_t>(c.get() - '0');
            if (bytes) {
                if (v > 0xFF)
                    c.fail(ErrorKind::MalformedString, "octal escape value out of range for bytes", esc_at);
                out.push_back(static_cast<char>(v));
            } else
                encode_utf8(v, out);
            return;
        }

        if (e == 'x') {
            uint32_t v = read_hex(c, 2, esc_at, 'x');
            if (bytes)
                out.push_back(static_cast<char>(v));
            else
                encode_utf8(v, out);
            return;
        }

        if (!bytes and (e == 'u' or e == 'U')) {
            uint32_t v = read_hex(c, e == 'u' ? 4 : 8, esc_at, e);
            if (v > 0x10FFFF)
                c.fail(ErrorKind::MalformedString, "\\U escape is beyond the Unicode range", esc_at);
            if (is_surrogate(v))
                c.fail(ErrorKind::MalformedString, "escape denotes a surrogate code point", esc_at);
            encode_utf8(v, out);
            return;
        }

        if (!bytes and e == 'N')
            c.fail(ErrorKind::MalformedString, "named Unicode escapes (\\N{...}) are not supported", esc_at);

        c.fail(ErrorKind::MalformedString,
               std::string("invalid escape sequence '\\") + printable(e) + "' in " + (bytes ? "bytes" : "string") +
                   " literal",
               esc_at);
    }

    // Length of the prefix letters before a quote at c.i, or -1 if c.i does not start a literal.
    int prefix_length(const Cursor& c) {
        size_t n = 0;
        while (n < 3 and std::isalpha(static_cast<unsigned char>(c.peek(n)))) ++n;
        if (n > 2 or !is_quote(c.peek(n))) return -1;
        if (n == 0) return 0;
        std::string p;
        for (size_t k = 0; k < n; ++k) p.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c.peek(k)))));
        if (p == "r" or p == "u" or p == "b" or p == "rb" or p == "br") return static_cast<int>(n);
        return -1;
    }

    Literal read_literal(Cursor& c) {
        size_t start = c.i;
        bool raw = false, bytes = false, unicode = false;
        while (!c.at_end() and std::isalpha(static_cast<unsigned char>(c.peek()))) {
            char p = static_cast<char>(std::tolower(static_cast<unsigned char>(c.get())));
            if (p == 'r' and !raw)
                raw = true;
            else if (p == 'b' and !bytes)
                bytes = true;
            else if (p == 'u' and !unicode)
                unicode = true;
            else
                c.fail(ErrorKind::MalformedString, "invalid string prefix", start);
        }
        if (unicode and (raw or bytes)) c.fail(ErrorKind::MalformedString, "invalid string prefix", start);
        if (!is_quote(c.peek())) c.fail(ErrorKind::MalformedString, "invalid string prefix", start);

        char q = c.get();
        bool triple = c.peek() == q and c.peek(1) == q;
        if (triple) c.i += 2;

        Literal lit;
        lit.bytes = bytes;
        std::string& out = lit.body;
        while (true) {
            if (c.at_end()) c.fail(ErrorKind::MalformedString, "unterminated string literal", start);
            char ch = c.peek();
            if (ch == q) {
                if (!triple) {
                    c.get();
                    break;
                }
                if (c.peek(1) == q and c.peek(2) == q) {
                    c.i += 3;
                    break;
                }
                out.push_back(c.get());
                continue;
            }
            if ((ch == '\n' or ch == '\r') and !triple)
                c.fail(ErrorKind::MalformedString, "unterminated string literal", start);
            if (bytes and static_cast<unsigned char>(ch) >= 0x80)
                c.fail(ErrorKind::MalformedString, "bytes can only contain ASCII literal characters", c.i);
            if (ch == '\\') {
                if (!raw) {
                    decode_escape(c, bytes, out, start);
                    continue;
                }
                // raw: the backslash stays and shields the next character
                out.push_back(c.get());
                if (c.at_end()) c.fail(ErrorKind::MalformedString, "unterminated string literal", start);
                if (bytes and static_cast<unsigned char>(c.peek()) >= 0x80)
                    c.fail(ErrorKind::MalformedString, "bytes can only contain ASCII literal characters", c.i);
                out.push_back(c.get());
                continue;
            }
            out.push_back(c.get());
        }

        if (!bytes and !is_valid_utf8(out))
            c.fail(ErrorKind::MalformedString, "string literal is not valid UTF-8", start);
        return lit;
    }
}

bool starts_text(const Cursor& c) { return prefix_length(c) >= 0; }

Value read_text(Cursor& c) {
    Literal first = read_literal(c);
    std::string out = std::move(first.body);
    while (true) {
        size_t save = c.i;
        c.skip_ws();
        if (c.at_end() or !starts_text(c)) {
            c.i = save;
            break;
        }
        size_t at = c.i;
        Literal next = read_literal(c);
        if (next.bytes != first.bytes)
            c.fail(ErrorKind::MalformedString, "cannot mix bytes and nonbytes literals", at);
        out += next.body;
    }
    if (first.bytes) return Value(Bytes(out.begin(), out.end()));
    return Value(std::move(out));
}

}  // namespace detail
}  // namespace pylit
