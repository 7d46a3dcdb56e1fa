#include <pylit/parse.h>
#include <pylit/detail/cursor.h>
#include <pylit/detail/number_reader.h>
#include <pylit/detail/text_reader.h>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pylit {

namespace {
    using detail::Cursor;

    std::string describe(char ch) {
        unsigned char u = static_cast<unsigned char>(ch);
        if (u >= 0x20 and u < 0x7F) return std::string("'") + ch + "'";
        std::ostringstream ss;
        ss << "byte 0x" << std::hex << static_cast<int>(u);
        return ss.str();
    }

    bool is_closer(char ch) { return ch == ')' or ch == ']' or ch == '}'; }

    Value negate(const Value& v) {
        if (v.is_integer()) return Value(mpz_class(-v.as_integer()));
        if (v.is_float()) return Value(-v.as_float());
        auto z = v.as_complex();
        return Value(std::complex<double>(-z.real(), -z.imag()));
    }

    // Collections may nest this deep; deeper input is rejected before the stack runs out.
    constexpr size_t max_depth = 1000;

    struct Nesting {
        size_t& depth;
        explicit Nesting(size_t& d) : depth(d) { ++depth; }
        ~Nesting() { --depth; }
    };

    struct Parser {
        Cursor c;
        size_t depth = 0;

        explicit Parser(const std::string& text) : c(text) {}

        void check_depth() {
            if (depth > max_depth)
                c.fail(ErrorKind::MalformedCollection,
                       "nesting too deep (more than " + std::to_string(max_depth) + " levels)");
        }

        Value parse_value() {
            c.skip_ws();
            if (c.at_end()) c.fail(ErrorKind::UnexpectedEndOfInput, "expected a value");
            char ch = c.peek();
            if (ch == '(') return parse_paren();
            if (ch == '[') return parse_list();
            if (ch == '{') return parse_brace();
            if (ch == '\'' or ch == '"') return detail::read_text(c);
            if (ch == '+' or ch == '-' or detail::starts_number(c)) return parse_number_expr();
            if (std::isalpha(static_cast<unsigned char>(ch)) or ch == '_') return parse_word();
            c.fail(ErrorKind::UnexpectedToken, "unexpected " + describe(ch) + " while parsing value");
        }

        Value parse_word() {
            size_t start = c.i;
            size_t end = start;
            while (end < c.s.size() and
                   (std::isalnum(static_cast<unsigned char>(c.s[end])) or c.s[end] == '_'))
                ++end;
            if (end < c.s.size() and (c.s[end] == '\'' or c.s[end] == '"')) return detail::read_text(c);
            std::string word = c.s.substr(start, end - start);
            if (word == "None") {
                c.i = end;
                return Value::none();
            }
            if (word == "True" or word == "False") {
                c.i = end;
                return Value(word == "True");
            }
            std::string hint;
            if (word == "null" or word == "none") hint = " (did you mean 'None'?)";
            if (word == "true") hint = " (did you mean 'True'?)";
            if (word == "false") hint = " (did you mean 'False'?)";
            c.fail(ErrorKind::UnexpectedToken, "unexpected name '" + word + "'" + hint);
        }

        // [sign] number, or [sign] real (+|-) imaginary
        Value parse_number_expr() {
            size_t start = c.i;
            char sign = '\0';
            if (c.peek() == '+' or c.peek() == '-') {
                sign = c.get();
                c.skip_ws();
                if (c.at_end()) c.fail(ErrorKind::UnexpectedEndOfInput, "expected a number after sign");
                if (!detail::starts_number(c))
                    c.fail(ErrorKind::UnexpectedToken,
                           "expected a number after '" + std::string(1, sign) + "', found " + describe(c.peek()));
            }
            Value left = detail::read_number(c);
            if (sign == '-') left = negate(left);
            if (left.is_complex()) return left;

            size_t save = c.i;
            c.skip_ws();
            char op = c.peek();
            if (c.at_end() or (op != '+' and op != '-')) {
                c.i = save;
                return left;
            }
            c.get();
            c.skip_ws();
            if (c.at_end()) c.fail(ErrorKind::UnexpectedEndOfInput, "expected an imaginary number after operator");
            size_t rhs_at = c.i;
            if (!detail::starts_number(c))
                c.fail(ErrorKind::MalformedNumber, "expected an imaginary number after '" + std::string(1, op) + "'");
            Value right = detail::read_number(c);
            if (!right.is_complex())
                c.fail(ErrorKind::MalformedNumber,
                       "only a real and an imaginary number can be added or subtracted", rhs_at);

            double re;
            if (left.is_float())
                re = left.as_float();
            else if (!detail::integer_to_double(left.as_integer(), re))
                c.fail(ErrorKind::MalformedNumber, "integer too large to convert to float", start);
            double im = right.as_complex().imag();
            return Value(std::complex<double>(re, op == '-' ? -im : im));
        }

        // Parse the element at the cursor, rejecting separators and stray closers first.
        Value parse_element(char close) {
            c.skip_ws();
            if (c.at_end()) c.fail(ErrorKind::UnexpectedEndOfInput, std::string("expected a value or '") + close + "'");
            char ch = c.peek();
            if (ch == ',' or ch == ':') c.fail(ErrorKind::MalformedCollection, "unexpected " + describe(ch));
            if (ch == close) c.fail(ErrorKind::MalformedCollection, "missing value before " + describe(ch));
            if (is_closer(ch))
                c.fail(ErrorKind::MalformedCollection,
                       "mismatched " + describe(ch) + ", expected a value or '" + std::string(1, close) + "'");
            return parse_value();
        }

        // After an element: consume ',' or the closer. Returns true when the collection closed.
        bool parse_separator(char close, bool& saw_comma) {
            c.skip_ws();
            if (c.at_end()) c.fail(ErrorKind::UnexpectedEndOfInput, std::string("expected ',' or '") + close + "'");
            char ch = c.peek();
            if (ch == close) {
                c.get();
                c.pop_opener();
                return true;
            }
            if (ch == ',') {
                c.get();
                saw_comma = true;
                c.skip_ws();
                if (c.peek() == close and !c.at_end()) {
                    c.get();
                    c.pop_opener();
                    return true;
                }
                return false;
            }
            if (is_closer(ch))
                c.fail(ErrorKind::MalformedCollection,
                       "mismatched " + describe(ch) + ", expected '" + std::string(1, close) + "'");
            c.fail(ErrorKind::MalformedCollection,
                   "expected ',' or '" + std::string(1, close) + "', found " + describe(ch));
        }

        std::vector<Value> parse_sequence(char close, bool& saw_comma) {
            Nesting guard(depth);
            check_depth();
            c.push_opener(c.peek());
            c.get();
            std::vector<Value> items;
            c.skip_ws();
            if (c.peek() == close and !c.at_end()) {
                c.get();
                c.pop_opener();
                return items;
            }
            while (true) {
                items.push_back(parse_element(close));
                if (parse_separator(close, saw_comma)) break;
            }
            return items;
        }

        Value parse_paren() {
            bool saw_comma = false;
            auto items = parse_sequence(')', saw_comma);
            // (x) is grouping, (x,) and () are tuples
            if (items.size() == 1 and !saw_comma) return std::move(items.front());
            return Value(Tuple{std::move(items)});
        }

        Value parse_list() {
            bool saw_comma = false;
            return Value(List{parse_sequence(']', saw_comma)});
        }

        Value parse_brace() {
            Nesting guard(depth);
            check_depth();
            c.push_opener(c.peek());
            c.get();
            c.skip_ws();
            if (c.peek() == '}' and !c.at_end()) {
                c.get();
                c.pop_opener();
                return Value(Dict{});
            }

            Value first = parse_element('}');
            c.skip_ws();
            bool is_dict = c.peek() == ':' and !c.at_end();
            std::vector<Value> set_items;
            std::vector<std::pair<Value, Value>> dict_items;

            Value key = std::move(first);
            bool saw_comma = false;
            while (true) {
                c.skip_ws();
                if (is_dict) {
                    if (c.at_end()) c.fail(ErrorKind::UnexpectedEndOfInput, "expected ':' after dict key");
                    if (c.peek() != ':')
                        c.fail(ErrorKind::MalformedCollection, "expected ':' after dict key, found " + describe(c.peek()));
                    c.get();
                    Value val = parse_element('}');
                    dict_items.emplace_back(std::move(key), std::move(val));
                } else {
                    if (c.peek() == ':' and !c.at_end())
                        c.fail(ErrorKind::MalformedCollection, "cannot mix set elements and dict entries");
                    set_items.push_back(std::move(key));
                }
                if (parse_separator('}', saw_comma)) break;
                key = parse_element('}');
            }
            if (is_dict) return Value(Dict{std::move(dict_items)});
            return Value(Set{std::move(set_items)});
        }
    };
}

Value parse(const std::string& text, bool verbose) {
    try {
        Parser p(text);
        p.c.skip_ws();
        if (p.c.at_end()) p.c.fail(ErrorKind::UnexpectedEndOfInput, "no literal in input");
        Value v = p.parse_value();
        p.c.skip_ws();
        if (!p.c.at_end())
            p.c.fail(ErrorKind::TrailingInput, "extra data after literal: " + describe(p.c.peek()));
        if (verbose) std::cerr << "pylit: parsed " << kind_name(v.kind()) << " from " << text.size() << " bytes\n";
        return v;
    } catch (const ParseError& e) {
        if (verbose) std::cerr << "pylit: " << e.what() << "\n";
        throw;
    }
}

}  // namespace pylit
