#include <catch2/catch_all.hpp>
#include <pylit/parse.h>
#include <iostream>
#include <sstream>
#include <string>

using namespace pylit;

TEST_CASE("Keyword literals") {
    REQUIRE(parse("None").is_none());
    REQUIRE(parse("True").as_bool() == true);
    REQUIRE(parse("False").as_bool() == false);
    REQUIRE(parse("  True  ").as_bool());
}

TEST_CASE("Parenthesized values: grouping versus tuples") {
    SECTION("single element with trailing comma is a tuple") {
        auto v = parse("(1,)");
        REQUIRE(v.is_tuple());
        REQUIRE(v.size() == 1);
        REQUIRE(v.at(0) == Value(1));
    }
    SECTION("single element without a comma is grouping") {
        auto v = parse("(1)");
        REQUIRE(v.is_integer());
        REQUIRE(v.as_integer() == 1);
        REQUIRE(parse("((('x')))").as_string() == "x");
    }
    SECTION("empty parentheses are an empty tuple") {
        auto v = parse("()");
        REQUIRE(v.is_tuple());
        REQUIRE(v.size() == 0);
    }
    SECTION("multiple elements with or without a trailing comma") {
        REQUIRE(parse("(1, 2)") == Value(Tuple{{Value(1), Value(2)}}));
        REQUIRE(parse("(1, 2,)") == Value(Tuple{{Value(1), Value(2)}}));
        REQUIRE(parse("( 5 , )") == Value(Tuple{{Value(5)}}));
    }
    SECTION("a grouped tuple stays a tuple") {
        REQUIRE(parse("((1,))") == Value(Tuple{{Value(1)}}));
        REQUIRE(parse("((1, 2))") == Value(Tuple{{Value(1), Value(2)}}));
    }
}

TEST_CASE("Lists") {
    REQUIRE(parse("[]") == Value(List{}));
    REQUIRE(parse("[3]") == Value(List{{Value(3)}}));
    REQUIRE(parse("[5,]") == Value(List{{Value(5)}}));
    REQUIRE(parse("[1, 2]") == Value(List{{Value(1), Value(2)}}));
    REQUIRE(parse("[5, 6., \"foo\", 2+7j,]") ==
            Value(List{{Value(5), Value(6.0), Value("foo"), Value(std::complex<double>(2.0, 7.0))}}));
}

TEST_CASE("Braces: sets and dicts") {
    SECTION("empty braces are an empty dict") {
        auto v = parse("{}");
        REQUIRE(v.is_dict());
        REQUIRE(v.size() == 0);
    }
    SECTION("entries without colons form a set") {
        auto v = parse("{1, 2}");
        REQUIRE(v.is_set());
        REQUIRE(v == Value(Set{{Value(1), Value(2)}}));
        REQUIRE(parse("{3}") == Value(Set{{Value(3)}}));
        REQUIRE(parse("{5,}") == Value(Set{{Value(5)}}));
    }
    SECTION("entries with colons form a dict") {
        auto v = parse("{1: 2}");
        REQUIRE(v.is_dict());
        REQUIRE(v.at(Value(1)) == Value(2));
        REQUIRE(parse("{ 3: None}") == Value(Dict{{{Value(3), Value()}}}));
        REQUIRE(parse("{5: 6., \"foo\" : True, b'bar' :False, }") ==
                Value(Dict{{{Value(5), Value(6.0)},
                            {Value("foo"), Value(true)},
                            {Value(Bytes{'b', 'a', 'r'}), Value(false)}}}));
    }
    SECTION("set elements are deduplicated") {
        auto v = parse("{1, 2, 1, (3, 4), (3, 4)}");
        REQUIRE(v.size() == 3);
    }
    SECTION("repeated dict keys keep the first position and the last value") {
        auto v = parse("{'a': 1, 'b': 2, 'a': 3}");
        REQUIRE(v.size() == 2);
        REQUIRE(v.as_dict().items[0].first == Value("a"));
        REQUIRE(v.as_dict().items[0].second == Value(3));
        REQUIRE(v.as_dict().items[1].first == Value("b"));
    }
    SECTION("dict insertion order is preserved") {
        auto v = parse("{'z': 1, 'a': 2, 'm': 3}");
        REQUIRE(v.as_dict().items[0].first == Value("z"));
        REQUIRE(v.as_dict().items[1].first == Value("a"));
        REQUIRE(v.as_dict().items[2].first == Value("m"));
    }
}

TEST_CASE("Nested collections") {
    auto v = parse("[1, (2, 'x'), {3: [4, 5]}]");
    Value expected(List{{
                Value(1),
                Value(Tuple{{Value(2), Value("x")}}),
                Value(Dict{{{Value(3), Value(List{{Value(4), Value(5)}})}}}),
    }});
    REQUIRE(v == expected);

    SECTION("mixed example with complex keys and byte sets") {
        auto w = parse("{ 'foo': [5, (7e3,)], 2 - 5j: {b'bar'} }");
        Value want(Dict{{
                    {Value("foo"), Value(List{{Value(5), Value(Tuple{{Value(7e3)}})}})},
                    {Value(std::complex<double>(2.0, -5.0)), Value(Set{{Value(Bytes{'b', 'a', 'r'})}})},
        }});
        REQUIRE(w == want);
    }
    SECTION("list of tuples") {
        auto w = parse("[('big', '>i4'), ('little', '<i4')]");
        REQUIRE(w.size() == 2);
        REQUIRE(w.at(1).at(1).as_string() == "<i4");
    }
}

TEST_CASE("Whitespace, comments and line continuations are skipped") {
    std::string text = R"(
# leading comment
{
    'name': 'pylit',   # trailing comment
    'sizes': [1,
              2,  # inside a list
              3],
    'flag': \
        True,
}
# final comment
)";
    auto v = parse(text);
    REQUIRE(v.is_dict());
    REQUIRE(v.size() == 3);
    REQUIRE(v.at(Value("sizes")).size() == 3);
    REQUIRE(v.at(Value("flag")).as_bool());
}

TEST_CASE("A realistic array header dictionary") {
    auto v = parse("{'descr': '<f8', 'fortran_order': False, 'shape': (3, 4), }");
    REQUIRE(v.at(Value("descr")).as_string() == "<f8");
    REQUIRE(v.at(Value("fortran_order")).as_bool() == false);
    REQUIRE(v.at(Value("shape")) == Value(Tuple{{Value(3), Value(4)}}));
}

namespace {
// Captures everything written to std::cerr while in scope.
struct CaptureCerr {
    std::ostringstream buf;
    std::streambuf* saved;
    CaptureCerr() : saved(std::cerr.rdbuf(buf.rdbuf())) {}
    ~CaptureCerr() { std::cerr.rdbuf(saved); }
};
}

TEST_CASE("Verbose parsing reports the outcome on stderr") {
    SECTION("success names the kind and the input size") {
        CaptureCerr capture;
        auto v = parse("[1, 2]", true);
        REQUIRE(v == parse("[1, 2]"));
        REQUIRE(capture.buf.str() == "pylit: parsed list from 6 bytes\n");
    }
    SECTION("quiet by default") {
        CaptureCerr capture;
        parse("{'a': 1}");
        REQUIRE_THROWS_AS(parse("[1"), ParseError);
        REQUIRE(capture.buf.str().empty());
    }
    SECTION("failure logs the error text and still throws") {
        CaptureCerr capture;
        REQUIRE_THROWS_AS(parse("[1 2]", true), ParseError);
        std::string out = capture.buf.str();
        REQUIRE(out.rfind("pylit: MalformedCollection: ", 0) == 0);
        REQUIRE(out.find("(line 1, column 4)") != std::string::npos);
    }
}

TEST_CASE("Large dict literals keep the last value for repeated keys") {
    const int n = 50000;
    std::string text = "{";
    for (int k = 0; k < n; ++k) text += std::to_string(k) + ": 0, ";
    text += "0: 'last'}";
    auto v = parse(text);
    REQUIRE(v.size() == static_cast<size_t>(n));
    REQUIRE(v.at(Value(0)) == Value("last"));
    REQUIRE(v.at(Value(n - 1)) == Value(0));
}
