#include <catch2/catch_all.hpp>
#include <pylit/parse.h>
#include <string>

using namespace pylit;

static ErrorKind error_kind(const std::string& text) {
    try {
        parse(text);
    } catch (const ParseError& e) {
        return e.kind();
    }
    FAIL("expected parse to throw for: " << text);
    return ErrorKind::UnexpectedToken;
}

TEST_CASE("Each failure category is reported") {
    REQUIRE(error_kind("[1, 2") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("'unterminated") == ErrorKind::MalformedString);
    REQUIRE(error_kind("123abc") == ErrorKind::MalformedNumber);
    REQUIRE(error_kind("1 2") == ErrorKind::TrailingInput);
    REQUIRE(error_kind("[1 2]") == ErrorKind::MalformedCollection);
    REQUIRE(error_kind("foo") == ErrorKind::UnexpectedToken);
}

TEST_CASE("Input without a literal") {
    REQUIRE(error_kind("") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("   \n\t") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("# only a comment") == ErrorKind::UnexpectedEndOfInput);
}

TEST_CASE("Unclosed collections hit end of input") {
    REQUIRE(error_kind("(") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("[1,") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("{1: 2") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("{1:") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("{'a'") == ErrorKind::UnexpectedEndOfInput);
    REQUIRE(error_kind("-") == ErrorKind::UnexpectedEndOfInput);
}

TEST_CASE("Malformed collections") {
    SECTION("missing or doubled commas") {
        REQUIRE(error_kind("[1 2]") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("[,1]") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("[1,,2]") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("(,)") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("{,}") == ErrorKind::MalformedCollection);
    }
    SECTION("mixing set elements and dict entries") {
        REQUIRE(error_kind("{1: 2, 3}") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("{1, 2: 3}") == ErrorKind::MalformedCollection);
    }
    SECTION("missing dict values or keys") {
        REQUIRE(error_kind("{1:}") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("{:1}") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("{1: 2:}") == ErrorKind::MalformedCollection);
    }
    SECTION("mismatched closers") {
        REQUIRE(error_kind("(1]") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("[1)") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("{1, 2]") == ErrorKind::MalformedCollection);
        REQUIRE(error_kind("[(]") == ErrorKind::MalformedCollection);
    }
    SECTION("colons outside a dict") {
        REQUIRE(error_kind("[1: 2]") == ErrorKind::MalformedCollection);
    }
}

TEST_CASE("Unexpected tokens") {
    REQUIRE(error_kind("@") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("]") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("- x") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("+'a'") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("[1, x]") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("nan") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("inf") == ErrorKind::UnexpectedToken);
    REQUIRE(error_kind("none") == ErrorKind::UnexpectedToken);
}

TEST_CASE("Trailing input after a complete literal") {
    REQUIRE(error_kind("[1, 2]]") == ErrorKind::TrailingInput);
    REQUIRE(error_kind("None None") == ErrorKind::TrailingInput);
    REQUIRE(error_kind("1,") == ErrorKind::TrailingInput);
    REQUIRE(error_kind("{} []") == ErrorKind::TrailingInput);
}

TEST_CASE("Misspelled keywords get a hint") {
    try {
        parse("[true]");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(e.kind() == ErrorKind::UnexpectedToken);
        std::string msg = e.what();
        REQUIRE(msg.find("did you mean 'True'?") != std::string::npos);
    }
    try {
        parse("null");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("did you mean 'None'?") != std::string::npos);
    }
}

TEST_CASE("Error messages carry location, source line and caret") {
    std::string text = "[1,\n  @]";
    try {
        parse(text);
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(e.kind() == ErrorKind::UnexpectedToken);
        REQUIRE(e.offset() == 6);
        REQUIRE(e.line() == 2);
        REQUIRE(e.column() == 3);
        std::string expected = "UnexpectedToken: unexpected '@' while parsing value (line 2, column 3)\n"
                               "  @]\n"
                               "  ^\n"
                               "('[' opened at line 1, column 1)";
        REQUIRE(std::string(e.what()) == expected);
    }
}

TEST_CASE("Errors name the innermost open collection") {
    try {
        parse("{'a': [1,\n 2,\n (3 4)]}");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(e.kind() == ErrorKind::MalformedCollection);
        REQUIRE(e.line() == 3);
        REQUIRE(e.column() == 5);
        std::string msg = e.what();
        REQUIRE(msg.find("('(' opened at line 3, column 2)") != std::string::npos);
    }
}

TEST_CASE("Top level errors carry no opener note") {
    try {
        parse("1 2");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(e.kind() == ErrorKind::TrailingInput);
        REQUIRE(e.offset() == 2);
        std::string msg = e.what();
        REQUIRE(msg.find("opened at") == std::string::npos);
        REQUIRE(msg.find("1 2\n  ^") != std::string::npos);
    }
}

TEST_CASE("Error kinds have stable names") {
    REQUIRE(std::string(to_string(ErrorKind::MalformedNumber)) == "MalformedNumber");
    REQUIRE(std::string(to_string(ErrorKind::MalformedString)) == "MalformedString");
    REQUIRE(std::string(to_string(ErrorKind::MalformedCollection)) == "MalformedCollection");
    REQUIRE(std::string(to_string(ErrorKind::UnexpectedToken)) == "UnexpectedToken");
    REQUIRE(std::string(to_string(ErrorKind::TrailingInput)) == "TrailingInput");
    REQUIRE(std::string(to_string(ErrorKind::UnexpectedEndOfInput)) == "UnexpectedEndOfInput");
}

TEST_CASE("ParseError is a runtime_error") {
    REQUIRE_THROWS_AS(parse("[1"), std::runtime_error);
    REQUIRE_THROWS_AS(parse("[1", true), ParseError);
}

TEST_CASE("Nesting depth is limited") {
    SECTION("a thousand levels parse") {
        std::string text = std::string(1000, '[') + std::string(1000, ']');
        auto v = parse(text);
        REQUIRE(v.is_list());
        REQUIRE(v.size() == 1);
    }
    SECTION("one level more is rejected") {
        std::string text = std::string(1001, '(') + "1" + std::string(1001, ')');
        REQUIRE(error_kind(text) == ErrorKind::MalformedCollection);
    }
    SECTION("runaway openers fail cleanly") {
        try {
            parse(std::string(100000, '['));
            FAIL("expected parse to throw");
        } catch (const ParseError& e) {
            REQUIRE(e.kind() == ErrorKind::MalformedCollection);
            REQUIRE(e.offset() == 1000);
            std::string msg = e.what();
            REQUIRE(msg.find("nesting too deep") != std::string::npos);
        }
    }
    SECTION("mixed brackets count toward the same limit") {
        std::string text;
        for (int k = 0; k < 600; ++k) text += "[{";
        REQUIRE(error_kind(text) == ErrorKind::MalformedCollection);
    }
}
