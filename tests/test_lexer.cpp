#include <doctest/doctest.h>
#include <rcl-typecheck/Lexer.hpp>

using namespace rcl::typecheck;

static std::vector<Token> lex_source(std::string_view source)
{
    Lexer lexer(source);
    auto [tokens, errors] = lexer.tokenize();
    for (auto &err : errors) MESSAGE(err.to_string());
    REQUIRE(errors.empty());
    return tokens;
}

static std::vector<TokenType> types_of(const std::vector<Token> &tokens)
{
    std::vector<TokenType> types;
    for (auto &tk : tokens) types.push_back(tk.type);
    return types;
}

TEST_CASE("lexer handles type syntax") {
    auto tokens = lex_source("Dict[String, (Int) -> Bool]");
    std::vector<TokenType> expected = {
        TokenType::NAME, TokenType::L_BRACKET, TokenType::NAME, TokenType::COMMA, TokenType::L_PAREN, TokenType::NAME,
        TokenType::R_PAREN, TokenType::ARROW, TokenType::NAME, TokenType::R_BRACKET, TokenType::END_OF_FILE,
    };
    CHECK(types_of(tokens) == expected);
    CHECK(tokens[0].text == "Dict");
    CHECK(tokens[2].text == "String");
}

TEST_CASE("lexer handles value literals") {
    auto tokens = lex_source("{\"a\": [1, -2, 3_000], b: null, c: true, d: false}");
    REQUIRE(tokens.size() == 24);
    CHECK(tokens[0].type == TokenType::L_BRACE);
    CHECK(tokens[1].type == TokenType::STRING);
    CHECK(tokens[1].text == "a");
    CHECK(tokens[2].type == TokenType::COLON);
    CHECK(tokens[4].type == TokenType::NUMBER);
    CHECK(tokens[6].text == "-2");
    CHECK(tokens[8].type == TokenType::NUMBER);
    CHECK(tokens[13].type == TokenType::NULL_LITERAL);
    CHECK(tokens[17].type == TokenType::TRUE);
    CHECK(tokens[21].type == TokenType::FALSE);
}

TEST_CASE("lexer records positions") {
    auto tokens = lex_source("  List[\n  Int]");
    REQUIRE(tokens.size() == 5);
    CHECK(tokens[0].line == 1);
    CHECK(tokens[0].column == 3);
    CHECK(tokens[0].start == 2);
    CHECK(tokens[0].end == 6);
    CHECK(tokens[2].line == 2);
    CHECK(tokens[2].column == 3);
}

TEST_CASE("lexer decodes escapes in strings") {
    auto tokens = lex_source(R"("tab\there \"quoted\" \u{41}\\")");
    REQUIRE(tokens.size() == 2);
    CHECK(tokens[0].text == "tab\there \"quoted\" A\\");
}

TEST_CASE("lexer skips comments") {
    auto tokens = lex_source("// the element type\nInt // trailing\n");
    REQUIRE(tokens.size() == 2);
    CHECK(tokens[0].text == "Int");
}

TEST_CASE("dotted names are a single token") {
    auto tokens = lex_source("std.empty_set");
    REQUIRE(tokens.size() == 2);
    CHECK(tokens[0].type == TokenType::NAME);
    CHECK(tokens[0].text == "std.empty_set");
}

TEST_CASE("lexer reports errors") {
    SUBCASE("unterminated string") {
        Lexer lexer("\"abc");
        auto [tokens, errors] = lexer.tokenize();
        REQUIRE(errors.size() == 1);
        CHECK(std::holds_alternative<Lexer::UnterminatedStringLiteral>(errors[0].kind));
    }
    SUBCASE("invalid character") {
        Lexer lexer("List[@]");
        auto [tokens, errors] = lexer.tokenize();
        REQUIRE(errors.size() == 1);
        CHECK(std::holds_alternative<Lexer::InvalidCharacter>(errors[0].kind));
    }
    SUBCASE("surrogate escape") {
        Lexer lexer(R"("\u{d800}")");
        auto [tokens, errors] = lexer.tokenize();
        REQUIRE(not errors.empty());
        CHECK(std::holds_alternative<Lexer::InvalidEscapeSequence>(errors[0].kind));
    }
    SUBCASE("escape above the last code point") {
        Lexer lexer(R"("\u{110000}")");
        auto [tokens, errors] = lexer.tokenize();
        REQUIRE(not errors.empty());
        CHECK(std::holds_alternative<Lexer::InvalidEscapeSequence>(errors[0].kind));
    }
    SUBCASE("invalid escape") {
        Lexer lexer(R"("\q")");
        auto [tokens, errors] = lexer.tokenize();
        REQUIRE(not errors.empty());
        CHECK(std::holds_alternative<Lexer::InvalidEscapeSequence>(errors[0].kind));
    }
}
