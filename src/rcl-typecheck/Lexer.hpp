#pragma once

#include "Common.hpp"
#include <cctype>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rcl::typecheck
{
    // Tokens of the literal syntax for types and values, e.g.
    // `Dict[String, List[Int]]` or `{"a": [1, 2]}`.
    enum class TokenType {
        END_OF_FILE,
        NAME,
        NUMBER,
        STRING,
        NULL_LITERAL,
        TRUE,
        FALSE,

        L_BRACKET,
        R_BRACKET,
        L_BRACE,
        R_BRACE,
        L_PAREN,
        R_PAREN,
        COMMA,
        COLON,
        ARROW
    };

    struct Token {
        TokenType type;
        std::string text;
        int line, column;
        // Byte offsets into the source.
        uint32_t start, end;

        static constexpr std::string_view type_to_string(TokenType type)
        {
            switch (type) {
            case TokenType::END_OF_FILE: return "<EOF>";
            case TokenType::NAME: return "Name";
            case TokenType::NUMBER: return "Number";
            case TokenType::STRING: return "String";
            case TokenType::NULL_LITERAL: return "null";
            case TokenType::TRUE: return "true";
            case TokenType::FALSE: return "false";
            case TokenType::L_BRACKET: return "[";
            case TokenType::R_BRACKET: return "]";
            case TokenType::L_BRACE: return "{";
            case TokenType::R_BRACE: return "}";
            case TokenType::L_PAREN: return "(";
            case TokenType::R_PAREN: return ")";
            case TokenType::COMMA: return ",";
            case TokenType::COLON: return ":";
            case TokenType::ARROW: return "->";
            }
            return "Unknown";
        }

        std::string to_string() const
        {
            switch (type) {
            case TokenType::NAME:
                return "Name(" + text + ")";
            case TokenType::NUMBER:
                return "Number(" + text + ")";
            case TokenType::STRING:
                return "String(\"" + text + "\")";
            default:
                return std::string(type_to_string(type));
            }
        }
    };

    class Lexer {
    public:
        struct InvalidCharacter {
            char character;

            inline std::string to_string() const { return std::format("Invalid character: '{}'", character); }
        };

        struct UnterminatedStringLiteral {
            inline std::string to_string() const { return "Unterminated string literal"; }
        };

        struct InvalidEscapeSequence {
            char escape;

            inline std::string to_string() const { return std::format("Invalid escape sequence: '\\{}'", escape); }
        };

        struct Overflow {
            inline std::string to_string() const { return "Lexer overflow"; }
        };

        struct TooManyErrors {
            size_t error_count;

            inline std::string to_string() const { return std::format("Too many errors: {}", error_count); }
        };

        using Error = SyntaxError<InvalidCharacter, UnterminatedStringLiteral, InvalidEscapeSequence, Overflow, TooManyErrors>;

        Lexer(std::string_view source) : max_errors(10), src(source), length(source.size()), pos(0), line(1), col(1), tokens(), errors() { }
        std::pair<std::vector<Token>, std::vector<Error>> tokenize();
        std::expected<Token, Error> lex();

        const size_t max_errors;

    private:
        std::string src;
        size_t length, pos;
        int line, col;
        std::vector<Token> tokens;
        std::vector<Error> errors;

        inline Error make_error(Error::Kind_t err, [[maybe_unused]] std::source_location loc = std::source_location::current()) const
        {
            return Error(err, line, col $on_debug(, loc));
        }

        inline char peek(size_t look_ahead = 0) const { return pos + look_ahead < length ? src[pos + look_ahead] : '\0'; }

        char consume()
        {
            if (pos >= length) return '\0';
            char c = src[pos++];
            if (c == '\n') {
                line++;
                col = 1;
            } else {
                col++;
            }
            return c;
        }

        void skip_whitespace_and_comments()
        {
            while (true) {
                char c = peek();
                if (c == ' ' or c == '\t' or c == '\r' or c == '\n') {
                    consume();
                } else if (c == '/' and peek(1) == '/') {
                    while (peek() != '\n' and peek() != '\0') consume();
                } else {
                    break;
                }
            }
        }

        Token make_token(TokenType type, std::string text, int tok_line, int tok_col, size_t start) const
        {
            return Token { type, std::move(text), tok_line, tok_col, static_cast<uint32_t>(start), static_cast<uint32_t>(pos) };
        }

        std::expected<Token, Error> read_string();
        Token read_number();
        Token read_name();
    };

}
