#pragma once

#include "Lexer.hpp"
#include "TypeReq.hpp"
#include <algorithm>
#include <expected>
#include <string>

namespace rcl::typecheck
{
    // Reads types and values written in RCL literal syntax. Types are
    // `Null`, `Bool`, `Int`, `String`, `Dynamic`, `List[T]`, `Set[T]`, `Dict[K, V]`
    // and `(A, B) -> R`. Values are JSON-like, with `{a, b}` for sets.
    class Parser {
    public:
        struct ExpectedToken {
            TokenType expected_type;
            Token got;

            explicit ExpectedToken(TokenType expected_type, const Token &got) : expected_type(expected_type), got(got) { }

            inline std::string to_string() const { return std::format("Expected `{}`, got `{}`", Token::type_to_string(expected_type), got.to_string()); }
        };

        struct ExpectedType {
            Token got;

            explicit ExpectedType(const Token &got) : got(got) { }

            inline std::string to_string() const { return std::format("Expected a type, got `{}`", got.to_string()); }
        };

        struct ExpectedValue {
            Token got;

            explicit ExpectedValue(const Token &got) : got(got) { }

            inline std::string to_string() const { return std::format("Expected a value, got `{}`", got.to_string()); }
        };

        struct UnknownType {
            std::string name;

            inline std::string to_string() const { return std::format("Unknown type: `{}`", name); }
        };

        struct IntegerOverflow {
            std::string digits;

            inline std::string to_string() const { return std::format("Integer does not fit in 64 bits: {}", digits); }
        };

        struct UnexpectedToken {
            Token got;

            explicit UnexpectedToken(const Token &got) : got(got) { }

            inline std::string to_string() const { return std::format("Unexpected token after the end: {}", got.to_string()); }
        };

        struct DynamicInRequirement {
            inline std::string to_string() const { return "`Dynamic` can only be used as the entire type of a requirement"; }
        };

        using Error = SyntaxError<
            ExpectedToken, ExpectedType, ExpectedValue, UnknownType, IntegerOverflow, UnexpectedToken, DynamicInRequirement>;

        Parser(std::vector<Token> toks, DocId doc = 0) : _tokens(std::move(toks)), _pos(0), _doc(doc) { }

        // Parse one complete type, the input must end after it.
        std::expected<TypePtr, Error> parse_type();

        // Parse one complete value, the input must end after it.
        std::expected<runtime::ValuePtr, Error> parse_value();

        // Parse a type annotation and turn it into a requirement. A bare `Dynamic`
        // requires nothing.
        std::expected<TypeReq, Error> parse_annotation();

    private:
        std::vector<Token> _tokens;
        size_t _pos;
        DocId _doc;

        const Token &peek() const { return _tokens[std::min(_pos, _tokens.size() - 1)]; }
        const Token &advance()
        {
            const Token &tk = peek();
            if (_pos < _tokens.size() - 1) _pos++;
            return tk;
        }
        bool check(TokenType type) const { return peek().type == type; }
        bool match(TokenType type)
        {
            if (not check(type)) return false;
            advance();
            return true;
        }

        inline Error make_error(Error::Kind_t err, [[maybe_unused]] std::source_location loc = std::source_location::current()) const
        {
            return Error(err, peek().line, peek().column $on_debug(, loc));
        }

        std::expected<void, Error> expect(TokenType type);
        std::expected<void, Error> expect_end();
        std::expected<TypePtr, Error> type();
        std::expected<runtime::ValuePtr, Error> value();
        std::expected<runtime::ValuePtr, Error> collection_in_braces();
    };

    // Lex and parse in one go, with all errors rendered as one message.
    std::expected<TypePtr, std::string> read_type(std::string_view source);
    std::expected<runtime::ValuePtr, std::string> read_value(std::string_view source);
    std::expected<TypeReq, std::string> read_annotation(std::string_view source, DocId doc = 0);

}
