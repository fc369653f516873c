#include "Parser.hpp"

#include <charconv>

using namespace rcl::typecheck;
using namespace rcl::typecheck::runtime;

std::expected<void, Parser::Error> Parser::expect(TokenType type)
{
    if (match(type)) return {};
    return std::unexpected(make_error(ExpectedToken(type, peek())));
}

std::expected<void, Parser::Error> Parser::expect_end()
{
    if (check(TokenType::END_OF_FILE)) return {};
    return std::unexpected(make_error(UnexpectedToken(peek())));
}

std::expected<TypePtr, Parser::Error> Parser::type()
{
    const Token &tk = peek();
    if (tk.type == TokenType::L_PAREN) {
        advance();
        std::vector<TypePtr> args;
        while (not check(TokenType::R_PAREN)) {
            auto arg = type();
            if (not arg) return std::unexpected(arg.error());
            args.push_back(*arg);
            if (not match(TokenType::COMMA)) break;
        }
        if (auto closed = expect(TokenType::R_PAREN); not closed) return std::unexpected(closed.error());
        if (auto arrow = expect(TokenType::ARROW); not arrow) return std::unexpected(arrow.error());
        auto result = type();
        if (not result) return result;
        return Type::make_function(std::move(args), *result);
    }
    if (tk.type != TokenType::NAME) return std::unexpected(make_error(ExpectedType(tk)));

    std::string name = advance().text;
    if (name == "Null") return Type::make_null();
    if (name == "Bool") return Type::make_bool();
    if (name == "Int") return Type::make_int();
    if (name == "String") return Type::make_string();
    if (name == "Dynamic") return Type::make_dynamic();
    if (name != "List" and name != "Set" and name != "Dict") return std::unexpected(make_error(UnknownType { name }));

    if (auto open = expect(TokenType::L_BRACKET); not open) return std::unexpected(open.error());
    auto first = type();
    if (not first) return first;
    TypePtr result;
    if (name == "Dict") {
        if (auto comma = expect(TokenType::COMMA); not comma) return std::unexpected(comma.error());
        auto second = type();
        if (not second) return second;
        result = Type::make_dict(*first, *second);
    } else {
        result = name == "List" ? Type::make_list(*first) : Type::make_set(*first);
    }
    if (auto closed = expect(TokenType::R_BRACKET); not closed) return std::unexpected(closed.error());
    return result;
}

std::expected<TypePtr, Parser::Error> Parser::parse_type()
{
    auto result = type();
    if (not result) return result;
    if (auto end = expect_end(); not end) return std::unexpected(end.error());
    return result;
}

std::expected<TypeReq, Parser::Error> Parser::parse_annotation()
{
    uint32_t start = peek().start;
    auto parsed = parse_type();
    if (not parsed) return std::unexpected(parsed.error());
    if ((*parsed)->kind == Type::Kind::Dynamic) return TypeReq(req::None {});

    if ((*parsed)->contains_dynamic()) return std::unexpected(make_error(DynamicInRequirement {}));
    ReqTypePtr shape = ReqType::from_type(**parsed);
    uint32_t end = _tokens.empty() ? start : _tokens[_pos > 0 ? _pos - 1 : 0].end;
    return TypeReq(req::Annotation { Span(_doc, start, end), shape });
}

std::expected<ValuePtr, Parser::Error> Parser::collection_in_braces()
{
    // `{}` is the empty dict. Otherwise the first element decides: `{k: v}` is a
    // dict and `{a, b}` is a set.
    if (match(TokenType::R_BRACE)) return Value::dict({});

    auto first = value();
    if (not first) return first;

    if (match(TokenType::COLON)) {
        std::vector<Value::Entry> entries;
        ValuePtr key = *first;
        while (true) {
            auto val = value();
            if (not val) return val;
            entries.emplace_back(key, *val);
            if (not match(TokenType::COMMA) or check(TokenType::R_BRACE)) break;
            auto next_key = value();
            if (not next_key) return next_key;
            key = *next_key;
            if (auto colon = expect(TokenType::COLON); not colon) return std::unexpected(colon.error());
        }
        if (auto closed = expect(TokenType::R_BRACE); not closed) return std::unexpected(closed.error());
        return Value::dict(std::move(entries));
    }

    std::vector<ValuePtr> elements { *first };
    while (match(TokenType::COMMA) and not check(TokenType::R_BRACE)) {
        auto elem = value();
        if (not elem) return elem;
        elements.push_back(*elem);
    }
    if (auto closed = expect(TokenType::R_BRACE); not closed) return std::unexpected(closed.error());
    return Value::set(std::move(elements));
}

std::expected<ValuePtr, Parser::Error> Parser::value()
{
    const Token &tk = peek();
    switch (tk.type) {
    case TokenType::NULL_LITERAL:
        advance();
        return Value::null();
    case TokenType::TRUE:
        advance();
        return Value::from_bool(true);
    case TokenType::FALSE:
        advance();
        return Value::from_bool(false);
    case TokenType::STRING:
        return Value::from_string(advance().text);
    case TokenType::NUMBER: {
        const std::string &digits = advance().text;
        int64_t i = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), i);
        if (ec != std::errc() or ptr != digits.data() + digits.size()) return std::unexpected(make_error(IntegerOverflow { digits }));
        return Value::from_int(i);
    }
    case TokenType::NAME:
        if (tk.text == "std.empty_set") {
            advance();
            return Value::set({});
        }
        return std::unexpected(make_error(ExpectedValue(tk)));
    case TokenType::L_BRACKET: {
        advance();
        std::vector<ValuePtr> elements;
        while (not check(TokenType::R_BRACKET)) {
            auto elem = value();
            if (not elem) return elem;
            elements.push_back(*elem);
            if (not match(TokenType::COMMA)) break;
        }
        if (auto closed = expect(TokenType::R_BRACKET); not closed) return std::unexpected(closed.error());
        return Value::list(std::move(elements));
    }
    case TokenType::L_BRACE:
        advance();
        return collection_in_braces();
    default:
        return std::unexpected(make_error(ExpectedValue(tk)));
    }
}

std::expected<ValuePtr, Parser::Error> Parser::parse_value()
{
    auto result = value();
    if (not result) return result;
    if (auto end = expect_end(); not end) return std::unexpected(end.error());
    return result;
}

template <typename TError>
static std::string join_errors(const std::vector<TError> &errors)
{
    std::string out;
    for (auto &err : errors) {
        if (not out.empty()) out += "\n";
        out += err.to_string();
    }
    return out;
}

template <typename T, typename TParse>
static std::expected<T, std::string> read(std::string_view source, DocId doc, TParse parse)
{
    Lexer lexer(source);
    auto [tks, lex_errs] = lexer.tokenize();
    if (not lex_errs.empty()) return std::unexpected(join_errors(lex_errs));
    Parser parser(std::move(tks), doc);
    auto result = parse(parser);
    if (not result) return std::unexpected(result.error().to_string());
    return *std::move(result);
}

std::expected<TypePtr, std::string> rcl::typecheck::read_type(std::string_view source)
{
    return read<TypePtr>(source, 0, [](Parser &p) { return p.parse_type(); });
}

std::expected<ValuePtr, std::string> rcl::typecheck::read_value(std::string_view source)
{
    return read<ValuePtr>(source, 0, [](Parser &p) { return p.parse_value(); });
}

std::expected<TypeReq, std::string> rcl::typecheck::read_annotation(std::string_view source, DocId doc)
{
    return read<TypeReq>(source, doc, [](Parser &p) { return p.parse_annotation(); });
}
