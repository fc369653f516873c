#include "Lexer.hpp"

using namespace rcl::typecheck;

static void append_utf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    } else {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
}

std::expected<Token, Lexer::Error> Lexer::read_string()
{
    int tok_line = line;
    int tok_col = col;
    size_t start = pos;
    consume();
    std::string text;
    while (true) {
        char c = peek();
        if (c == '\0' or c == '\n') return std::unexpected(make_error(UnterminatedStringLiteral {}));
        consume();
        if (c == '"') break;
        if (c != '\\') {
            text += c;
            continue;
        }
        char esc = consume();
        switch (esc) {
        case '"': text += '"'; break;
        case '\\': text += '\\'; break;
        case 'n': text += '\n'; break;
        case 't': text += '\t'; break;
        case 'r': text += '\r'; break;
        case 'u': {
            // \u{1f600}
            if (peek() != '{') return std::unexpected(make_error(InvalidEscapeSequence { esc }));
            consume();
            uint32_t cp = 0;
            int digits = 0;
            while (std::isxdigit(static_cast<unsigned char>(peek())) and digits < 6) {
                char h = consume();
                cp = cp * 16 + (std::isdigit(static_cast<unsigned char>(h)) ? h - '0' : (std::tolower(h) - 'a' + 10));
                digits++;
            }
            if (digits == 0 or peek() != '}' or cp > 0x10ffff or (cp >= 0xd800 and cp <= 0xdfff)) return std::unexpected(make_error(InvalidEscapeSequence { esc }));
            consume();
            append_utf8(text, cp);
            break;
        }
        default:
            return std::unexpected(make_error(InvalidEscapeSequence { esc }));
        }
    }
    return make_token(TokenType::STRING, std::move(text), tok_line, tok_col, start);
}

Token Lexer::read_number()
{
    int tok_line = line;
    int tok_col = col;
    size_t start = pos;
    std::string text;
    if (peek() == '-') text += consume();
    while (std::isdigit(static_cast<unsigned char>(peek())) or peek() == '_') {
        char c = consume();
        if (c != '_') text += c;
    }
    return make_token(TokenType::NUMBER, std::move(text), tok_line, tok_col, start);
}

Token Lexer::read_name()
{
    int tok_line = line;
    int tok_col = col;
    size_t start = pos;
    std::string text;
    while (std::isalnum(static_cast<unsigned char>(peek())) or peek() == '_' or peek() == '.') text += consume();
    if (text == "null") return make_token(TokenType::NULL_LITERAL, std::move(text), tok_line, tok_col, start);
    if (text == "true") return make_token(TokenType::TRUE, std::move(text), tok_line, tok_col, start);
    if (text == "false") return make_token(TokenType::FALSE, std::move(text), tok_line, tok_col, start);
    return make_token(TokenType::NAME, std::move(text), tok_line, tok_col, start);
}

std::expected<Token, Lexer::Error> Lexer::lex()
{
    skip_whitespace_and_comments();
    if (pos >= length) return std::unexpected(make_error(Overflow {}));
    char c = peek();
    int tok_line = line;
    int tok_col = col;
    size_t start = pos;
    if (c == '"') return read_string();
    if (std::isdigit(static_cast<unsigned char>(c)) or (c == '-' and std::isdigit(static_cast<unsigned char>(peek(1))))) return read_number();
    if (std::isalpha(static_cast<unsigned char>(c)) or c == '_') return read_name();

    auto single = [&](TokenType type) {
        consume();
        return make_token(type, std::string(1, c), tok_line, tok_col, start);
    };
    switch (c) {
    case '[': return single(TokenType::L_BRACKET);
    case ']': return single(TokenType::R_BRACKET);
    case '{': return single(TokenType::L_BRACE);
    case '}': return single(TokenType::R_BRACE);
    case '(': return single(TokenType::L_PAREN);
    case ')': return single(TokenType::R_PAREN);
    case ',': return single(TokenType::COMMA);
    case ':': return single(TokenType::COLON);
    case '-':
        if (peek(1) == '>') {
            consume();
            consume();
            return make_token(TokenType::ARROW, "->", tok_line, tok_col, start);
        }
        [[fallthrough]];
    default:
        char invalid = c;
        consume();
        return std::unexpected(make_error(InvalidCharacter { invalid }));
    }
}

std::pair<std::vector<Token>, std::vector<Lexer::Error>> Lexer::tokenize()
{
    while (true) {
        if (std::expected<Token, Error> val = lex()) {
            tokens.push_back(*val);
        } else {
            if (errors.size() >= max_errors) {
                errors.push_back(make_error(TooManyErrors { errors.size() }));
                break;
            }
            auto e = val.error();
            if (std::holds_alternative<Overflow>(e.kind)) {
                tokens.push_back(make_token(TokenType::END_OF_FILE, "<EOF>", line, col, pos));
                break;
            } else errors.push_back(e);
        }
    }
    return { tokens, errors };
}
