#include <tablex/types/lexer.hpp>

#include <cctype>

namespace tablex::types {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length,
                               std::size_t line, std::size_t column) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .line = line,
            .column = column,
        });
    };

    const auto is_ident_start = [](unsigned char ch) -> bool {
        return std::isalpha(ch) != 0 || ch == '_';
    };

    const auto is_ident_cont = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_';
    };

    std::size_t i = 0;
    std::size_t line = 1;
    std::size_t column = 1;

    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };
    const auto peek = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        return source[i];
    };
    const auto advance = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        char ch = source[i++];
        if (ch == '\n') {
            line += 1;
            column = 1;
        } else {
            column += 1;
        }
        return ch;
    };

    while (true) {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
            advance();
        }
        if (at_end()) {
            add_token(TokenKind::Eof, i, 0, line, column);
            break;
        }

        const std::size_t start = i;
        const std::size_t start_line = line;
        const std::size_t start_column = column;
        const char ch = advance();

        switch (ch) {
            case '*':
                add_token(TokenKind::Star, start, 1, start_line, start_column);
                continue;
            case '{':
                add_token(TokenKind::LBrace, start, 1, start_line, start_column);
                continue;
            case '}':
                add_token(TokenKind::RBrace, start, 1, start_line, start_column);
                continue;
            case ':':
                add_token(TokenKind::Colon, start, 1, start_line, start_column);
                continue;
            case ',':
                add_token(TokenKind::Comma, start, 1, start_line, start_column);
                continue;
            case '\'':
            case '"': {
                // Quoted field names allow spaces and punctuation; no escapes.
                while (!at_end() && peek() != ch && peek() != '\n') {
                    advance();
                }
                if (peek() != ch) {
                    add_token(TokenKind::Error, start, i - start, start_line, start_column);
                    continue;
                }
                advance();
                add_token(TokenKind::QuotedIdentifier, start, i - start, start_line,
                          start_column);
                continue;
            }
            default:
                break;
        }

        if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
                advance();
            }
            add_token(TokenKind::IntLiteral, start, i - start, start_line, start_column);
            continue;
        }

        if (is_ident_start(static_cast<unsigned char>(ch))) {
            while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                advance();
            }
            add_token(TokenKind::Identifier, start, i - start, start_line, start_column);
            continue;
        }

        add_token(TokenKind::Error, start, 1, start_line, start_column);
    }

    return tokens;
}

}  // namespace tablex::types
