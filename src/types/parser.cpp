#include <tablex/types/lexer.hpp>
#include <tablex/types/parser.hpp>

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace tablex::types {

namespace {

auto primitive_by_name(std::string_view name) -> std::optional<Primitive> {
    static const std::unordered_map<std::string_view, Primitive> names = {
        {"bool", Primitive::Bool},       {"int8", Primitive::Int8},
        {"int16", Primitive::Int16},     {"int32", Primitive::Int32},
        {"int", Primitive::Int32},       {"int64", Primitive::Int64},
        {"float32", Primitive::Float32}, {"float", Primitive::Float32},
        {"float64", Primitive::Float64}, {"real", Primitive::Float64},
        {"double", Primitive::Float64},  {"string", Primitive::String},
        {"date", Primitive::Date},       {"datetime", Primitive::DateTime},
    };
    if (auto it = names.find(name); it != names.end()) {
        return it->second;
    }
    return std::nullopt;
}

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_dshape() -> std::expected<DataShape, Error> {
        std::optional<Dimension> dim;
        if (check(TokenKind::IntLiteral) || (check(TokenKind::Identifier) &&
                                             peek().lexeme == "var")) {
            auto parsed = parse_dimension();
            if (!parsed.has_value()) {
                return std::unexpected(error_);
            }
            dim = *parsed;
            if (!consume(TokenKind::Star, "expected '*' after dimension")) {
                return std::unexpected(error_);
            }
        }
        auto measure = parse_measure();
        if (!measure.has_value()) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(
                make_error(peek(), fmt::format("unexpected {}", format_token(peek()))));
        }
        return DataShape(dim, std::move(*measure));
    }

    auto parse_primitive_only() -> std::expected<Primitive, Error> {
        auto type = parse_primitive();
        if (!type.has_value()) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(
                make_error(peek(), fmt::format("unexpected {}", format_token(peek()))));
        }
        return *type;
    }

   private:
    auto parse_dimension() -> std::optional<Dimension> {
        if (match(TokenKind::IntLiteral)) {
            std::size_t length = 0;
            const auto text = previous().lexeme;
            auto result = std::from_chars(text.data(), text.data() + text.size(), length);
            if (result.ec != std::errc()) {
                error_ = make_error(previous(), "dimension out of range");
                return std::nullopt;
            }
            return Dimension{.length = length};
        }
        advance();  // var
        return Dimension{};
    }

    auto parse_measure() -> std::optional<Measure> {
        if (match(TokenKind::LBrace)) {
            return parse_record_body();
        }
        auto type = parse_primitive();
        if (!type.has_value()) {
            return std::nullopt;
        }
        return Measure{*type};
    }

    /// Parse `field, field, ... }` after the opening brace.
    auto parse_record_body() -> std::optional<Measure> {
        const Token& open = previous();
        std::vector<Field> fields;
        while (!check(TokenKind::RBrace)) {
            auto name = consume_field_name("expected field name");
            if (!name.has_value()) {
                return std::nullopt;
            }
            if (!consume(TokenKind::Colon, "expected ':' after field name")) {
                return std::nullopt;
            }
            auto type = parse_primitive();
            if (!type.has_value()) {
                return std::nullopt;
            }
            fields.push_back(Field{.name = std::move(*name), .type = *type});
            if (!match(TokenKind::Comma)) {
                break;
            }
        }
        if (!consume(TokenKind::RBrace, "expected '}' to close record")) {
            return std::nullopt;
        }
        auto record = Record::make(std::move(fields));
        if (!record.has_value()) {
            error_ = make_error(open, record.error().message);
            error_.kind = record.error().kind;
            return std::nullopt;
        }
        return Measure{std::move(*record)};
    }

    auto parse_primitive() -> std::optional<Primitive> {
        if (!check(TokenKind::Identifier)) {
            error_ = make_error(
                peek(), fmt::format("expected type name, got {}", format_token(peek())));
            return std::nullopt;
        }
        auto type = primitive_by_name(advance().lexeme);
        if (!type.has_value()) {
            error_ = make_error(previous(), fmt::format("unknown type {}",
                                                        format_token(previous())));
            return std::nullopt;
        }
        return type;
    }

    auto consume_field_name(std::string_view message) -> std::optional<std::string> {
        if (match(TokenKind::Identifier)) {
            return std::string(previous().lexeme);
        }
        if (match(TokenKind::QuotedIdentifier)) {
            const auto text = previous().lexeme;
            return std::string(text.substr(1, text.size() - 2));
        }
        error_ = make_error(peek(), message);
        return std::nullopt;
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), message);
        return false;
    }

    auto check(TokenKind kind) const -> bool {
        if (is_at_end()) {
            return kind == TokenKind::Eof;
        }
        return peek().kind == kind;
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(const Token& token, std::string_view message) -> Error {
        return Error{
            .kind = ErrorKind::ParseError,
            .message = fmt::format("{}:{}: {}", token.line, token.column, message),
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof || token.lexeme.empty()) {
            return "'<eof>'";
        }
        return fmt::format("'{}'", std::string(token.lexeme));
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    Error error_{};
};

}  // namespace

auto parse_dshape(std::string_view text) -> std::expected<DataShape, Error> {
    Parser parser(tokenize(text));
    return parser.parse_dshape();
}

auto parse_record(std::string_view text) -> std::expected<Record, Error> {
    auto shape = parse_dshape(text);
    if (!shape.has_value()) {
        return std::unexpected(shape.error());
    }
    const auto* record = shape->record();
    if (record == nullptr) {
        return fail(ErrorKind::ParseError,
                    fmt::format("expected a record type, got '{}'", shape->to_string()));
    }
    return *record;
}

auto parse_primitive(std::string_view text) -> std::expected<Primitive, Error> {
    Parser parser(tokenize(text));
    return parser.parse_primitive_only();
}

}  // namespace tablex::types
