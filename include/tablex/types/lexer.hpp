#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tablex::types {

/// Token types for datashape strings such as `var * {name: string, amount: int64}`.
enum class TokenKind : std::uint8_t {
    IntLiteral,
    Identifier,
    QuotedIdentifier,

    Star,    // *
    LBrace,  // {
    RBrace,  // }
    Colon,   // :
    Comma,   // ,

    Eof,
    Error,
};

/// A single token with source location.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t line = 0;
    std::size_t column = 0;
};

/// Tokenize a datashape string.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace tablex::types
