#pragma once

#include <tablex/core/error.hpp>
#include <tablex/types/datashape.hpp>

#include <expected>
#include <string_view>

namespace tablex::types {

/// Parse a datashape string: `var * {a: int32, b: string}`, `10 * {x: real}`,
/// `{total: int64}` or a bare primitive such as `float64`.
///
/// Errors are `ErrorKind::ParseError` with a `line:column:` prefix.
[[nodiscard]] auto parse_dshape(std::string_view text) -> std::expected<DataShape, Error>;

/// Parse the record of a schema string. Accepts a bare record or a tabular
/// shape whose measure is a record.
[[nodiscard]] auto parse_record(std::string_view text) -> std::expected<Record, Error>;

/// Parse a primitive type name, including the aliases `int`, `real`,
/// `double` and `float`.
[[nodiscard]] auto parse_primitive(std::string_view text) -> std::expected<Primitive, Error>;

}  // namespace tablex::types
