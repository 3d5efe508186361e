#pragma once

#include <tablex/expr/node.hpp>

#include <string>

namespace tablex::expr {

/// Compact one-line rendering, e.g. `t[['a', 'b']][t[['a', 'b']]['a'] > 0]['b']`.
///
/// Placeholders of a broadcast print as column accesses on its source
/// table, so a fused expression reads like the expression it was built from.
[[nodiscard]] auto to_string(const Expr& expr) -> std::string;

}  // namespace tablex::expr
