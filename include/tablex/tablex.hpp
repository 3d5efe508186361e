#pragma once

/// Convenience umbrella header for the Tablex library.

#include <tablex/core/error.hpp>
#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/node.hpp>
#include <tablex/expr/printer.hpp>
#include <tablex/expr/scalar.hpp>
#include <tablex/expr/traversal.hpp>
#include <tablex/ops/ops.hpp>
#include <tablex/optimize/common_subexpression.hpp>
#include <tablex/optimize/lean_projection.hpp>
#include <tablex/types/datashape.hpp>
#include <tablex/types/parser.hpp>
