#pragma once

#include <tablex/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tablex::types {

/// Element types a record field can carry.
enum class Primitive : std::uint8_t {
    Bool,
    Int8,
    Int16,
    Int32,
    Int64,
    Float32,
    Float64,
    String,
    Date,
    DateTime,
};

[[nodiscard]] auto to_string(Primitive type) -> std::string_view;
[[nodiscard]] auto is_integral(Primitive type) noexcept -> bool;
[[nodiscard]] auto is_floating(Primitive type) noexcept -> bool;
[[nodiscard]] auto is_numeric(Primitive type) noexcept -> bool;

/// Wider of two numeric types (int8 < int16 < int32 < int64 < float32 < float64).
[[nodiscard]] auto promote(Primitive lhs, Primitive rhs) noexcept -> Primitive;

struct Field {
    std::string name;
    Primitive type = Primitive::Int64;

    auto operator==(const Field&) const -> bool = default;
};

/// Ordered, uniquely-named sequence of fields: the schema of one row.
class Record {
   public:
    Record() = default;

    /// Validates name uniqueness.
    [[nodiscard]] static auto make(std::vector<Field> fields) -> std::expected<Record, Error>;

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> const Field*;
    [[nodiscard]] auto index_of(std::string_view name) const -> std::optional<std::size_t>;

    /// Restrict and reorder to `names`.
    [[nodiscard]] auto restrict(const std::vector<std::string>& names) const
        -> std::expected<Record, Error>;

    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const Record&) const -> bool = default;

   private:
    explicit Record(std::vector<Field> fields) : fields_(std::move(fields)) {}

    std::vector<Field> fields_;
};

/// A table dimension: `var` (length unknown) or a fixed row count.
struct Dimension {
    std::optional<std::size_t> length;

    [[nodiscard]] auto is_var() const noexcept -> bool { return !length.has_value(); }

    auto operator==(const Dimension&) const -> bool = default;
};

using Measure = std::variant<Primitive, Record>;

/// Dimension (optional) times measure. A shape with a dimension is tabular;
/// one without is a single value, e.g. the result of a reduction.
class DataShape {
   public:
    DataShape() = default;
    DataShape(std::optional<Dimension> dim, Measure measure)
        : dim_(dim), measure_(std::move(measure)) {}

    [[nodiscard]] static auto table(Record record) -> DataShape {
        return DataShape(Dimension{}, std::move(record));
    }
    [[nodiscard]] static auto value(Record record) -> DataShape {
        return DataShape(std::nullopt, std::move(record));
    }

    [[nodiscard]] auto dim() const noexcept -> const std::optional<Dimension>& { return dim_; }
    [[nodiscard]] auto is_tabular() const noexcept -> bool { return dim_.has_value(); }
    [[nodiscard]] auto measure() const noexcept -> const Measure& { return measure_; }

    /// The record measure, or nullptr for a primitive measure.
    [[nodiscard]] auto record() const noexcept -> const Record* {
        return std::get_if<Record>(&measure_);
    }

    [[nodiscard]] auto with_dim(std::optional<Dimension> dim) const -> DataShape {
        return DataShape(dim, measure_);
    }

    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const DataShape&) const -> bool = default;

   private:
    std::optional<Dimension> dim_;
    Measure measure_ = Record{};
};

}  // namespace tablex::types
