#include <tablex/types/datashape.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <unordered_set>

namespace tablex::types {

namespace {

auto rank(Primitive type) noexcept -> int {
    switch (type) {
        case Primitive::Int8:
            return 1;
        case Primitive::Int16:
            return 2;
        case Primitive::Int32:
            return 3;
        case Primitive::Int64:
            return 4;
        case Primitive::Float32:
            return 5;
        case Primitive::Float64:
            return 6;
        default:
            return 0;
    }
}

}  // namespace

auto to_string(Primitive type) -> std::string_view {
    switch (type) {
        case Primitive::Bool:
            return "bool";
        case Primitive::Int8:
            return "int8";
        case Primitive::Int16:
            return "int16";
        case Primitive::Int32:
            return "int32";
        case Primitive::Int64:
            return "int64";
        case Primitive::Float32:
            return "float32";
        case Primitive::Float64:
            return "float64";
        case Primitive::String:
            return "string";
        case Primitive::Date:
            return "date";
        case Primitive::DateTime:
            return "datetime";
    }
    return "unknown";
}

auto is_integral(Primitive type) noexcept -> bool {
    return type == Primitive::Int8 || type == Primitive::Int16 || type == Primitive::Int32 ||
           type == Primitive::Int64;
}

auto is_floating(Primitive type) noexcept -> bool {
    return type == Primitive::Float32 || type == Primitive::Float64;
}

auto is_numeric(Primitive type) noexcept -> bool {
    return is_integral(type) || is_floating(type);
}

auto promote(Primitive lhs, Primitive rhs) noexcept -> Primitive {
    return rank(lhs) >= rank(rhs) ? lhs : rhs;
}

auto Record::make(std::vector<Field> fields) -> std::expected<Record, Error> {
    std::unordered_set<std::string_view> seen;
    for (const auto& field : fields) {
        if (!seen.insert(field.name).second) {
            return fail(ErrorKind::DuplicateField,
                        fmt::format("field '{}' appears more than once", field.name));
        }
    }
    return Record(std::move(fields));
}

auto Record::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& field : fields_) {
        out.push_back(field.name);
    }
    return out;
}

auto Record::contains(std::string_view name) const -> bool {
    return find(name) != nullptr;
}

auto Record::find(std::string_view name) const -> const Field* {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return f.name == name; });
    return it == fields_.end() ? nullptr : &*it;
}

auto Record::index_of(std::string_view name) const -> std::optional<std::size_t> {
    auto it = std::ranges::find_if(fields_, [name](const Field& f) { return f.name == name; });
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - fields_.begin());
}

auto Record::restrict(const std::vector<std::string>& names) const
    -> std::expected<Record, Error> {
    std::vector<Field> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        const auto* field = find(name);
        if (field == nullptr) {
            return fail(ErrorKind::UnknownColumn,
                        fmt::format("column '{}' not in {}", name, to_string()));
        }
        out.push_back(*field);
    }
    return make(std::move(out));
}

auto Record::to_string() const -> std::string {
    std::string out = "{";
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += fmt::format("{}: {}", fields_[i].name, types::to_string(fields_[i].type));
    }
    out += "}";
    return out;
}

auto DataShape::to_string() const -> std::string {
    std::string measure = std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Record>) {
                return m.to_string();
            } else {
                return std::string(types::to_string(m));
            }
        },
        measure_);
    if (!dim_.has_value()) {
        return measure;
    }
    if (dim_->is_var()) {
        return "var * " + measure;
    }
    return fmt::format("{} * {}", *dim_->length, measure);
}

}  // namespace tablex::types
