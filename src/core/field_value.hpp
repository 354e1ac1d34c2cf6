#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace larder {

using StringList = std::vector<std::string>;

/**
 * FieldValue - Sum type for a single entity field.
 *
 * Integers and reals are kept apart so that counters (quantity) can be
 * merged arithmetically while prices are treated as plain scalars.
 */
using FieldValue = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    StringList
>;

/**
 * Fields - an entity image or a partial mutation payload, keyed by field name.
 * Ordered so that iteration (and therefore conflict emission) is deterministic.
 */
using Fields = std::map<std::string, FieldValue>;

enum class FieldKind {
    Null,
    Boolean,
    Integer,
    Real,
    Text,
    List
};

[[nodiscard]] constexpr FieldKind kind_of(const FieldValue& value) {
    switch (value.index()) {
        case 0: return FieldKind::Null;
        case 1: return FieldKind::Boolean;
        case 2: return FieldKind::Integer;
        case 3: return FieldKind::Real;
        case 4: return FieldKind::Text;
        default: return FieldKind::List;
    }
}

[[nodiscard]] constexpr std::string_view kind_name(FieldKind kind) {
    switch (kind) {
        case FieldKind::Null: return "null";
        case FieldKind::Boolean: return "boolean";
        case FieldKind::Integer: return "integer";
        case FieldKind::Real: return "real";
        case FieldKind::Text: return "text";
        case FieldKind::List: return "list";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_null(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * Value equality used for divergence checks. An integer and a real holding
 * the same number compare equal since JSON backends do not preserve the
 * distinction.
 */
[[nodiscard]] bool same_value(const FieldValue& a, const FieldValue& b);

/**
 * Human-readable rendering for logs and the CLI.
 */
[[nodiscard]] std::string display(const FieldValue& value);

[[nodiscard]] std::optional<int64_t> as_integer(const FieldValue& value);
[[nodiscard]] std::optional<double> as_real(const FieldValue& value);
[[nodiscard]] std::optional<std::string> as_text(const FieldValue& value);
[[nodiscard]] std::optional<StringList> as_list(const FieldValue& value);

/**
 * Field lookup returning null for absent keys.
 */
[[nodiscard]] inline const FieldValue& field_or_null(const Fields& fields, const std::string& name) {
    static const FieldValue null_value{};
    auto it = fields.find(name);
    return it == fields.end() ? null_value : it->second;
}

/**
 * Fields of `next` whose value differs from `current` (absent counts as null).
 */
[[nodiscard]] Fields changed_fields(const Fields& current, const Fields& next);

/**
 * Overlay `patch` onto `base`.
 */
[[nodiscard]] Fields overlay(Fields base, const Fields& patch);

/**
 * Restrict `fields` to the given keys.
 */
[[nodiscard]] Fields project(const Fields& fields, const std::vector<std::string>& keys);

[[nodiscard]] std::vector<std::string> keys_of(const Fields& fields);

} // namespace larder
