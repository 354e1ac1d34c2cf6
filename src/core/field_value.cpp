#include "core/field_value.hpp"

#include <cmath>
#include <sstream>

namespace larder {

bool same_value(const FieldValue& a, const FieldValue& b) {
    const auto ka = kind_of(a);
    const auto kb = kind_of(b);
    const bool a_numeric = ka == FieldKind::Integer || ka == FieldKind::Real;
    const bool b_numeric = kb == FieldKind::Integer || kb == FieldKind::Real;
    if (a_numeric && b_numeric && ka != kb) {
        return *as_real(a) == *as_real(b);
    }
    return a == b;
}

std::string display(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string out = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += v[i];
            }
            out += "]";
            return out;
        }
    }, value);
}

std::optional<int64_t> as_integer(const FieldValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

std::optional<double> as_real(const FieldValue& value) {
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

std::optional<std::string> as_text(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<StringList> as_list(const FieldValue& value) {
    if (const auto* l = std::get_if<StringList>(&value)) {
        return *l;
    }
    return std::nullopt;
}

Fields changed_fields(const Fields& current, const Fields& next) {
    Fields out;
    for (const auto& [name, value] : next) {
        if (!same_value(field_or_null(current, name), value)) {
            out.emplace(name, value);
        }
    }
    return out;
}

Fields overlay(Fields base, const Fields& patch) {
    for (const auto& [name, value] : patch) {
        base[name] = value;
    }
    return base;
}

Fields project(const Fields& fields, const std::vector<std::string>& keys) {
    Fields out;
    for (const auto& key : keys) {
        out.emplace(key, field_or_null(fields, key));
    }
    return out;
}

std::vector<std::string> keys_of(const Fields& fields) {
    std::vector<std::string> out;
    out.reserve(fields.size());
    for (const auto& [name, value] : fields) {
        out.push_back(name);
    }
    return out;
}

} // namespace larder
