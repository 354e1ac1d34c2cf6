#include "core/inventory.hpp"

#include <array>

namespace larder {

namespace {

struct FieldSpec {
    const char* name;
    FieldKind kind;
    bool required;
};

constexpr std::array<FieldSpec, 10> ITEM_SCHEMA{{
    {field::Name, FieldKind::Text, true},
    {field::Quantity, FieldKind::Integer, false},
    {field::MinQuantity, FieldKind::Integer, false},
    {field::Category, FieldKind::Text, false},
    {field::Price, FieldKind::Real, false},
    {field::Unit, FieldKind::Text, false},
    {field::Supplier, FieldKind::Text, false},
    {field::Location, FieldKind::Text, false},
    {field::Notes, FieldKind::Text, false},
    {field::Tags, FieldKind::List, false},
}};

constexpr std::array<FieldSpec, 4> CATEGORY_SCHEMA{{
    {field::Name, FieldKind::Text, true},
    {field::Description, FieldKind::Text, false},
    {field::Color, FieldKind::Text, false},
    {field::Icon, FieldKind::Text, false},
}};

bool kind_accepts(FieldKind expected, const FieldValue& value) {
    const auto actual = kind_of(value);
    if (actual == FieldKind::Null) return true;
    if (actual == expected) return true;
    // JSON numbers may arrive as either representation.
    if (expected == FieldKind::Real && actual == FieldKind::Integer) return true;
    if (expected == FieldKind::Integer && actual == FieldKind::Real) {
        return as_integer(value).has_value();
    }
    return false;
}

template<size_t N>
Status validate_against(const std::array<FieldSpec, N>& schema,
                        const Fields& fields,
                        bool partial) {
    for (const auto& [name, value] : fields) {
        const FieldSpec* spec = nullptr;
        for (const auto& s : schema) {
            if (name == s.name) {
                spec = &s;
                break;
            }
        }
        if (!spec) {
            return Status::err(Error::of(ErrorKind::InvalidArgument, "Unknown field: " + name));
        }
        if (!kind_accepts(spec->kind, value)) {
            return Status::err(Error::of(ErrorKind::InvalidArgument,
                "Field " + name + " expects " + std::string(kind_name(spec->kind)) +
                ", got " + std::string(kind_name(kind_of(value)))));
        }
        if (spec->required && is_null(value)) {
            return Status::err(Error::of(ErrorKind::InvalidArgument, "Field " + name + " is required"));
        }
    }
    if (!partial) {
        for (const auto& s : schema) {
            if (s.required && is_null(field_or_null(fields, s.name))) {
                return Status::err(Error::of(ErrorKind::InvalidArgument,
                    std::string("Missing required field: ") + s.name));
            }
        }
    }
    return Status::ok();
}

void put_optional(Fields& out, const char* name, const std::optional<std::string>& value) {
    if (value) {
        out.emplace(name, *value);
    } else {
        out.emplace(name, std::monostate{});
    }
}

std::optional<std::string> optional_text(const Fields& fields, const char* name) {
    return as_text(field_or_null(fields, name));
}

} // namespace

Fields to_fields(const Item& item) {
    Fields out;
    out.emplace(field::Name, item.name);
    out.emplace(field::Quantity, item.quantity);
    out.emplace(field::MinQuantity, item.min_quantity);
    out.emplace(field::Category, item.category);
    out.emplace(field::Price, item.price);
    out.emplace(field::Unit, item.unit);
    put_optional(out, field::Supplier, item.supplier);
    put_optional(out, field::Location, item.location);
    put_optional(out, field::Notes, item.notes);
    out.emplace(field::Tags, item.tags);
    return out;
}

Fields to_fields(const Category& category) {
    Fields out;
    out.emplace(field::Name, category.name);
    put_optional(out, field::Description, category.description);
    put_optional(out, field::Color, category.color);
    put_optional(out, field::Icon, category.icon);
    return out;
}

Result<Item> item_from_fields(const std::string& id, const Fields& fields) {
    auto valid = validate_against(ITEM_SCHEMA, fields, false);
    if (valid.is_err()) {
        return Result<Item>::err(valid.unwrap_err());
    }

    Item item;
    item.id = id;
    item.name = optional_text(fields, field::Name).value_or("");
    item.quantity = as_integer(field_or_null(fields, field::Quantity)).value_or(0);
    item.min_quantity = as_integer(field_or_null(fields, field::MinQuantity)).value_or(0);
    item.category = optional_text(fields, field::Category).value_or("");
    item.price = as_real(field_or_null(fields, field::Price)).value_or(0.0);
    item.unit = optional_text(fields, field::Unit).value_or("");
    item.supplier = optional_text(fields, field::Supplier);
    item.location = optional_text(fields, field::Location);
    item.notes = optional_text(fields, field::Notes);
    item.tags = as_list(field_or_null(fields, field::Tags)).value_or(StringList{});
    return Result<Item>::ok(std::move(item));
}

Result<Category> category_from_fields(const std::string& id, const Fields& fields) {
    auto valid = validate_against(CATEGORY_SCHEMA, fields, false);
    if (valid.is_err()) {
        return Result<Category>::err(valid.unwrap_err());
    }

    Category category;
    category.id = id;
    category.name = optional_text(fields, field::Name).value_or("");
    category.description = optional_text(fields, field::Description);
    category.color = optional_text(fields, field::Color);
    category.icon = optional_text(fields, field::Icon);
    return Result<Category>::ok(std::move(category));
}

Status validate_fields(EntityType type, const Fields& fields, bool partial) {
    switch (type) {
        case EntityType::Item: return validate_against(ITEM_SCHEMA, fields, partial);
        case EntityType::Category: return validate_against(CATEGORY_SCHEMA, fields, partial);
    }
    return Status::err(Error::of(ErrorKind::InvalidArgument, "Unknown entity type"));
}

} // namespace larder
