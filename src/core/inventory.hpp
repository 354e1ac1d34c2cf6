#pragma once

#include "core/field_value.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace larder {

/**
 * EntityType - The two synchronised entity collections.
 */
enum class EntityType {
    Item,
    Category
};

[[nodiscard]] constexpr std::string_view type_name(EntityType type) {
    switch (type) {
        case EntityType::Item: return "item";
        case EntityType::Category: return "category";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<EntityType> parse_entity_type(std::string_view name) {
    if (name == "item") return EntityType::Item;
    if (name == "category") return EntityType::Category;
    return std::nullopt;
}

// Field names shared by the merge policies and the typed views.
namespace field {
    inline constexpr const char* Name = "name";
    inline constexpr const char* Quantity = "quantity";
    inline constexpr const char* MinQuantity = "min_quantity";
    inline constexpr const char* Category = "category";
    inline constexpr const char* Price = "price";
    inline constexpr const char* Unit = "unit";
    inline constexpr const char* Supplier = "supplier";
    inline constexpr const char* Location = "location";
    inline constexpr const char* Notes = "notes";
    inline constexpr const char* Tags = "tags";
    inline constexpr const char* Description = "description";
    inline constexpr const char* Color = "color";
    inline constexpr const char* Icon = "icon";
}

/**
 * Item - A tracked stock item.
 */
struct Item {
    std::string id;
    std::string name;
    int64_t quantity{0};
    int64_t min_quantity{0};
    std::string category;
    double price{0.0};
    std::string unit;
    std::optional<std::string> supplier;
    std::optional<std::string> location;
    std::optional<std::string> notes;
    StringList tags;

    bool operator==(const Item&) const = default;
};

/**
 * Category - A grouping for items.
 */
struct Category {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::optional<std::string> icon;

    bool operator==(const Category&) const = default;
};

// ============================================================================
// Field-map conversion (the generic form stored, diffed and synced)
// ============================================================================

[[nodiscard]] Fields to_fields(const Item& item);
[[nodiscard]] Fields to_fields(const Category& category);

/**
 * Build an Item from a field image. Fails on a missing name or on a field of
 * the wrong kind; absent optional fields stay empty.
 */
[[nodiscard]] Result<Item> item_from_fields(const std::string& id, const Fields& fields);
[[nodiscard]] Result<Category> category_from_fields(const std::string& id, const Fields& fields);

/**
 * Validate a full or partial field set against the schema of `type`.
 */
[[nodiscard]] Status validate_fields(EntityType type, const Fields& fields, bool partial);

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Item create_item(std::string id, std::string name, int64_t quantity,
                                      std::string category = {}) {
    Item item;
    item.id = std::move(id);
    item.name = std::move(name);
    item.quantity = quantity;
    item.category = std::move(category);
    return item;
}

[[nodiscard]] inline Item with_quantity(Item item, int64_t quantity) {
    item.quantity = quantity;
    return item;
}

[[nodiscard]] inline Item with_category(Item item, std::string category) {
    item.category = std::move(category);
    return item;
}

[[nodiscard]] inline bool is_low_stock(const Item& item) {
    return item.min_quantity > 0 && item.quantity < item.min_quantity;
}

[[nodiscard]] inline Category create_category(std::string id, std::string name) {
    Category category;
    category.id = std::move(id);
    category.name = std::move(name);
    return category;
}

} // namespace larder
