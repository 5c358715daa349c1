/// @file definitions.cpp
/// @brief JSON parsing for puzzle content definitions

#include <stockroom/puzzle/definitions.hpp>

#include <stockroom/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>

namespace stock_puzzle {

using stock_core::DefinitionError;
using stock_core::Error;
using stock_core::Result;

namespace {

constexpr std::size_t k_max_count = static_cast<std::size_t>(std::numeric_limits<int>::max());
constexpr std::size_t k_max_slot_count = 256;

// =============================================================================
// Field Helpers
// =============================================================================

std::string field_path(const std::string& path, const std::string& field) {
    return path + "." + field;
}

std::string index_path(const std::string& path, std::size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

Result<std::string> require_string(const nlohmann::json& j, const char* field, const std::string& path) {
    if (!j.contains(field)) {
        return stock_core::Err<std::string>(Error(DefinitionError::missing_field(path, field)));
    }
    if (!j[field].is_string()) {
        return stock_core::Err<std::string>(Error(DefinitionError::invalid_value(
            field_path(path, field), "expected a string")));
    }
    return j[field].get<std::string>();
}

Result<float> require_number(const nlohmann::json& j, const char* field, const std::string& path) {
    if (!j.contains(field)) {
        return stock_core::Err<float>(Error(DefinitionError::missing_field(path, field)));
    }
    if (!j[field].is_number()) {
        return stock_core::Err<float>(Error(DefinitionError::invalid_value(
            field_path(path, field), "expected a number")));
    }
    return j[field].get<float>();
}

/// Non-negative integral number no larger than max; JSON content may write counts as 3 or 3.0
Result<std::size_t> as_count(const nlohmann::json& value, const std::string& at,
                             std::size_t max = k_max_count) {
    if (!value.is_number()) {
        return stock_core::Err<std::size_t>(Error(DefinitionError::invalid_value(at, "expected a number")));
    }
    double d = value.get<double>();
    if (!std::isfinite(d) || d < 0.0 || std::floor(d) != d) {
        return stock_core::Err<std::size_t>(Error(DefinitionError::invalid_value(
            at, "expected a non-negative integer")));
    }
    if (d > static_cast<double>(max)) {
        return stock_core::Err<std::size_t>(Error(DefinitionError::invalid_value(
            at, "must be at most " + std::to_string(max))));
    }
    return static_cast<std::size_t>(d);
}

Result<std::size_t> require_count(const nlohmann::json& j, const char* field, const std::string& path,
                                  std::size_t max = k_max_count) {
    if (!j.contains(field)) {
        return stock_core::Err<std::size_t>(Error(DefinitionError::missing_field(path, field)));
    }
    return as_count(j[field], field_path(path, field), max);
}

Result<std::optional<bool>> optional_bool(const nlohmann::json& j, const char* field, const std::string& path) {
    if (!j.contains(field) || j[field].is_null()) {
        return std::optional<bool>{};
    }
    if (!j[field].is_boolean()) {
        return stock_core::Err<std::optional<bool>>(Error(DefinitionError::invalid_value(
            field_path(path, field), "expected a boolean")));
    }
    return std::optional<bool>(j[field].get<bool>());
}

Result<std::optional<std::string>> optional_string(const nlohmann::json& j, const char* field,
                                                   const std::string& path) {
    if (!j.contains(field) || j[field].is_null()) {
        return std::optional<std::string>{};
    }
    if (!j[field].is_string()) {
        return stock_core::Err<std::optional<std::string>>(Error(DefinitionError::invalid_value(
            field_path(path, field), "expected a string")));
    }
    return std::optional<std::string>(j[field].get<std::string>());
}

Result<Vec2> parse_vec2(const nlohmann::json& j, const std::string& at) {
    if (!j.is_object() || !j.contains("x") || !j.contains("y") ||
        !j["x"].is_number() || !j["y"].is_number()) {
        return stock_core::Err<Vec2>(Error(DefinitionError::invalid_value(at, "expected {x, y}")));
    }
    return Vec2(j["x"].get<float>(), j["y"].get<float>());
}

Result<SlotContents> parse_slot_contents(const nlohmann::json& j, const std::string& at) {
    if (!j.is_array()) {
        return stock_core::Err<SlotContents>(Error(DefinitionError::invalid_value(
            at, "expected an array of product ids or null")));
    }
    SlotContents slots;
    slots.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        const auto& entry = j[i];
        if (entry.is_null()) {
            slots.emplace_back(std::nullopt);
        } else if (entry.is_string()) {
            slots.emplace_back(entry.get<std::string>());
        } else {
            return stock_core::Err<SlotContents>(Error(DefinitionError::invalid_value(
                index_path(at, i), "expected a product id or null")));
        }
    }
    return slots;
}

Result<void> parse_grid(const nlohmann::json& j, const std::string& path, int& width, int& height) {
    if (!j.contains("grid")) {
        return stock_core::Err(Error(DefinitionError::missing_field(path, "grid")));
    }
    const auto& grid = j["grid"];
    std::string at = field_path(path, "grid");
    if (!grid.is_object()) {
        return stock_core::Err(Error(DefinitionError::invalid_value(at, "expected {width, height}")));
    }
    auto w = require_count(grid, "width", at);
    if (!w) return stock_core::Err(w.error());
    auto h = require_count(grid, "height", at);
    if (!h) return stock_core::Err(h.error());
    if (*w == 0 || *h == 0) {
        return stock_core::Err(Error(DefinitionError::invalid_value(at, "grid must be at least 1x1")));
    }
    width = static_cast<int>(*w);
    height = static_cast<int>(*h);
    return stock_core::Ok();
}

Result<Orientation> parse_orientation(const nlohmann::json& j, const std::string& path) {
    auto name = require_string(j, "orientation", path);
    if (!name) return stock_core::Err<Orientation>(name.error());
    auto orientation = orientation_from_string(*name);
    if (!orientation) {
        return stock_core::Err<Orientation>(Error(DefinitionError::invalid_value(
            field_path(path, "orientation"), "expected 'horizontal' or 'vertical', got '" + *name + "'")));
    }
    return *orientation;
}

} // anonymous namespace

// =============================================================================
// ProductDef
// =============================================================================

bool ProductDef::matches_product(const ProductDef& other) const {
    return std::find(matches.begin(), matches.end(), other.id) != matches.end();
}

Result<ProductDef> ProductDef::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<ProductDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }

    ProductDef def;

    auto id = require_string(j, "id", path);
    if (!id) return stock_core::Err<ProductDef>(id.error());
    if (id->empty()) {
        return stock_core::Err<ProductDef>(Error(DefinitionError::invalid_value(
            field_path(path, "id"), "must not be empty")));
    }
    def.id = std::move(*id);

    auto name = require_string(j, "name", path);
    if (!name) return stock_core::Err<ProductDef>(name.error());
    def.name = std::move(*name);

    auto image = require_string(j, "image", path);
    if (!image) return stock_core::Err<ProductDef>(image.error());
    def.image = std::move(*image);

    if (!j.contains("matches")) {
        return stock_core::Err<ProductDef>(Error(DefinitionError::missing_field(path, "matches")));
    }
    const auto& matches = j["matches"];
    if (!matches.is_array()) {
        return stock_core::Err<ProductDef>(Error(DefinitionError::invalid_value(
            field_path(path, "matches"), "expected an array of product ids")));
    }
    for (std::size_t i = 0; i < matches.size(); ++i) {
        if (!matches[i].is_string()) {
            return stock_core::Err<ProductDef>(Error(DefinitionError::invalid_value(
                index_path(field_path(path, "matches"), i), "expected a product id")));
        }
        def.matches.push_back(matches[i].get<std::string>());
    }

    if (j.contains("points") && !j["points"].is_null()) {
        if (!j["points"].is_number()) {
            return stock_core::Err<ProductDef>(Error(DefinitionError::invalid_value(
                field_path(path, "points"), "expected a number")));
        }
        def.points = j["points"].get<int>();
    }

    return stock_core::Ok(std::move(def));
}

nlohmann::json ProductDef::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["image"] = image;
    j["matches"] = matches;
    j["points"] = points;
    return j;
}

Result<std::vector<ProductDef>> parse_product_defs(const nlohmann::json& j) {
    if (!j.is_array()) {
        return stock_core::Err<std::vector<ProductDef>>(Error(DefinitionError::invalid_value(
            "products", "expected an array of product definitions")));
    }

    std::vector<ProductDef> defs;
    std::set<ProductId> seen;
    defs.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        std::string at = index_path("products", i);
        auto def = ProductDef::from_json(j[i], at);
        if (!def) {
            return stock_core::Err<std::vector<ProductDef>>(def.error());
        }
        if (!seen.insert(def->id).second) {
            return stock_core::Err<std::vector<ProductDef>>(Error(DefinitionError::duplicate_id(at, def->id)));
        }
        defs.push_back(std::move(*def));
    }
    return defs;
}

// =============================================================================
// Lock Conditions
// =============================================================================

const char* lock_mode_name(const LockConditionDef& def) {
    return std::visit([](const auto& mode) -> const char* {
        using T = std::decay_t<decltype(mode)>;
        if constexpr (std::is_same_v<T, ToggleTimerDef>) {
            return "toggle-timer";
        } else if constexpr (std::is_same_v<T, CountdownTimerDef>) {
            return "countdown-timer";
        } else if constexpr (std::is_same_v<T, MatchProductsDef>) {
            return "match-products";
        } else if constexpr (std::is_same_v<T, CompleteShelvesDef>) {
            return "complete-shelves";
        } else if constexpr (std::is_same_v<T, CompleteShelfDef>) {
            return "complete-shelf";
        } else {
            return "place-product";
        }
    }, def);
}

Result<LockConditionDef> lock_condition_from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<LockConditionDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }
    auto mode = require_string(j, "mode", path);
    if (!mode) return stock_core::Err<LockConditionDef>(mode.error());

    if (*mode == "toggle-timer") {
        ToggleTimerDef def;
        auto period = require_number(j, "time", path);
        if (!period) return stock_core::Err<LockConditionDef>(period.error());
        if (*period <= 0.0f) {
            return stock_core::Err<LockConditionDef>(Error(DefinitionError::invalid_value(
                field_path(path, "time"), "toggle period must be positive")));
        }
        def.period = *period;
        if (!j.contains("initiallyLocked")) {
            return stock_core::Err<LockConditionDef>(Error(DefinitionError::missing_field(path, "initiallyLocked")));
        }
        auto initially = optional_bool(j, "initiallyLocked", path);
        if (!initially || !initially->has_value()) {
            return stock_core::Err<LockConditionDef>(Error(DefinitionError::invalid_value(
                field_path(path, "initiallyLocked"), "expected a boolean")));
        }
        def.initially_locked = **initially;
        if (j.contains("finalCountdownUnlock") && !j["finalCountdownUnlock"].is_null()) {
            auto unlock = require_number(j, "finalCountdownUnlock", path);
            if (!unlock) return stock_core::Err<LockConditionDef>(unlock.error());
            def.final_countdown_unlock = *unlock;
        }
        return LockConditionDef(def);
    }

    if (*mode == "countdown-timer") {
        auto time = require_number(j, "time", path);
        if (!time) return stock_core::Err<LockConditionDef>(time.error());
        return LockConditionDef(CountdownTimerDef{*time});
    }

    if (*mode == "match-products") {
        MatchProductsDef def;
        auto n = require_count(j, "n", path);
        if (!n) return stock_core::Err<LockConditionDef>(n.error());
        def.count = static_cast<int>(*n);
        auto product = optional_string(j, "product", path);
        if (!product) return stock_core::Err<LockConditionDef>(product.error());
        def.product = std::move(*product);
        return LockConditionDef(std::move(def));
    }

    if (*mode == "complete-shelves") {
        auto n = require_count(j, "n", path);
        if (!n) return stock_core::Err<LockConditionDef>(n.error());
        return LockConditionDef(CompleteShelvesDef{static_cast<int>(*n)});
    }

    if (*mode == "complete-shelf") {
        auto reference = require_string(j, "shelfReference", path);
        if (!reference) return stock_core::Err<LockConditionDef>(reference.error());
        return LockConditionDef(CompleteShelfDef{std::move(*reference)});
    }

    if (*mode == "place-product") {
        PlaceProductDef def;
        auto reference = require_string(j, "shelfReference", path);
        if (!reference) return stock_core::Err<LockConditionDef>(reference.error());
        def.shelf_reference = std::move(*reference);

        auto slot = require_count(j, "slot", path);
        if (!slot) return stock_core::Err<LockConditionDef>(slot.error());
        def.slot = *slot;

        auto latch = optional_bool(j, "latch", path);
        if (!latch) return stock_core::Err<LockConditionDef>(latch.error());
        def.latch = latch->value_or(false);

        auto inverted = optional_bool(j, "inverted", path);
        if (!inverted) return stock_core::Err<LockConditionDef>(inverted.error());
        def.inverted = inverted->value_or(false);

        auto product = optional_string(j, "product", path);
        if (!product) return stock_core::Err<LockConditionDef>(product.error());
        def.product = std::move(*product);
        return LockConditionDef(std::move(def));
    }

    return stock_core::Err<LockConditionDef>(Error(DefinitionError::invalid_value(
        field_path(path, "mode"), "unknown locking mode '" + *mode + "'")));
}

// =============================================================================
// ShelfDef
// =============================================================================

Result<void> validate_nesting(ShelfKind outer, ShelfKind inner, const std::string& path) {
    if (!can_wrap(outer, inner)) {
        return stock_core::Err(Error(DefinitionError::invalid_nesting(
            path, shelf_kind_name(outer), shelf_kind_name(inner))));
    }
    return stock_core::Ok();
}

Result<ShelfDef> ShelfDef::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<ShelfDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }

    auto type = require_string(j, "type", path);
    if (!type) return stock_core::Err<ShelfDef>(type.error());
    auto kind = shelf_kind_from_string(*type);
    if (!kind) {
        return stock_core::Err<ShelfDef>(Error(DefinitionError::unknown_shelf_type(path, *type)));
    }

    ShelfDef def;
    def.kind = *kind;

    if (j.contains("offset") && !j["offset"].is_null()) {
        auto offset = parse_vec2(j["offset"], field_path(path, "offset"));
        if (!offset) return stock_core::Err<ShelfDef>(offset.error());
        def.offset = *offset;
    }

    // Wrapping kinds: inner shelf plus wrapper-specific fields
    if (is_wrapper_kind(def.kind)) {
        if (!j.contains("shelf")) {
            return stock_core::Err<ShelfDef>(Error(DefinitionError::missing_field(path, "shelf")));
        }
        auto inner = ShelfDef::from_json(j["shelf"], field_path(path, "shelf"));
        if (!inner) return stock_core::Err<ShelfDef>(inner.error());

        auto nesting = validate_nesting(def.kind, inner->kind, path);
        if (!nesting) return stock_core::Err<ShelfDef>(nesting.error());
        def.inner = std::make_shared<const ShelfDef>(std::move(*inner));

        if (def.kind == ShelfKind::Locking) {
            if (!j.contains("locking")) {
                return stock_core::Err<ShelfDef>(Error(DefinitionError::missing_field(path, "locking")));
            }
            auto locking = lock_condition_from_json(j["locking"], field_path(path, "locking"));
            if (!locking) return stock_core::Err<ShelfDef>(locking.error());
            def.locking = std::move(*locking);
        }
        return stock_core::Ok(std::move(def));
    }

    // Slot-bearing kinds
    if (j.contains("slotCount") && !j["slotCount"].is_null()) {
        auto count = as_count(j["slotCount"], field_path(path, "slotCount"), k_max_slot_count);
        if (!count) return stock_core::Err<ShelfDef>(count.error());
        if (*count == 0) {
            return stock_core::Err<ShelfDef>(Error(DefinitionError::invalid_value(
                field_path(path, "slotCount"), "must be at least 1")));
        }
        def.slot_count = *count;
    }
    if (j.contains("matchCount") && !j["matchCount"].is_null()) {
        auto count = as_count(j["matchCount"], field_path(path, "matchCount"), k_max_slot_count);
        if (!count) return stock_core::Err<ShelfDef>(count.error());
        if (*count == 0) {
            return stock_core::Err<ShelfDef>(Error(DefinitionError::invalid_value(
                field_path(path, "matchCount"), "must be at least 1")));
        }
        def.match_count = *count;
    }

    auto ignore = optional_bool(j, "ignore", path);
    if (!ignore) return stock_core::Err<ShelfDef>(ignore.error());
    def.ignore = ignore->value_or(false);

    auto reference = optional_string(j, "reference", path);
    if (!reference) return stock_core::Err<ShelfDef>(reference.error());
    def.reference = std::move(*reference);

    if (def.kind == ShelfKind::Deep) {
        if (!j.contains("layers")) {
            return stock_core::Err<ShelfDef>(Error(DefinitionError::missing_field(path, "layers")));
        }
        const auto& layers = j["layers"];
        if (!layers.is_array()) {
            return stock_core::Err<ShelfDef>(Error(DefinitionError::invalid_value(
                field_path(path, "layers"), "expected an array of layers")));
        }
        for (std::size_t i = 0; i < layers.size(); ++i) {
            auto layer = parse_slot_contents(layers[i], index_path(field_path(path, "layers"), i));
            if (!layer) return stock_core::Err<ShelfDef>(layer.error());
            def.layers.push_back(std::move(*layer));
        }
        return stock_core::Ok(std::move(def));
    }

    if (!j.contains("products")) {
        return stock_core::Err<ShelfDef>(Error(DefinitionError::missing_field(path, "products")));
    }
    auto products = parse_slot_contents(j["products"], field_path(path, "products"));
    if (!products) return stock_core::Err<ShelfDef>(products.error());
    def.products = std::move(*products);

    if (def.kind == ShelfKind::Display) {
        if (!j.contains("allowed")) {
            return stock_core::Err<ShelfDef>(Error(DefinitionError::missing_field(path, "allowed")));
        }
        auto allowed = parse_slot_contents(j["allowed"], field_path(path, "allowed"));
        if (!allowed) return stock_core::Err<ShelfDef>(allowed.error());
        def.allowed = std::move(*allowed);
    }

    return stock_core::Ok(std::move(def));
}

// =============================================================================
// Containers
// =============================================================================

Result<CollapseDef> CollapseDef::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<CollapseDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }

    CollapseDef def;
    auto grid = parse_grid(j, path, def.grid_width, def.grid_height);
    if (!grid) return stock_core::Err<CollapseDef>(grid.error());

    auto orientation = parse_orientation(j, path);
    if (!orientation) return stock_core::Err<CollapseDef>(orientation.error());
    def.orientation = *orientation;

    auto direction_name = require_string(j, "direction", path);
    if (!direction_name) return stock_core::Err<CollapseDef>(direction_name.error());
    auto direction = collapse_direction_from_string(*direction_name);
    if (!direction) {
        return stock_core::Err<CollapseDef>(Error(DefinitionError::invalid_value(
            field_path(path, "direction"), "expected 'positive', 'negative' or 'center'")));
    }
    def.direction = *direction;

    if (!j.contains("actors")) {
        return stock_core::Err<CollapseDef>(Error(DefinitionError::missing_field(path, "actors")));
    }
    const auto& actors = j["actors"];
    if (!actors.is_array()) {
        return stock_core::Err<CollapseDef>(Error(DefinitionError::invalid_value(
            field_path(path, "actors"), "expected an array")));
    }

    for (std::size_t i = 0; i < actors.size(); ++i) {
        std::string at = index_path(field_path(path, "actors"), i);
        const auto& entry = actors[i];
        CollapseEntry child;
        if (entry.is_object() && entry.contains("type") && entry["type"] == "collapse") {
            auto nested = CollapseDef::from_json(entry, at);
            if (!nested) return stock_core::Err<CollapseDef>(nested.error());
            child.collapse = std::make_shared<const CollapseDef>(std::move(*nested));
        } else {
            auto shelf = ShelfDef::from_json(entry, at);
            if (!shelf) return stock_core::Err<CollapseDef>(shelf.error());
            child.shelf = std::move(*shelf);
        }
        def.entries.push_back(std::move(child));
    }

    return stock_core::Ok(std::move(def));
}

Result<CarouselDef> CarouselDef::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<CarouselDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }

    CarouselDef def;
    auto orientation = parse_orientation(j, path);
    if (!orientation) return stock_core::Err<CarouselDef>(orientation.error());
    def.orientation = *orientation;

    auto speed = require_number(j, "speed", path);
    if (!speed) return stock_core::Err<CarouselDef>(speed.error());
    def.speed = *speed;

    if (!j.contains("shelves")) {
        return stock_core::Err<CarouselDef>(Error(DefinitionError::missing_field(path, "shelves")));
    }
    const auto& shelves = j["shelves"];
    if (!shelves.is_array()) {
        return stock_core::Err<CarouselDef>(Error(DefinitionError::invalid_value(
            field_path(path, "shelves"), "expected an array")));
    }
    for (std::size_t i = 0; i < shelves.size(); ++i) {
        auto shelf = ShelfDef::from_json(shelves[i], index_path(field_path(path, "shelves"), i));
        if (!shelf) return stock_core::Err<CarouselDef>(shelf.error());
        def.shelves.push_back(std::move(*shelf));
    }

    return stock_core::Ok(std::move(def));
}

// =============================================================================
// Level
// =============================================================================

Result<ActorDef> ActorDef::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<ActorDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }

    ActorDef def;
    if (!j.contains("gridPosition")) {
        return stock_core::Err<ActorDef>(Error(DefinitionError::missing_field(path, "gridPosition")));
    }
    auto grid_position = parse_vec2(j["gridPosition"], field_path(path, "gridPosition"));
    if (!grid_position) return stock_core::Err<ActorDef>(grid_position.error());
    def.grid_position = *grid_position;

    auto type = require_string(j, "type", path);
    if (!type) return stock_core::Err<ActorDef>(type.error());

    if (*type == "carousel") {
        auto carousel = CarouselDef::from_json(j, path);
        if (!carousel) return stock_core::Err<ActorDef>(carousel.error());
        def.kind = ActorKind::Carousel;
        def.carousel = std::move(*carousel);
    } else if (*type == "collapse") {
        auto collapse = CollapseDef::from_json(j, path);
        if (!collapse) return stock_core::Err<ActorDef>(collapse.error());
        def.kind = ActorKind::Collapse;
        def.collapse = std::move(*collapse);
    } else {
        auto shelf = ShelfDef::from_json(j, path);
        if (!shelf) return stock_core::Err<ActorDef>(shelf.error());
        def.kind = ActorKind::Shelf;
        def.shelf = std::move(*shelf);
    }

    return stock_core::Ok(std::move(def));
}

Result<LevelDef> LevelDef::from_json(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) {
        return stock_core::Err<LevelDef>(Error(DefinitionError::invalid_value(path, "expected an object")));
    }

    LevelDef def;

    auto id = require_string(j, "id", path);
    if (!id) return stock_core::Err<LevelDef>(id.error());
    def.id = std::move(*id);

    auto name = require_string(j, "name", path);
    if (!name) return stock_core::Err<LevelDef>(name.error());
    def.name = std::move(*name);

    auto description = optional_string(j, "description", path);
    if (!description) return stock_core::Err<LevelDef>(description.error());
    def.description = std::move(*description);

    auto grid = parse_grid(j, path, def.grid_width, def.grid_height);
    if (!grid) return stock_core::Err<LevelDef>(grid.error());

    if (j.contains("timeLimit") && !j["timeLimit"].is_null()) {
        auto limit = require_number(j, "timeLimit", path);
        if (!limit) return stock_core::Err<LevelDef>(limit.error());
        if (*limit <= 0.0f) {
            return stock_core::Err<LevelDef>(Error(DefinitionError::invalid_value(
                field_path(path, "timeLimit"), "must be positive")));
        }
        def.time_limit = *limit;
    }

    if (j.contains("lockedProducts") && !j["lockedProducts"].is_null()) {
        const auto& locks = j["lockedProducts"];
        if (!locks.is_array()) {
            return stock_core::Err<LevelDef>(Error(DefinitionError::invalid_value(
                field_path(path, "lockedProducts"), "expected an array")));
        }
        for (std::size_t i = 0; i < locks.size(); ++i) {
            std::string at = index_path(field_path(path, "lockedProducts"), i);
            if (!locks[i].is_object()) {
                return stock_core::Err<LevelDef>(Error(DefinitionError::invalid_value(at, "expected an object")));
            }
            LockedProductDef lock;
            auto reference = require_string(locks[i], "shelfReference", at);
            if (!reference) return stock_core::Err<LevelDef>(reference.error());
            lock.shelf_reference = std::move(*reference);
            auto slot = require_count(locks[i], "slot", at);
            if (!slot) return stock_core::Err<LevelDef>(slot.error());
            lock.slot = *slot;
            def.locked_products.push_back(std::move(lock));
        }
    }

    if (!j.contains("actors")) {
        return stock_core::Err<LevelDef>(Error(DefinitionError::missing_field(path, "actors")));
    }
    const auto& actors = j["actors"];
    if (!actors.is_array()) {
        return stock_core::Err<LevelDef>(Error(DefinitionError::invalid_value(
            field_path(path, "actors"), "expected an array")));
    }
    for (std::size_t i = 0; i < actors.size(); ++i) {
        auto actor = ActorDef::from_json(actors[i], index_path(field_path(path, "actors"), i));
        if (!actor) return stock_core::Err<LevelDef>(actor.error());
        def.actors.push_back(std::move(*actor));
    }

    return stock_core::Ok(std::move(def));
}

// =============================================================================
// File Loading
// =============================================================================

namespace {

Result<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return stock_core::Err<nlohmann::json>(Error(stock_core::ErrorCode::IOError,
                                                     "Failed to open content file: " + path.string()));
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return stock_core::Err<nlohmann::json>(Error(stock_core::ErrorCode::ParseError,
                                                     path.string() + ": " + e.what()));
    }
}

} // anonymous namespace

Result<std::vector<ProductDef>> load_product_file(const std::filesystem::path& path) {
    auto json = read_json_file(path);
    if (!json) {
        return stock_core::Err<std::vector<ProductDef>>(json.error());
    }
    auto defs = parse_product_defs(*json);
    if (!defs) {
        stock_core::content_logger()->error("[Content] {}: {}", path.string(), defs.error().message());
        return defs;
    }
    stock_core::content_logger()->info("[Content] Loaded {} products from {}", defs->size(), path.string());
    return defs;
}

Result<LevelDef> load_level_file(const std::filesystem::path& path) {
    auto json = read_json_file(path);
    if (!json) {
        return stock_core::Err<LevelDef>(json.error());
    }
    auto def = LevelDef::from_json(*json);
    if (!def) {
        stock_core::content_logger()->error("[Content] {}: {}", path.string(), def.error().message());
        return def;
    }
    stock_core::content_logger()->info("[Content] Loaded level '{}' ({} actors) from {}",
                                       def->id, def->actors.size(), path.string());
    return def;
}

} // namespace stock_puzzle
