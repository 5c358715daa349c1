/// @file factory.cpp
/// @brief Product, shelf and actor construction

#include <stockroom/puzzle/factory.hpp>

#include <stockroom/core/log.hpp>

namespace stock_puzzle {

using stock_core::DefinitionError;
using stock_core::Error;
using stock_core::Result;

// =============================================================================
// ProductFactory
// =============================================================================

Result<ProductFactory> ProductFactory::from_defs(std::vector<ProductDef> defs) {
    ProductFactory factory;
    for (auto& def : defs) {
        auto registered = factory.register_product(std::move(def));
        if (!registered) {
            return stock_core::Err<ProductFactory>(registered.error());
        }
    }
    return factory;
}

Result<void> ProductFactory::register_product(ProductDef def) {
    if (def.id.empty()) {
        return stock_core::Err(Error(DefinitionError::missing_field("product", "id")));
    }
    if (contains(def.id)) {
        return stock_core::Err(Error(DefinitionError::duplicate_id("products", def.id)));
    }
    ProductId id = def.id;
    m_defs.emplace(std::move(id), std::make_shared<const ProductDef>(std::move(def)));
    return stock_core::Ok();
}

ProductDefPtr ProductFactory::find(const ProductId& id) const {
    auto it = m_defs.find(id);
    return it != m_defs.end() ? it->second : nullptr;
}

Result<std::unique_ptr<Product>> ProductFactory::create(const ProductId& id, Vec2 size) const {
    ProductDefPtr def = find(id);
    if (!def) {
        return stock_core::Err<std::unique_ptr<Product>>(Error(DefinitionError::unknown_product("products", id)));
    }
    return stock_core::Ok(std::make_unique<Product>(std::move(def), size));
}

std::vector<ProductId> ProductFactory::product_ids() const {
    std::vector<ProductId> ids;
    ids.reserve(m_defs.size());
    for (const auto& [id, def] : m_defs) {
        ids.push_back(id);
    }
    return ids;
}

// =============================================================================
// ShelfFactory
// =============================================================================

Result<LockCondition> ShelfFactory::resolve_lock(const LockConditionDef& def, const ProductFactory& products,
                                                 const std::string& path) {
    auto resolve_product = [&](const std::optional<ProductId>& id, ProductDefPtr& out) -> Result<void> {
        if (!id) {
            return stock_core::Ok();
        }
        out = products.find(*id);
        if (!out) {
            return stock_core::Err(Error(DefinitionError::unknown_product(path + ".product", *id)));
        }
        return stock_core::Ok();
    };

    if (const auto* toggle = std::get_if<ToggleTimerDef>(&def)) {
        return LockCondition(ToggleTimerLock{toggle->period, toggle->initially_locked,
                                             toggle->final_countdown_unlock});
    }
    if (const auto* countdown = std::get_if<CountdownTimerDef>(&def)) {
        return LockCondition(CountdownTimerLock{countdown->time});
    }
    if (const auto* match = std::get_if<MatchProductsDef>(&def)) {
        MatchProductsLock lock;
        lock.count = static_cast<std::uint32_t>(match->count);
        auto resolved = resolve_product(match->product, lock.product);
        if (!resolved) return stock_core::Err<LockCondition>(resolved.error());
        return LockCondition(std::move(lock));
    }
    if (const auto* shelves = std::get_if<CompleteShelvesDef>(&def)) {
        return LockCondition(CompleteShelvesLock{static_cast<std::uint32_t>(shelves->count)});
    }
    if (const auto* shelf = std::get_if<CompleteShelfDef>(&def)) {
        return LockCondition(CompleteShelfLock{shelf->shelf_reference});
    }

    const auto& place = std::get<PlaceProductDef>(def);
    PlaceProductLock lock;
    lock.shelf_reference = place.shelf_reference;
    lock.slot = place.slot;
    lock.latch = place.latch;
    lock.inverted = place.inverted;
    auto resolved = resolve_product(place.product, lock.product);
    if (!resolved) return stock_core::Err<LockCondition>(resolved.error());
    return LockCondition(std::move(lock));
}

Result<Shelf::Slots> ShelfFactory::create_slots(const SlotContents& contents, std::size_t slot_count,
                                                BuildContext& ctx, const std::string& path) {
    if (contents.size() > slot_count) {
        return stock_core::Err<Shelf::Slots>(Error(DefinitionError::invalid_value(
            path, std::to_string(contents.size()) + " products for " + std::to_string(slot_count) + " slots")));
    }

    Shelf::Slots slots(slot_count);
    const Vec2 size = ctx.config.product_size();
    for (std::size_t i = 0; i < contents.size(); ++i) {
        if (!contents[i]) {
            continue;
        }
        auto product = ctx.products.create(*contents[i], size);
        if (!product) {
            return stock_core::Err<Shelf::Slots>(Error(DefinitionError::unknown_product(
                path + "[" + std::to_string(i) + "]", *contents[i])));
        }
        slots[i] = std::move(*product);
    }
    return slots;
}

Result<std::unique_ptr<Shelf>> ShelfFactory::create_slot_shelf(const ShelfDef& def, BuildContext& ctx,
                                                               const std::string& path) {
    const std::size_t slot_count = def.slot_count.value_or(ctx.config.default_slot_count);
    const std::size_t match_count = def.match_count.value_or(ctx.config.default_match_count);
    const Vec2 cell = ctx.config.product_size();

    if (slot_count == 0 || match_count == 0) {
        return stock_core::Err<std::unique_ptr<Shelf>>(Error(DefinitionError::invalid_value(
            path, "slot and match counts must be at least 1")));
    }

    std::unique_ptr<Shelf> shelf;
    switch (def.kind) {
        case ShelfKind::Basic:
        case ShelfKind::Closing: {
            auto slots = create_slots(def.products, slot_count, ctx, path + ".products");
            if (!slots) return stock_core::Err<std::unique_ptr<Shelf>>(slots.error());
            if (def.kind == ShelfKind::Basic) {
                shelf = std::make_unique<Shelf>(std::move(*slots), slot_count, match_count, cell);
            } else {
                shelf = std::make_unique<ClosingShelf>(std::move(*slots), slot_count, match_count, cell);
            }
            break;
        }
        case ShelfKind::Display: {
            auto slots = create_slots(def.products, slot_count, ctx, path + ".products");
            if (!slots) return stock_core::Err<std::unique_ptr<Shelf>>(slots.error());

            if (def.allowed.size() > slot_count) {
                return stock_core::Err<std::unique_ptr<Shelf>>(Error(DefinitionError::invalid_value(
                    path + ".allowed", "more allowed products than slots")));
            }
            std::vector<ProductDefPtr> allowed(slot_count);
            for (std::size_t i = 0; i < def.allowed.size(); ++i) {
                if (!def.allowed[i]) {
                    continue;
                }
                allowed[i] = ctx.products.find(*def.allowed[i]);
                if (!allowed[i]) {
                    return stock_core::Err<std::unique_ptr<Shelf>>(Error(DefinitionError::unknown_product(
                        path + ".allowed[" + std::to_string(i) + "]", *def.allowed[i])));
                }
            }
            shelf = std::make_unique<DisplayShelf>(std::move(*slots), std::move(allowed),
                                                   slot_count, match_count, cell);
            break;
        }
        case ShelfKind::Deep: {
            std::vector<Shelf::Slots> layers;
            layers.reserve(def.layers.size());
            for (std::size_t i = 0; i < def.layers.size(); ++i) {
                auto layer = create_slots(def.layers[i], slot_count, ctx,
                                          path + ".layers[" + std::to_string(i) + "]");
                if (!layer) return stock_core::Err<std::unique_ptr<Shelf>>(layer.error());
                layers.push_back(std::move(*layer));
            }
            shelf = std::make_unique<DeepShelf>(std::move(layers), slot_count, match_count, cell);
            break;
        }
        default:
            return stock_core::Err<std::unique_ptr<Shelf>>(Error(DefinitionError::invalid_value(
                path, std::string(shelf_kind_name(def.kind)) + " is not a slot shelf")));
    }

    shelf->set_reference(def.reference);
    shelf->set_ignored(def.ignore);
    shelf->set_offset(def.offset);
    ctx.shelves.push_back(shelf.get());
    return stock_core::Ok(std::move(shelf));
}

Result<std::unique_ptr<IShelf>> ShelfFactory::create(const ShelfDef& def, BuildContext& ctx,
                                                     const std::string& path) {
    if (!is_wrapper_kind(def.kind)) {
        auto shelf = create_slot_shelf(def, ctx, path);
        if (!shelf) return stock_core::Err<std::unique_ptr<IShelf>>(shelf.error());
        return stock_core::Ok<std::unique_ptr<IShelf>>(std::move(*shelf));
    }

    if (!def.inner) {
        return stock_core::Err<std::unique_ptr<IShelf>>(Error(DefinitionError::missing_field(path, "shelf")));
    }
    auto nesting = validate_nesting(def.kind, def.inner->kind, path);
    if (!nesting) return stock_core::Err<std::unique_ptr<IShelf>>(nesting.error());

    auto inner = create(*def.inner, ctx, path + ".shelf");
    if (!inner) return stock_core::Err<std::unique_ptr<IShelf>>(inner.error());

    std::unique_ptr<IShelf> wrapper;
    switch (def.kind) {
        case ShelfKind::Disappearing:
            wrapper = std::make_unique<DisappearingShelf>(std::move(*inner));
            break;
        case ShelfKind::Supply:
            wrapper = std::make_unique<SupplyShelf>(std::move(*inner));
            break;
        case ShelfKind::Locking: {
            if (!def.locking) {
                return stock_core::Err<std::unique_ptr<IShelf>>(Error(DefinitionError::missing_field(path, "locking")));
            }
            auto condition = resolve_lock(*def.locking, ctx.products, path + ".locking");
            if (!condition) return stock_core::Err<std::unique_ptr<IShelf>>(condition.error());
            auto locking = std::make_unique<LockingShelf>(std::move(*inner), std::move(*condition));
            ctx.locking_shelves.push_back(locking.get());
            wrapper = std::move(locking);
            break;
        }
        default:
            return stock_core::Err<std::unique_ptr<IShelf>>(Error(DefinitionError::unknown_shelf_type(
                path, shelf_kind_name(def.kind))));
    }

    wrapper->set_offset(def.offset);
    return stock_core::Ok(std::move(wrapper));
}

// =============================================================================
// ActorFactory
// =============================================================================

Result<std::unique_ptr<Collapse>> ActorFactory::create_collapse(const CollapseDef& def, BuildContext& ctx,
                                                                const std::string& path) {
    std::vector<std::unique_ptr<Actor>> children;
    children.reserve(def.entries.size());

    for (std::size_t i = 0; i < def.entries.size(); ++i) {
        const auto& entry = def.entries[i];
        const std::string at = path + ".actors[" + std::to_string(i) + "]";
        if (entry.collapse) {
            auto nested = create_collapse(*entry.collapse, ctx, at);
            if (!nested) return stock_core::Err<std::unique_ptr<Collapse>>(nested.error());
            children.push_back(std::move(*nested));
        } else if (entry.shelf) {
            auto shelf = ShelfFactory::create(*entry.shelf, ctx, at);
            if (!shelf) return stock_core::Err<std::unique_ptr<Collapse>>(shelf.error());
            children.push_back(std::move(*shelf));
        } else {
            return stock_core::Err<std::unique_ptr<Collapse>>(Error(DefinitionError::invalid_value(
                at, "expected a shelf or a collapse")));
        }
    }

    return stock_core::Ok(std::make_unique<Collapse>(def.grid_width, def.grid_height, def.orientation,
                                                     def.direction, std::move(children),
                                                     ctx.config.product_size()));
}

Result<std::unique_ptr<Carousel>> ActorFactory::create_carousel(const CarouselDef& def, BuildContext& ctx,
                                                                const std::string& path) {
    std::vector<std::unique_ptr<IShelf>> shelves;
    shelves.reserve(def.shelves.size());

    for (std::size_t i = 0; i < def.shelves.size(); ++i) {
        auto shelf = ShelfFactory::create(def.shelves[i], ctx, path + ".shelves[" + std::to_string(i) + "]");
        if (!shelf) return stock_core::Err<std::unique_ptr<Carousel>>(shelf.error());
        shelves.push_back(std::move(*shelf));
    }

    return stock_core::Ok(std::make_unique<Carousel>(def.orientation, def.speed, std::move(shelves),
                                                     ctx.config.product_size()));
}

Result<std::unique_ptr<Actor>> ActorFactory::create(const ActorDef& def, BuildContext& ctx, const std::string& path) {
    switch (def.kind) {
        case ActorKind::Shelf: {
            if (!def.shelf) {
                return stock_core::Err<std::unique_ptr<Actor>>(Error(DefinitionError::missing_field(path, "shelf")));
            }
            auto shelf = ShelfFactory::create(*def.shelf, ctx, path);
            if (!shelf) return stock_core::Err<std::unique_ptr<Actor>>(shelf.error());
            return stock_core::Ok<std::unique_ptr<Actor>>(std::move(*shelf));
        }
        case ActorKind::Collapse: {
            if (!def.collapse) {
                return stock_core::Err<std::unique_ptr<Actor>>(Error(DefinitionError::missing_field(path, "collapse")));
            }
            auto collapse = create_collapse(*def.collapse, ctx, path);
            if (!collapse) return stock_core::Err<std::unique_ptr<Actor>>(collapse.error());
            return stock_core::Ok<std::unique_ptr<Actor>>(std::move(*collapse));
        }
        case ActorKind::Carousel: {
            if (!def.carousel) {
                return stock_core::Err<std::unique_ptr<Actor>>(Error(DefinitionError::missing_field(path, "carousel")));
            }
            auto carousel = create_carousel(*def.carousel, ctx, path);
            if (!carousel) return stock_core::Err<std::unique_ptr<Actor>>(carousel.error());
            return stock_core::Ok<std::unique_ptr<Actor>>(std::move(*carousel));
        }
    }
    return stock_core::Err<std::unique_ptr<Actor>>(Error(DefinitionError::invalid_value(path, "unknown actor kind")));
}

} // namespace stock_puzzle
