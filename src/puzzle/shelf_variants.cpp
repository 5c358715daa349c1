/// @file shelf_variants.cpp
/// @brief ClosingShelf, DisplayShelf and DeepShelf

#include <stockroom/puzzle/shelf_variants.hpp>
#include <stockroom/puzzle/config.hpp>

#include <stockroom/core/log.hpp>

#include <algorithm>

namespace stock_puzzle {

using stock_math::clamp;

namespace {

std::string describe(const std::optional<ShelfReference>& reference) {
    return reference ? "'" + *reference + "'" : std::string("(unreferenced)");
}

/// Advance a 0..1 progress value over @p duration seconds
float advance(float progress, float dt, float duration) {
    if (duration <= 0.0f) {
        return 1.0f;
    }
    return clamp(progress + dt / duration, 0.0f, 1.0f);
}

} // anonymous namespace

// =============================================================================
// ClosingShelf
// =============================================================================

bool ClosingShelf::slot_allows_pick_up(const Product& product, std::size_t index) const {
    return !m_closed && Shelf::slot_allows_pick_up(product, index);
}

bool ClosingShelf::slot_allows_drop(const Product& product, std::size_t index) const {
    return !m_closed && Shelf::slot_allows_drop(product, index);
}

void ClosingShelf::update(TickContext& ctx) {
    update_products(ctx);

    if (!m_closed) {
        MatchResult match = check_for_matches();
        if (match.found) {
            m_closed = true;
            record_match(match, ctx);
            stock_core::puzzle_logger()->debug("[ClosingShelf] {} closed on {} x '{}'",
                                               describe(reference()), match.products.size(),
                                               match.products.front()->id());
        }
    }

    if (m_closed) {
        m_closing_progress = advance(m_closing_progress, ctx.dt, ctx.config.closing_time);
    }
}

// =============================================================================
// DisplayShelf
// =============================================================================

DisplayShelf::DisplayShelf(Slots products, std::vector<ProductDefPtr> allowed,
                           std::size_t slot_count, std::size_t match_count, Vec2 cell_size)
    : Shelf(std::move(products), slot_count, match_count, cell_size)
    , m_allowed(std::move(allowed)) {
    m_allowed.resize(slot_count);
}

bool DisplayShelf::slot_allows_pick_up(const Product& product, std::size_t index) const {
    return !m_completed && Shelf::slot_allows_pick_up(product, index);
}

bool DisplayShelf::slot_allows_drop(const Product& product, std::size_t index) const {
    return !m_completed && Shelf::slot_allows_drop(product, index);
}

MatchResult DisplayShelf::check_for_matches() const {
    MatchResult result;
    for (std::size_t i = 0; i < m_products.size(); ++i) {
        const ProductDefPtr& required = m_allowed[i];
        Product* product = m_products[i].get();

        if (!required && product == nullptr) {
            continue;
        }
        if (required && product != nullptr && product->matches(*required)) {
            result.products.push_back(product);
            continue;
        }
        result.products.clear();
        return result;
    }
    result.found = true;
    return result;
}

void DisplayShelf::update(TickContext& ctx) {
    update_products(ctx);

    if (!m_completed) {
        MatchResult match = check_for_matches();
        if (match.found) {
            m_completed = true;
            record_match(match, ctx);
            stock_core::puzzle_logger()->debug("[DisplayShelf] {} completed with {} products",
                                               describe(reference()), match.products.size());
        }
    }

    if (m_completed) {
        m_completing_progress = advance(m_completing_progress, ctx.dt, ctx.config.completing_time);
    }
}

// =============================================================================
// DeepShelf
// =============================================================================

DeepShelf::DeepShelf(std::vector<Slots> layers, std::size_t slot_count, std::size_t match_count,
                     Vec2 cell_size)
    : Shelf(layers.empty() ? Slots{} : std::move(layers.back()), slot_count, match_count, cell_size)
    , m_has_layers(!layers.empty()) {
    if (!layers.empty()) {
        layers.pop_back();
    }
    m_hidden = std::move(layers);
    for (auto& layer : m_hidden) {
        layer.resize(slot_count);
    }
}

std::size_t DeepShelf::layer_count() const {
    return m_has_layers ? m_hidden.size() + 1 : 0;
}

bool DeepShelf::slot_allows_drop(const Product& product, std::size_t index) const {
    return m_has_layers && Shelf::slot_allows_drop(product, index);
}

bool DeepShelf::add_product_at(std::size_t index, std::unique_ptr<Product>&& product) {
    if (!m_has_layers) {
        return false;
    }
    return Shelf::add_product_at(index, std::move(product));
}

std::unique_ptr<Product> DeepShelf::remove_product_at(std::size_t index) {
    if (!m_has_layers) {
        return nullptr;
    }
    return Shelf::remove_product_at(index);
}

std::optional<bool> DeepShelf::lock_product_at(std::size_t index, bool locked) {
    if (!m_has_layers || slot_count() == 0) {
        return std::nullopt;
    }
    const std::size_t layer = index / slot_count();
    const std::size_t slot = index % slot_count();

    if (layer == m_hidden.size()) {
        return Shelf::lock_product_at(slot, locked);
    }
    if (layer > m_hidden.size()) {
        return std::nullopt;
    }
    Product* product = m_hidden[layer][slot].get();
    if (product == nullptr) {
        return std::nullopt;
    }
    product->set_locked(locked);
    return product->locked();
}

bool DeepShelf::is_empty() const {
    return slots_empty(m_products) &&
           std::all_of(m_hidden.begin(), m_hidden.end(), [](const Slots& layer) { return slots_empty(layer); });
}

void DeepShelf::update(TickContext& ctx) {
    Shelf::update(ctx);

    // Hidden layers sit exactly under the live one
    for (auto& layer : m_hidden) {
        for (std::size_t i = 0; i < layer.size(); ++i) {
            if (layer[i]) {
                layer[i]->set_position_immediate(slot_rect(i).position);
            }
        }
    }

    if (!m_changing && !m_hidden.empty() && slots_empty(m_products)) {
        m_changing = true;
        m_changing_time = ctx.config.layer_change_time;
    }

    m_changing_time = clamp(m_changing_time - ctx.dt, 0.0f, ctx.config.layer_change_time);

    if (m_changing && m_changing_time <= 0.0f) {
        // A product dropped during the transition keeps the live layer
        if (!m_hidden.empty() && slots_empty(m_products)) {
            m_products = std::move(m_hidden.back());
            m_hidden.pop_back();
            stock_core::puzzle_logger()->debug("[DeepShelf] {} exposed next layer, {} remaining",
                                               describe(reference()), layer_count());
        }
        m_changing = false;
    }
}

} // namespace stock_puzzle
