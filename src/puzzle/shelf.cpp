/// @file shelf.cpp
/// @brief Base shelf slots, capabilities and matching

#include <stockroom/puzzle/shelf.hpp>
#include <stockroom/puzzle/config.hpp>

#include <stockroom/core/log.hpp>

#include <algorithm>

namespace stock_puzzle {

// =============================================================================
// Matching
// =============================================================================

MatchResult find_match_group(const std::vector<Product*>& candidates, std::size_t match_count) {
    MatchResult result;
    if (match_count == 0) {
        return result;
    }

    for (Product* seed : candidates) {
        std::vector<Product*> group{seed};

        while (group.size() < match_count) {
            Product* next = nullptr;
            for (Product* candidate : candidates) {
                if (std::find(group.begin(), group.end(), candidate) != group.end()) {
                    continue;
                }
                bool matches_all = std::all_of(group.begin(), group.end(), [&](const Product* member) {
                    return candidate->matches(*member);
                });
                if (matches_all) {
                    next = candidate;
                    break;
                }
            }
            if (next == nullptr) {
                break;
            }
            group.push_back(next);
        }

        if (group.size() >= match_count) {
            result.found = true;
            result.products = std::move(group);
            return result;
        }
    }
    return result;
}

// =============================================================================
// Shelf
// =============================================================================

Shelf::Shelf(Slots products, std::size_t slot_count, std::size_t match_count, Vec2 cell_size)
    : m_products(std::move(products))
    , m_slot_count(slot_count)
    , m_match_count(match_count)
    , m_cell_size(cell_size) {
    m_products.resize(m_slot_count);
}

Vec2 Shelf::size() const {
    return Vec2(m_cell_size.x * static_cast<float>(m_slot_count), m_cell_size.y);
}

Rect Shelf::slot_rect(std::size_t index) const {
    return Rect(position() + Vec2(m_cell_size.x * static_cast<float>(index), 0.0f), m_cell_size);
}

Product* Shelf::product_at(std::size_t index) const {
    if (index >= m_products.size()) {
        return nullptr;
    }
    return m_products[index].get();
}

std::vector<ProductDefPtr> Shelf::slot_contents() const {
    std::vector<ProductDefPtr> contents;
    contents.reserve(m_products.size());
    for (const auto& product : m_products) {
        contents.push_back(product ? product->shared_def() : nullptr);
    }
    return contents;
}

bool Shelf::add_product_at(std::size_t index, std::unique_ptr<Product>&& product) {
    if (!product || index >= m_products.size() || m_products[index]) {
        return false;
    }
    m_products[index] = std::move(product);
    return true;
}

std::unique_ptr<Product> Shelf::remove_product_at(std::size_t index) {
    if (index >= m_products.size()) {
        return nullptr;
    }
    return std::move(m_products[index]);
}

std::optional<bool> Shelf::lock_product_at(std::size_t index, bool locked) {
    Product* product = product_at(index);
    if (product == nullptr) {
        return std::nullopt;
    }
    product->set_locked(locked);
    return product->locked();
}

// =============================================================================
// Capabilities
// =============================================================================

bool Shelf::slot_allows_pick_up(const Product& /*product*/, std::size_t index) const {
    const Product* occupant = product_at(index);
    return occupant != nullptr && !occupant->disappearing();
}

bool Shelf::slot_allows_drop(const Product& /*product*/, std::size_t index) const {
    return index < m_products.size() && !m_products[index];
}

bool Shelf::can_pick_up_at(const Product& product, std::size_t index) const {
    if (!slot_allows_pick_up(product, index)) {
        return false;
    }
    return std::all_of(m_gates.begin(), m_gates.end(), [](const ShelfGate* gate) {
        return gate->allows_pick_up();
    });
}

bool Shelf::can_drop_at(const Product& product, std::size_t index) const {
    if (!slot_allows_drop(product, index)) {
        return false;
    }
    return std::all_of(m_gates.begin(), m_gates.end(), [](const ShelfGate* gate) {
        return gate->allows_drop();
    });
}

std::optional<SlotCandidate> Shelf::find_slot(const Product& product) const {
    const Rect product_rect = product.rect();
    std::optional<SlotCandidate> best;

    for (std::size_t i = 0; i < m_slot_count; ++i) {
        if (!can_drop_at(product, i)) {
            continue;
        }
        const Rect slot = slot_rect(i);
        if (!slot.overlaps(product_rect)) {
            continue;
        }
        const float d = slot.center_distance(product_rect);
        if (!best || d < best->distance) {
            best = SlotCandidate{i, d};
        }
    }
    return best;
}

bool Shelf::slots_empty(const Slots& slots) {
    return std::all_of(slots.begin(), slots.end(), [](const auto& p) { return p == nullptr; });
}

bool Shelf::is_empty() const {
    return slots_empty(m_products);
}

bool Shelf::is_complete() const {
    return is_empty();
}

void Shelf::add_gate(const ShelfGate* gate) {
    if (gate != nullptr && std::find(m_gates.begin(), m_gates.end(), gate) == m_gates.end()) {
        m_gates.push_back(gate);
    }
}

// =============================================================================
// Update
// =============================================================================

MatchResult Shelf::check_for_matches() const {
    std::vector<Product*> candidates;
    candidates.reserve(m_products.size());
    for (const auto& product : m_products) {
        if (product && !product->disappearing()) {
            candidates.push_back(product.get());
        }
    }
    return find_match_group(candidates, m_match_count);
}

void Shelf::update_products(TickContext& ctx) {
    for (std::size_t i = 0; i < m_products.size(); ++i) {
        if (m_products[i]) {
            m_products[i]->update(ctx, *this, i);
        }
    }
    for (auto& product : m_products) {
        if (product && product->finished_disappearing()) {
            product.reset();
        }
    }
}

void Shelf::record_match(const MatchResult& match, TickContext& ctx) {
    for (const Product* product : match.products) {
        ctx.stats.record_match(product->shared_def());
    }
}

void Shelf::update(TickContext& ctx) {
    update_products(ctx);

    MatchResult match = check_for_matches();
    if (!match.found) {
        return;
    }

    for (std::size_t i = 0; i < match.products.size(); ++i) {
        match.products[i]->disappear(static_cast<float>(i) * ctx.config.match_stagger,
                                     ctx.config.product_disappear_time);
    }
    record_match(match, ctx);

    stock_core::puzzle_logger()->debug("[Shelf] Matched {} x '{}'{}", match.products.size(),
                                       match.products.front()->id(),
                                       m_reference ? " on " + *m_reference : std::string());
}

} // namespace stock_puzzle
