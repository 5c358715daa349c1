/// @file main.cpp
/// @brief Headless Level Runner
///
/// Loads a runtime config, a product catalogue and a level from the content
/// directory, plays a scripted sequence of drags with a simulated pointer,
/// then reports the level statistics.

#include <stockroom/puzzle/puzzle.hpp>
#include <stockroom/core/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace {

constexpr float k_tick = 1.0f / 60.0f;

/// Get the content directory relative to the working directory
std::filesystem::path get_content_path(int argc, char* argv[]) {
    if (argc > 1) {
        return std::filesystem::absolute(argv[1]);
    }

    std::vector<std::filesystem::path> candidates = {
        "content",
        "../content",
        "examples/headless_level/content",
        "../examples/headless_level/content",
    };

    for (const auto& path : candidates) {
        if (std::filesystem::exists(path)) {
            return std::filesystem::absolute(path);
        }
    }

    return std::filesystem::current_path() / "content";
}

/// One scripted drag between two referenced shelves
struct Move {
    std::string from;
    std::size_t from_slot;
    std::string to;
    std::size_t to_slot;
};

stock_puzzle::ViewBounds view_of(const stock_puzzle::Level& level) {
    const stock_puzzle::Vec2 origin = level.grid_origin();
    return stock_puzzle::ViewBounds{origin.x, -origin.x, origin.y, -origin.y};
}

void idle(stock_puzzle::Level& level, float seconds) {
    const stock_puzzle::ViewBounds view = view_of(level);
    for (float t = 0.0f; t < seconds; t += k_tick) {
        level.update(k_tick, stock_puzzle::PointerState{}, view);
    }
}

/// Press on the source slot, carry the pointer to the target slot, release
bool play_move(stock_puzzle::Level& level, const Move& move) {
    stock_puzzle::Shelf* from = level.find_shelf(move.from);
    stock_puzzle::Shelf* to = level.find_shelf(move.to);
    if (from == nullptr || to == nullptr) {
        STOCK_LOG_WARN("Move {}[{}] -> {}[{}]: shelf not found", move.from, move.from_slot, move.to, move.to_slot);
        return false;
    }

    const stock_puzzle::ViewBounds view = view_of(level);
    const stock_puzzle::Vec2 grab = from->slot_rect(move.from_slot).center();
    const stock_puzzle::Vec2 drop = to->slot_rect(move.to_slot).center();

    level.update(k_tick, stock_puzzle::PointerState{grab, true, true}, view);
    if (!level.dragging()) {
        STOCK_LOG_WARN("Move {}[{}]: nothing to pick up", move.from, move.from_slot);
        return false;
    }
    for (int i = 0; i < 30; ++i) {
        level.update(k_tick, stock_puzzle::PointerState{drop, false, true}, view);
    }
    level.update(k_tick, stock_puzzle::PointerState{drop, false, false}, view);

    const bool placed = level.last_drop() == stock_puzzle::DropResult::Placed;
    STOCK_LOG_INFO("Move {}[{}] -> {}[{}]: {}", move.from, move.from_slot, move.to, move.to_slot,
                   placed ? "placed" : "rejected");
    return placed;
}

/// Print level statistics
void print_stats(const stock_puzzle::Level& level) {
    const stock_puzzle::LevelStats& stats = level.stats();

    STOCK_LOG_INFO("=== Level '{}' ===", level.def().name);
    STOCK_LOG_INFO("Time: {:.2f}s", stats.time);
    if (auto remaining = level.time_remaining()) {
        STOCK_LOG_INFO("Time remaining: {:.2f}s", *remaining);
    }
    STOCK_LOG_INFO("Score: {}", stats.score);
    STOCK_LOG_INFO("Matches: {}", stats.total_matches);
    for (const auto& [id, entry] : stats.product_matches) {
        if (entry.total > 0) {
            STOCK_LOG_INFO("  - {}: {}", id, entry.total);
        }
    }
    STOCK_LOG_INFO("Completed shelves: {}", stats.total_completed_shelves);
    for (const auto& [reference, completed] : stats.completed_shelves) {
        STOCK_LOG_INFO("  - {}: {}", reference, completed ? "complete" : "open");
    }
    STOCK_LOG_INFO("Placements: {}", stats.product_placements.size());
    const auto& locks = level.locking_shelves();
    for (std::size_t i = 0; i < locks.size(); ++i) {
        STOCK_LOG_INFO("Lock {}: {}", i, locks[i]->locked() ? "locked" : "unlocked");
    }
    STOCK_LOG_INFO("Level completed: {}", level.completed() ? "yes" : "no");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
    stock_core::init_logging();

    auto content_path = get_content_path(argc, argv);
    STOCK_LOG_INFO("=== Headless Level Runner ===");
    STOCK_LOG_INFO("Content directory: {}", content_path.string());

    if (!std::filesystem::exists(content_path)) {
        STOCK_LOG_ERROR("Content directory not found: {}", content_path.string());
        return EXIT_FAILURE;
    }

    // Runtime configuration is optional; defaults apply without it
    stock_puzzle::RuntimeConfig config;
    auto config_file = content_path / "stockroom.toml";
    if (std::filesystem::exists(config_file)) {
        auto loaded = stock_puzzle::RuntimeConfig::from_toml_file(config_file);
        if (!loaded) {
            STOCK_LOG_ERROR("Failed to load config: {}", stock_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    stock_core::configure_logging(config.logging);
    STOCK_LOG_INFO("Log level: {}", stock_core::log_level_name(config.logging.level));

    auto products = stock_puzzle::load_product_file(content_path / "products.json");
    if (!products) {
        STOCK_LOG_ERROR("Failed to load products: {}", stock_core::build_error_chain(products.error()));
        return EXIT_FAILURE;
    }
    auto catalogue = stock_puzzle::ProductFactory::from_defs(std::move(*products));
    if (!catalogue) {
        STOCK_LOG_ERROR("Invalid catalogue: {}", stock_core::build_error_chain(catalogue.error()));
        return EXIT_FAILURE;
    }

    auto level_def = stock_puzzle::load_level_file(content_path / "level_01.json");
    if (!level_def) {
        STOCK_LOG_ERROR("Failed to load level: {}", stock_core::build_error_chain(level_def.error()));
        return EXIT_FAILURE;
    }

    auto level = stock_puzzle::Level::create(*level_def, *catalogue, config.puzzle);
    if (!level) {
        STOCK_LOG_ERROR("Failed to build level: {}", stock_core::build_error_chain(level.error()));
        return EXIT_FAILURE;
    }

    // Let products settle into their slots
    idle(**level, 0.5f);

    const std::vector<Move> script = {
        {"right", 0, "left", 2},   // third apple completes the left shelf and opens the vault
        {"vault", 0, "right", 3},  // third banana clears the right shelf
        {"cellar", 1, "crate", 1}, // dropping on a supply shelf is rejected
    };
    for (const auto& move : script) {
        play_move(**level, move);
        idle(**level, 1.5f);
    }

    print_stats(**level);

    stock_core::shutdown_logging();
    return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        STOCK_LOG_CRITICAL("FATAL EXCEPTION: {}", e.what());
        spdlog::default_logger()->flush();
        return EXIT_FAILURE;
    }
}
