/// @file config.hpp
/// @brief Tunable puzzle constants and TOML loading

#pragma once

#include "types.hpp"

#include <stockroom/core/error.hpp>
#include <stockroom/core/log.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace stock_puzzle {

// =============================================================================
// PuzzleConfig
// =============================================================================

/// @brief Every tunable used by products, shelves and layout containers
///
/// Loaded from TOML:
/// @code
/// [product]
/// width = 1.0
/// aspect = 1.5
///
/// [shelf]
/// slot_count = 3
/// match_count = 3
///
/// [timing]
/// match_stagger = 0.2
/// lock_transition = 0.3
///
/// [collapse]
/// ease_time = 1.5
/// @endcode
struct PuzzleConfig {
    // [product]
    float product_width{1.0f};
    float product_aspect{1.5f};         ///< height / width
    float move_ease{0.35f};             ///< Fraction of remaining distance covered per tick
    float landing_range{0.05f};         ///< Fraction of width within which landing starts
    float max_tilt{stock_math::consts::PI / 4.0f};
    float tilt_per_velocity{2.0f};
    float tilt_ease{0.35f};

    // [shelf]
    std::size_t default_slot_count{3};
    std::size_t default_match_count{3};

    // [timing] (seconds)
    float match_stagger{0.2f};
    float move_cooldown{0.75f};
    float landing_time{0.4f};
    float product_disappear_time{0.5f};
    float closing_time{0.5f};
    float completing_time{0.5f};
    float layer_change_time{0.5f};
    float shelf_exit_time{0.5f};
    float lock_transition_time{0.3f};

    // [collapse]
    float collapse_ease_time{1.5f};
    float settle_tolerance{1e-3f};

    /// @brief World size of one product / slot cell
    [[nodiscard]] Vec2 product_size() const {
        return Vec2(product_width, product_width * product_aspect);
    }

    /// @brief Check every value is in range
    [[nodiscard]] stock_core::Result<void> validate() const;

    /// @brief Parse from TOML text; missing keys keep their defaults
    [[nodiscard]] static stock_core::Result<PuzzleConfig> from_toml_string(
        const std::string& content, const std::string& source_name = "puzzle.toml");

    /// @brief Parse from a TOML file
    [[nodiscard]] static stock_core::Result<PuzzleConfig> from_toml_file(
        const std::filesystem::path& path);
};

// =============================================================================
// RuntimeConfig
// =============================================================================

/// @brief Puzzle tunables plus the [logging] table of the same file
struct RuntimeConfig {
    PuzzleConfig puzzle;
    stock_core::LogConfig logging;

    [[nodiscard]] static stock_core::Result<RuntimeConfig> from_toml_string(
        const std::string& content, const std::string& source_name = "stockroom.toml");

    [[nodiscard]] static stock_core::Result<RuntimeConfig> from_toml_file(
        const std::filesystem::path& path);
};

} // namespace stock_puzzle
