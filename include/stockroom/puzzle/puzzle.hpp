#pragma once

/// @file puzzle.hpp
/// @brief Main include file for stock_puzzle module
///
/// This header includes all stock_puzzle components in dependency order.

// Forward declarations and shared value types
#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"

// Content definitions and statistics
#include "definitions.hpp"
#include "stats.hpp"

// Actors
#include "actor.hpp"
#include "product.hpp"
#include "shelf.hpp"
#include "shelf_variants.hpp"
#include "shelf_wrappers.hpp"
#include "locking.hpp"
#include "layout.hpp"

// Construction and play
#include "factory.hpp"
#include "level.hpp"

/// @namespace stock_puzzle
/// @brief Shelf-sorting puzzle rules engine
///
/// Key components:
///
/// - **Definitions**: JSON product catalogues and level layouts
/// - **Shelves**: Slot shelves with per-kind match and completion rules
/// - **Wrappers**: Supply, disappearing and locking shelves
/// - **Layout**: Collapsing grids and scrolling carousels
/// - **Level**: Drag and drop, completion and level statistics
///
/// Example usage:
/// @code
/// auto products = stock_puzzle::load_product_file("products.json");
/// auto catalogue = stock_puzzle::ProductFactory::from_defs(std::move(*products));
/// auto level_def = stock_puzzle::load_level_file("level_01.json");
/// auto level = stock_puzzle::Level::create(*level_def, *catalogue);
/// (*level)->update(1.0f / 60.0f, pointer);
/// @endcode
