#pragma once

/// @file math.hpp
/// @brief Main include file for stock_math
///
/// @code
/// #include <stockroom/math/math.hpp>
/// using namespace stock_math;
///
/// Rect slot(Vec2(0.0f, 0.0f), Vec2(1.0f, 1.5f));
/// bool hit = slot.overlaps(product_rect);
/// @endcode

// Core type definitions and GLM integration
#include "types.hpp"

// Rectangles (2D bounding boxes)
#include "rect.hpp"

// Easing curves
#include "easing.hpp"
