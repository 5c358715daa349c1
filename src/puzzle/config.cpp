/// @file config.cpp
/// @brief PuzzleConfig TOML loading

#include <stockroom/puzzle/config.hpp>

#include <toml++/toml.hpp>

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

namespace stock_puzzle {

namespace {

using stock_core::ConfigError;
using stock_core::Error;
using stock_core::Result;

/// Reads typed keys from one table; the first type mismatch is kept
struct TableReader {
    const toml::table& tbl;
    const char* table_name;
    std::optional<Error>& error;

    void number(const char* key, float& out) {
        auto node = tbl[key];
        if (!node || error) {
            return;
        }
        if (auto value = node.value<double>()) {
            out = static_cast<float>(*value);
            return;
        }
        error = Error(ConfigError::invalid_value(std::string(table_name) + "." + key, "expected a number"));
    }

    void count(const char* key, std::size_t& out) {
        auto node = tbl[key];
        if (!node || error) {
            return;
        }
        auto value = node.value<std::int64_t>();
        if (!value || *value < 0) {
            error = Error(ConfigError::invalid_value(std::string(table_name) + "." + key,
                                                     "expected a non-negative integer"));
            return;
        }
        out = static_cast<std::size_t>(*value);
    }
};

Result<void> parse_puzzle_tables(const toml::table& root, PuzzleConfig& config) {
    std::optional<Error> error;

    if (auto product = root["product"].as_table()) {
        TableReader r{*product, "product", error};
        r.number("width", config.product_width);
        r.number("aspect", config.product_aspect);
        r.number("move_ease", config.move_ease);
        r.number("landing_range", config.landing_range);
        r.number("max_tilt", config.max_tilt);
        r.number("tilt_per_velocity", config.tilt_per_velocity);
        r.number("tilt_ease", config.tilt_ease);
    }

    if (auto shelf = root["shelf"].as_table()) {
        TableReader r{*shelf, "shelf", error};
        r.count("slot_count", config.default_slot_count);
        r.count("match_count", config.default_match_count);
    }

    if (auto timing = root["timing"].as_table()) {
        TableReader r{*timing, "timing", error};
        r.number("match_stagger", config.match_stagger);
        r.number("move_cooldown", config.move_cooldown);
        r.number("landing", config.landing_time);
        r.number("product_disappear", config.product_disappear_time);
        r.number("closing", config.closing_time);
        r.number("completing", config.completing_time);
        r.number("layer_change", config.layer_change_time);
        r.number("shelf_exit", config.shelf_exit_time);
        r.number("lock_transition", config.lock_transition_time);
    }

    if (auto collapse = root["collapse"].as_table()) {
        TableReader r{*collapse, "collapse", error};
        r.number("ease_time", config.collapse_ease_time);
        r.number("settle_tolerance", config.settle_tolerance);
    }

    if (error) {
        return stock_core::Err(std::move(*error));
    }
    return config.validate();
}

Result<void> parse_logging_table(const toml::table& root, stock_core::LogConfig& logging) {
    auto tbl = root["logging"].as_table();
    if (!tbl) {
        return stock_core::Ok();
    }

    if (auto level = (*tbl)["level"].value<std::string>()) {
        auto parsed = stock_core::parse_log_level(*level);
        if (!parsed) {
            return stock_core::Err(Error(ConfigError::invalid_value("logging.level", "unknown level '" + *level + "'")));
        }
        logging.level = *parsed;
    }
    if (auto console = (*tbl)["console"].value<bool>()) {
        logging.console_enabled = *console;
    }
    if (auto directory = (*tbl)["directory"].value<std::string>()) {
        logging.log_directory = *directory;
        logging.file_enabled = !directory->empty();
    }
    if (auto file = (*tbl)["file"].value<bool>()) {
        logging.file_enabled = *file;
    }

    std::optional<Error> error;
    TableReader r{*tbl, "logging", error};
    r.count("max_file_size", logging.max_file_size);
    r.count("max_files", logging.max_files);
    if (error) {
        return stock_core::Err(std::move(*error));
    }
    return stock_core::Ok();
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return stock_core::Err<std::string>(Error(ConfigError::file_not_found(path.string())));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// =============================================================================
// PuzzleConfig
// =============================================================================

Result<void> PuzzleConfig::validate() const {
    if (product_width <= 0.0f) {
        return stock_core::Err(Error(ConfigError::invalid_value("product.width", "must be positive")));
    }
    if (product_aspect <= 0.0f) {
        return stock_core::Err(Error(ConfigError::invalid_value("product.aspect", "must be positive")));
    }
    if (move_ease <= 0.0f || move_ease > 1.0f) {
        return stock_core::Err(Error(ConfigError::invalid_value("product.move_ease", "must be in (0, 1]")));
    }
    if (default_slot_count == 0) {
        return stock_core::Err(Error(ConfigError::invalid_value("shelf.slot_count", "must be at least 1")));
    }
    if (default_match_count == 0) {
        return stock_core::Err(Error(ConfigError::invalid_value("shelf.match_count", "must be at least 1")));
    }
    if (collapse_ease_time <= 0.0f) {
        return stock_core::Err(Error(ConfigError::invalid_value("collapse.ease_time", "must be positive")));
    }

    const float timings[] = {match_stagger, move_cooldown, landing_time, product_disappear_time,
                             closing_time, completing_time, layer_change_time, shelf_exit_time,
                             lock_transition_time, settle_tolerance};
    for (float t : timings) {
        if (t < 0.0f) {
            return stock_core::Err(Error(ConfigError::invalid_value("timing", "durations must not be negative")));
        }
    }
    return stock_core::Ok();
}

Result<PuzzleConfig> PuzzleConfig::from_toml_string(const std::string& content, const std::string& source_name) {
    PuzzleConfig config;
    try {
        toml::table tbl = toml::parse(content, source_name);
        auto parsed = parse_puzzle_tables(tbl, config);
        if (!parsed) {
            return stock_core::Err<PuzzleConfig>(parsed.error());
        }
    } catch (const toml::parse_error& err) {
        return stock_core::Err<PuzzleConfig>(Error(ConfigError::parse_failed(
            source_name + ": " + std::string(err.description()))));
    }
    return config;
}

Result<PuzzleConfig> PuzzleConfig::from_toml_file(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return stock_core::Err<PuzzleConfig>(content.error());
    }
    return from_toml_string(*content, path.string());
}

// =============================================================================
// RuntimeConfig
// =============================================================================

Result<RuntimeConfig> RuntimeConfig::from_toml_string(const std::string& content, const std::string& source_name) {
    RuntimeConfig config;
    try {
        toml::table tbl = toml::parse(content, source_name);

        auto puzzle = parse_puzzle_tables(tbl, config.puzzle);
        if (!puzzle) {
            return stock_core::Err<RuntimeConfig>(puzzle.error());
        }
        auto logging = parse_logging_table(tbl, config.logging);
        if (!logging) {
            return stock_core::Err<RuntimeConfig>(logging.error());
        }
    } catch (const toml::parse_error& err) {
        return stock_core::Err<RuntimeConfig>(Error(ConfigError::parse_failed(
            source_name + ": " + std::string(err.description()))));
    }
    return config;
}

Result<RuntimeConfig> RuntimeConfig::from_toml_file(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return stock_core::Err<RuntimeConfig>(content.error());
    }
    return from_toml_string(*content, path.string());
}

} // namespace stock_puzzle
