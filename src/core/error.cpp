/// @file error.cpp
/// @brief Error handling implementation for stock_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <stockroom/core/error.hpp>
#include <atomic>
#include <sstream>

namespace stock_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* definition_kind_name(DefinitionError::Kind kind) {
    switch (kind) {
        case DefinitionError::Kind::MissingField: return "MissingField";
        case DefinitionError::Kind::InvalidValue: return "InvalidValue";
        case DefinitionError::Kind::UnknownProduct: return "UnknownProduct";
        case DefinitionError::Kind::UnknownShelfType: return "UnknownShelfType";
        case DefinitionError::Kind::UnknownReference: return "UnknownReference";
        case DefinitionError::Kind::DuplicateId: return "DuplicateId";
        case DefinitionError::Kind::InvalidNesting: return "InvalidNesting";
    }
    return "Unknown";
}

/// Format definition error with full context
std::string format_definition_error(const DefinitionError& err) {
    std::ostringstream oss;
    oss << "[DefinitionError:" << definition_kind_name(err.kind) << "] " << err.message;

    if (!err.path.empty()) {
        oss << " (at: " << err.path << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, DefinitionError>) {
            oss << detail::format_definition_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<float, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> definition_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<DefinitionError>()) {
        s_error_stats.definition_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.definition_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Definition: " << s_error_stats.definition_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace stock_core
