/// @file error.cpp
/// @brief Error formatting and statistics for voxel_core

#include <voxel/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace voxel_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.field.empty() && err.kind != ConfigError::Kind::IOError) {
        oss << " (field: " << err.field << ")";
    }
    return oss.str();
}

std::string format_capacity_error(const CapacityError& err) {
    std::ostringstream oss;
    oss << "[CapacityError] " << err.message;
    return oss.str();
}

std::string format_entity_error(const EntityError& err) {
    std::ostringstream oss;
    oss << "[EntityError] " << err.message;
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
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, CapacityError>) {
            oss << detail::format_capacity_error(err);
        } else if constexpr (std::is_same_v<T, EntityError>) {
            oss << detail::format_entity_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<float, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> capacity_errors{0};
    std::atomic<std::uint64_t> entity_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<CapacityError>()) {
        s_error_stats.capacity_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<EntityError>()) {
        s_error_stats.entity_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t capacity_error_count() {
    return s_error_stats.capacity_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.capacity_errors.store(0, std::memory_order_relaxed);
    s_error_stats.entity_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Capacity: " << s_error_stats.capacity_errors.load() << "\n"
        << "  Entity: " << s_error_stats.entity_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace voxel_core
