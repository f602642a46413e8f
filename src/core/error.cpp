/// @file error.cpp
/// @brief Error handling implementation for fold_core
///
/// The error system is header-only apart from message formatting and the
/// explicit instantiations of the Result types used across the library.

#include <fold/core/error.hpp>

#include <cstddef>
#include <sstream>

namespace fold_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* validation_kind_name(ValidationError::Kind kind) {
    switch (kind) {
        case ValidationError::Kind::MissingField: return "missing field";
        case ValidationError::Kind::InvalidValue: return "invalid value";
    }
    return "unknown";
}

/// Format validation error with component and field
std::string format_validation_error(const ValidationError& err) {
    std::ostringstream oss;
    oss << "[ValidationError] " << err.message
        << " (" << validation_kind_name(err.kind);
    if (!err.component.empty()) {
        oss << ", component: " << err.component;
    }
    if (!err.field.empty()) {
        oss << ", field: " << err.field;
    }
    oss << ")";
    return oss.str();
}

/// Format config error with path and key
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

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
        } else if constexpr (std::is_same_v<T, ValidationError>) {
            oss << detail::format_validation_error(err);
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
template class Result<float, Error>;
template class Result<std::size_t, Error>;

} // namespace fold_core
