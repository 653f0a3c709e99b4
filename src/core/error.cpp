/// @file error.cpp
/// @brief Error formatting for tableau_core

#include <tableau_engine/core/error.hpp>
#include <sstream>

namespace tableau_core {

namespace detail {

std::string format_scene_error(const SceneError& err) {
    std::ostringstream oss;
    oss << "[SceneError] " << err.message;
    if (err.sprite_id != 0) {
        oss << " (sprite: " << err.sprite_id << ")";
    }
    return oss.str();
}

std::string format_layer_error(const LayerError& err) {
    std::ostringstream oss;
    oss << "[LayerError] " << err.message << " (surface: " << err.surface_id << ")";
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
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
        } else if constexpr (std::is_same_v<T, SceneError>) {
            oss << detail::format_scene_error(err);
        } else if constexpr (std::is_same_v<T, LayerError>) {
            oss << detail::format_layer_error(err);
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
template class Result<std::string, Error>;

} // namespace tableau_core
