#pragma once

/// @file config.hpp
/// @brief LayerManager configuration

#include "fwd.hpp"

#include <tableau_engine/core/error.hpp>
#include <tableau_engine/render/types.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string_view>

namespace tableau_compositor {

// =============================================================================
// LayerManagerConfig
// =============================================================================

/// Layer manager configuration
struct LayerManagerConfig {
    /// Cast layers allowed per picture (checked by LayerManager::check_capacity)
    std::size_t max_cast_layers = 1024;

    /// Text layers allowed per picture
    std::size_t max_text_layers = 256;

    /// Skip layers fully hidden behind an opaque upper layer
    bool occlusion_culling = true;

    /// Default window background
    tableau_render::Color clear_color = tableau_render::Color::rgb(255, 255, 255);

    /// Create default config
    static LayerManagerConfig create() {
        return LayerManagerConfig{};
    }

    /// Builder: set cast cap
    [[nodiscard]] LayerManagerConfig& with_max_cast_layers(std::size_t count) {
        max_cast_layers = count;
        return *this;
    }

    /// Builder: set text cap
    [[nodiscard]] LayerManagerConfig& with_max_text_layers(std::size_t count) {
        max_text_layers = count;
        return *this;
    }

    /// Builder: enable/disable occlusion culling
    [[nodiscard]] LayerManagerConfig& with_occlusion_culling(bool enable) {
        occlusion_culling = enable;
        return *this;
    }

    /// Builder: set default window background
    [[nodiscard]] LayerManagerConfig& with_clear_color(const tableau_render::Color& color) {
        clear_color = color;
        return *this;
    }

    /// Parse from a JSON object; unknown keys are ignored
    [[nodiscard]] static tableau_core::Result<LayerManagerConfig> from_json(const nlohmann::json& j);

    /// Parse from JSON text
    [[nodiscard]] static tableau_core::Result<LayerManagerConfig> from_json_string(std::string_view text);

    /// Serialize
    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace tableau_compositor
