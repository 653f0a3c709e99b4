/// @file config.cpp
/// @brief LayerManagerConfig JSON parsing

#include <tableau_engine/compositor/config.hpp>

#include <nlohmann/json.hpp>

namespace tableau_compositor {

using tableau_core::ConfigError;
using tableau_core::Err;
using tableau_core::Ok;
using tableau_core::Result;

namespace {

Result<std::size_t> parse_cap(const nlohmann::json& j, const char* key, std::size_t fallback) {
    if (!j.contains(key)) {
        return Ok(fallback);
    }
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        return Err<std::size_t>(ConfigError::invalid_value(key, "expected an integer"));
    }
    if (v.get<std::int64_t>() < 0) {
        return Err<std::size_t>(ConfigError::invalid_value(key, "must not be negative"));
    }
    return Ok(v.get<std::size_t>());
}

// [r, g, b] or [r, g, b, a], each 0-255
Result<tableau_render::Color> parse_color(const nlohmann::json& arr, const char* key) {
    if (!arr.is_array() || arr.size() < 3 || arr.size() > 4) {
        return Err<tableau_render::Color>(ConfigError::invalid_value(key, "expected [r, g, b] or [r, g, b, a]"));
    }
    std::uint8_t channels[4] = {0, 0, 0, 255};
    for (std::size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_number_integer()) {
            return Err<tableau_render::Color>(ConfigError::invalid_value(key, "channels must be integers"));
        }
        auto value = arr[i].get<std::int64_t>();
        if (value < 0 || value > 255) {
            return Err<tableau_render::Color>(ConfigError::invalid_value(key, "channels must be in 0..255"));
        }
        channels[i] = static_cast<std::uint8_t>(value);
    }
    return Ok(tableau_render::Color{channels[0], channels[1], channels[2], channels[3]});
}

nlohmann::json color_to_json(const tableau_render::Color& c) {
    return nlohmann::json::array({c.r, c.g, c.b, c.a});
}

} // anonymous namespace

Result<LayerManagerConfig> LayerManagerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<LayerManagerConfig>(ConfigError::parse_error("layer manager config must be an object"));
    }

    LayerManagerConfig config;

    auto casts = parse_cap(j, "max_cast_layers", config.max_cast_layers);
    if (!casts) {
        return Err<LayerManagerConfig>(casts.error());
    }
    config.max_cast_layers = *casts;

    auto texts = parse_cap(j, "max_text_layers", config.max_text_layers);
    if (!texts) {
        return Err<LayerManagerConfig>(texts.error());
    }
    config.max_text_layers = *texts;

    if (j.contains("occlusion_culling")) {
        if (!j["occlusion_culling"].is_boolean()) {
            return Err<LayerManagerConfig>(ConfigError::invalid_value("occlusion_culling", "expected a boolean"));
        }
        config.occlusion_culling = j["occlusion_culling"].get<bool>();
    }

    if (j.contains("clear_color")) {
        auto color = parse_color(j["clear_color"], "clear_color");
        if (!color) {
            return Err<LayerManagerConfig>(color.error());
        }
        config.clear_color = *color;
    }

    return Ok(std::move(config));
}

Result<LayerManagerConfig> LayerManagerConfig::from_json_string(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<LayerManagerConfig>(ConfigError::parse_error(e.what()));
    }
    return from_json(j);
}

nlohmann::json LayerManagerConfig::to_json() const {
    nlohmann::json j;
    j["max_cast_layers"] = max_cast_layers;
    j["max_text_layers"] = max_text_layers;
    j["occlusion_culling"] = occlusion_culling;
    j["clear_color"] = color_to_json(clear_color);
    return j;
}

} // namespace tableau_compositor
