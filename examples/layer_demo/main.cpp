/// @file main.cpp
/// @brief Layer compositing demo
///
/// Builds a small scene tree and a picture layer stack with the software
/// backend, composites it and prints the resulting diagnostics. An optional
/// argument names a JSON file with LayerManager settings. TABLEAU_LOG_LEVEL
/// selects the log level (default "debug").

#include <tableau_engine/core/core.hpp>
#include <tableau_engine/compositor/compositor.hpp>
#include <tableau_engine/render/software_image.hpp>
#include <tableau_engine/scene/scene.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

using tableau_render::Color;
using tableau_render::IntRect;
using tableau_render::SoftwareImage;
using tableau_render::SoftwareImageFactory;

/// Load LayerManager settings from a file, defaults when no path is given
tableau_core::Result<tableau_compositor::LayerManagerConfig> load_config(int argc, char* argv[]) {
    if (argc < 2) {
        return tableau_core::Ok(tableau_compositor::LayerManagerConfig::create());
    }

    std::ifstream file(argv[1]);
    if (!file) {
        return tableau_core::Err<tableau_compositor::LayerManagerConfig>(
            tableau_core::ConfigError::parse_error(std::string("cannot open ") + argv[1]));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return tableau_compositor::LayerManagerConfig::from_json_string(buffer.str());
}

/// Two windows with nested sprites; the first child is brought to front
void run_scene_demo(const std::shared_ptr<SoftwareImageFactory>& factory) {
    spdlog::info("=== Scene Graph ===");

    tableau_scene::SceneGraph graph(factory);

    graph.create_root_sprite(SoftwareImage::create_filled(160, 120, Color::rgb(40, 40, 40)), 0);
    auto* window = graph.create_root_sprite(SoftwareImage::create_filled(80, 60, Color::rgb(200, 200, 200)), 5);
    window->set_position(20.0f, 20.0f);

    auto* button = graph.create_sprite_with_zpath(SoftwareImage::create_filled(20, 10, Color::rgb(0, 120, 255)), window);
    button->set_position(5.0f, 5.0f);
    auto* label = graph.create_sprite_with_zpath(SoftwareImage::create_filled(30, 8, Color::rgb(0, 0, 0)), window);
    label->set_position(10.0f, 8.0f);

    if (auto result = graph.bring_to_front(button->id()); !result) {
        spdlog::error("bring_to_front failed: {}", tableau_core::build_error_chain(result.error()));
    }

    auto surface = SoftwareImage::create(160, 120);
    graph.draw(*surface);

    spdlog::info("\n{}", graph.print_hierarchy());
    spdlog::info("\n{}", graph.print_draw_order());
    spdlog::info("State: {}", graph.dump_state_json().dump());

    auto pixel = surface->pixel_at(26, 26);
    spdlog::info("Pixel (26,26) = ({}, {}, {})", pixel.r, pixel.g, pixel.b);
}

/// Background, a cast and a text layer composited into one picture
void run_compositor_demo(const tableau_compositor::LayerManagerConfig& config,
                         const std::shared_ptr<SoftwareImageFactory>& factory) {
    using namespace tableau_compositor;

    spdlog::info("=== Compositor ===");
    spdlog::info("Config: {}", config.to_json().dump());

    LayerManager manager(config, factory);
    auto* pictures = manager.get_or_create_picture_layer_set(0);

    pictures->set_background(std::make_unique<BackgroundLayer>(
        manager.next_layer_id(), 0, SoftwareImage::create_filled(640, 480, config.clear_color)));

    if (auto capacity = manager.check_capacity(0, LayerKind::Cast); capacity) {
        CastRecord record;
        record.cast_id = 1;
        record.x = 10;
        record.y = 10;
        record.width = 32;
        record.height = 32;

        auto cast = CastLayer::create(manager.next_layer_id(), record);
        cast->set_source_image(SoftwareImage::create_filled(64, 64, Color::rgb(255, 0, 0)));
        int z = pictures->add_cast_layer(std::move(cast));
        spdlog::info("Cast layer z-order: {}", z);
    } else {
        spdlog::warn("{}", capacity.error().message());
    }

    TextRecord text;
    text.x = 10;
    text.y = 10;
    text.text = "Hello";
    auto text_layer = TextLayer::create(manager.next_layer_id(), text);
    text_layer->set_rasterizer([](const std::string& s) -> std::shared_ptr<tableau_render::IImage> {
        return SoftwareImage::create_filled(static_cast<int>(s.size()) * 8, 10, Color::rgb(0, 0, 255));
    });
    int text_z = pictures->add_text_layer(std::move(text_layer));
    spdlog::info("Text layer z-order: {}", text_z);

    const IntRect screen = IntRect::from_xywh(0, 0, 640, 480);
    auto buffer = pictures->composite(screen);
    if (!buffer) {
        spdlog::error("Composite failed");
        return;
    }

    auto overlap = buffer->pixel_at(15, 15);
    spdlog::info("Overlap pixel (15,15) = ({}, {}, {})", overlap.r, overlap.g, overlap.b);

    (void)pictures->composite(screen);

    pictures->remove_cast_layer(1);
    spdlog::info("After removal: dirty region {}, full dirty {}",
                 pictures->dirty_region().to_string(), pictures->is_full_dirty());

    (void)pictures->composite(screen);

    const auto& stats = pictures->stats();
    spdlog::info("Stats: drawn={}, clipped={}, occluded={}, cache_hits={}, rebuilds={}",
                 stats.layers_drawn, stats.layers_clipped, stats.layers_occluded,
                 stats.cache_hits, stats.rebuilds);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    tableau_core::LogConfig log_config;
    log_config.level = spdlog::level::debug;
    const char* level_env = std::getenv("TABLEAU_LOG_LEVEL");
    if (level_env) {
        if (auto level = tableau_core::parse_log_level(level_env)) {
            log_config.level = *level;
        } else {
            spdlog::warn("Unknown TABLEAU_LOG_LEVEL '{}', using debug", level_env);
        }
    }
    tableau_core::configure_logging(log_config);
    spdlog::info("Log level: {}", tableau_core::log_level_name(log_config.level));

    spdlog::info("=== Tableau Layer Demo ===");

    auto config = load_config(argc, argv);
    if (!config) {
        spdlog::error("{}", tableau_core::build_error_chain(config.error()));
        tableau_core::shutdown_logging();
        return EXIT_FAILURE;
    }

    auto factory = std::make_shared<SoftwareImageFactory>();
    run_scene_demo(factory);
    run_compositor_demo(config.value(), factory);

    spdlog::info("Images created: {}", factory->created_count());
    tableau_core::shutdown_logging();
    return EXIT_SUCCESS;
}
