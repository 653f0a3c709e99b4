// tableau_compositor PictureLayerSet and occlusion tests

#include <catch2/catch.hpp>
#include <tableau_engine/compositor/picture_layer_set.hpp>
#include <tableau_engine/compositor/occlusion.hpp>
#include <tableau_engine/render/software_image.hpp>

#include <memory>
#include <vector>

using namespace tableau_compositor;
using tableau_render::Color;
using tableau_render::IntRect;
using tableau_render::SoftwareImage;
using tableau_render::SoftwareImageFactory;

namespace {

constexpr Color kWhite = Color::rgb(255, 255, 255);
constexpr Color kRed = Color::rgb(255, 0, 0);
constexpr Color kBlue = Color::rgb(0, 0, 255);

CastRecord make_cast(int cast_id, int x, int y, int w, int h) {
    CastRecord record;
    record.cast_id = cast_id;
    record.x = x;
    record.y = y;
    record.width = w;
    record.height = h;
    return record;
}

std::unique_ptr<CastLayer> solid_cast(LayerId id, int cast_id, int x, int y, int w, int h, const Color& color) {
    auto layer = CastLayer::create(id, make_cast(cast_id, x, y, w, h));
    layer->set_cached_image(SoftwareImage::create_filled(w, h, color));
    return layer;
}

std::unique_ptr<TextLayer> solid_text(LayerId id, int x, int y, int w, int h, const Color& color) {
    TextRecord record;
    record.x = x;
    record.y = y;
    record.text = "text";
    auto layer = TextLayer::create(id, record);
    layer->set_image(SoftwareImage::create_filled(w, h, color));
    return layer;
}

} // anonymous namespace

// =============================================================================
// Z-Order Assignment
// =============================================================================

TEST_CASE("PictureLayerSet z-order assignment", "[compositor][picture]") {
    PictureLayerSet set(0);

    SECTION("background, cast and text") {
        set.set_background(std::make_unique<BackgroundLayer>(1, 0, SoftwareImage::create(640, 480)));
        int cast_z = set.add_cast_layer(solid_cast(2, 1, 10, 10, 32, 32, kRed));
        int text_z = set.add_text_layer(solid_text(3, 10, 10, 40, 10, kBlue));

        REQUIRE(set.background()->z_order() == 0);
        REQUIRE(cast_z == 1);
        REQUIRE(text_z == 2);
        REQUIRE(set.next_z_order() == 3);
    }

    SECTION("kinds share one increasing counter") {
        std::vector<int> zs;
        zs.push_back(set.add_drawing_entry(DrawingEntry::create(1, 0, SoftwareImage::create(4, 4), 0, 0)));
        zs.push_back(set.add_cast_layer(solid_cast(2, 1, 0, 0, 4, 4, kRed)));
        zs.push_back(set.add_text_layer(solid_text(3, 0, 0, 4, 4, kBlue)));
        zs.push_back(set.add_cast_layer(solid_cast(4, 2, 0, 0, 4, 4, kRed)));
        zs.push_back(set.add_drawing_entry(DrawingEntry::create(5, 0, SoftwareImage::create(4, 4), 0, 0)));

        REQUIRE(zs == std::vector<int>{1, 2, 3, 4, 5});

        auto sorted = set.get_all_layers_sorted();
        REQUIRE(sorted.size() == 5);
        for (std::size_t i = 1; i < sorted.size(); ++i) {
            REQUIRE(sorted[i - 1].z_order() < sorted[i].z_order());
        }
        REQUIRE(sorted[0].kind() == LayerKind::DrawingEntry);
        REQUIRE(sorted[2].kind() == LayerKind::Text);
    }

    SECTION("removal does not reuse z-orders") {
        set.add_cast_layer(solid_cast(1, 1, 0, 0, 4, 4, kRed));
        REQUIRE(set.remove_cast_layer(1));
        REQUIRE(set.add_cast_layer(solid_cast(2, 2, 0, 0, 4, 4, kRed)) == 2);
    }

    SECTION("drawing layer takes the next z-order") {
        SoftwareImageFactory factory;
        set.add_cast_layer(solid_cast(1, 1, 0, 0, 4, 4, kRed));
        REQUIRE(set.set_drawing(DrawingLayer::create(2, 0, 8, 8, factory)) == 2);
        REQUIRE(set.drawing() != nullptr);
    }

    SECTION("null layers are ignored") {
        REQUIRE(set.add_cast_layer(nullptr) == 0);
        REQUIRE(set.add_text_layer(nullptr) == 0);
        REQUIRE(set.add_drawing_entry(nullptr) == 0);
        REQUIRE(set.set_drawing(nullptr) == 0);
        set.set_background(nullptr);
        REQUIRE(set.background() == nullptr);
        REQUIRE(set.next_z_order() == 1);
    }

    SECTION("upper layers") {
        set.set_background(std::make_unique<BackgroundLayer>(1, 0, SoftwareImage::create(8, 8)));
        set.add_cast_layer(solid_cast(2, 1, 0, 0, 4, 4, kRed));
        set.add_text_layer(solid_text(3, 0, 0, 4, 4, kBlue));

        auto uppers = set.get_upper_layers(1);
        REQUIRE(uppers.size() == 1);
        REQUIRE(uppers[0].id() == 3);
        REQUIRE(set.get_upper_layers(0).size() == 2);
    }
}

// =============================================================================
// Lookup & Removal
// =============================================================================

TEST_CASE("PictureLayerSet lookup and removal", "[compositor][picture]") {
    PictureLayerSet set(3);
    set.add_cast_layer(solid_cast(10, 100, 0, 0, 4, 4, kRed));
    set.add_cast_layer(solid_cast(11, 101, 0, 0, 4, 4, kRed));
    set.add_text_layer(solid_text(12, 0, 0, 4, 4, kBlue));

    REQUIRE(set.cast_layer_count() == 2);
    REQUIRE(set.text_layer_count() == 1);
    REQUIRE(set.get_cast_layer(101)->id() == 11);
    REQUIRE(set.get_cast_layer_by_id(10)->cast_id() == 100);
    REQUIRE(set.get_text_layer(12) != nullptr);

    SECTION("unknown ids") {
        REQUIRE(set.get_cast_layer(999) == nullptr);
        REQUIRE(set.get_text_layer(999) == nullptr);
        REQUIRE_FALSE(set.remove_cast_layer(999));
        REQUIRE_FALSE(set.remove_text_layer(999));
        REQUIRE_FALSE(set.remove_cast_layer_by_id(999));
    }

    SECTION("remove by layer id") {
        REQUIRE(set.remove_cast_layer_by_id(10));
        REQUIRE(set.cast_layer_count() == 1);
        REQUIRE(set.remove_text_layer(12));
        REQUIRE(set.text_layer_count() == 0);
    }

    SECTION("clear per kind") {
        set.add_drawing_entry(DrawingEntry::create(13, 3, SoftwareImage::create(2, 2), 0, 0));
        set.clear_cast_layers();
        set.clear_text_layers();
        set.clear_drawing_entries();
        REQUIRE(set.cast_layer_count() == 0);
        REQUIRE(set.text_layer_count() == 0);
        REQUIRE(set.drawing_entry_count() == 0);
        REQUIRE(set.is_full_dirty());
    }
}

// =============================================================================
// Dirty Tracking
// =============================================================================

TEST_CASE("PictureLayerSet dirty tracking", "[compositor][picture]") {
    PictureLayerSet set(0);

    SECTION("new set is fully dirty") {
        REQUIRE(set.is_full_dirty());
        REQUIRE(set.is_dirty());
    }

    set.clear_all_dirty_flags();
    REQUIRE_FALSE(set.is_dirty());

    SECTION("removing a cast marks its bounds dirty") {
        set.add_cast_layer(solid_cast(1, 7, 0, 0, 50, 50, kRed));
        set.clear_all_dirty_flags();

        REQUIRE(set.remove_cast_layer(7));
        REQUIRE(set.dirty_region().contains(IntRect::from_xywh(0, 0, 50, 50)));
        REQUIRE(set.is_full_dirty());
    }

    SECTION("removal right after adding") {
        set.add_cast_layer(solid_cast(1, 7, 0, 0, 50, 50, kRed));
        REQUIRE(set.remove_cast_layer(7));
        REQUIRE(set.dirty_region() == IntRect::from_xywh(0, 0, 50, 50));
        REQUIRE(set.is_full_dirty());
    }

    SECTION("regions accumulate as a union") {
        set.add_dirty_region(IntRect::from_xywh(0, 0, 10, 10));
        set.add_dirty_region(IntRect::from_xywh(20, 30, 5, 5));
        set.add_dirty_region(IntRect{});

        REQUIRE(set.dirty_region() == IntRect::from_corners(0, 0, 25, 35));
        REQUIRE(set.is_dirty());
        REQUIRE_FALSE(set.is_full_dirty());

        set.clear_dirty_region();
        REQUIRE(set.dirty_region().is_empty());
        REQUIRE_FALSE(set.is_dirty());
    }

    SECTION("union covers overlapping, adjacent and nested regions") {
        struct Pair {
            IntRect first;
            IntRect second;
            IntRect expected;
        };
        const Pair pairs[] = {
            // Overlapping
            {IntRect::from_xywh(0, 0, 20, 20), IntRect::from_xywh(10, 5, 20, 20), IntRect::from_corners(0, 0, 30, 25)},
            // Sharing an edge
            {IntRect::from_xywh(0, 0, 10, 10), IntRect::from_xywh(10, 0, 10, 10), IntRect::from_corners(0, 0, 20, 10)},
            // Touching at a corner
            {IntRect::from_xywh(0, 0, 10, 10), IntRect::from_xywh(10, 10, 5, 5), IntRect::from_corners(0, 0, 15, 15)},
            // Nested
            {IntRect::from_xywh(0, 0, 40, 40), IntRect::from_xywh(5, 5, 10, 10), IntRect::from_xywh(0, 0, 40, 40)},
            // Negative origin
            {IntRect::from_xywh(-10, -10, 5, 5), IntRect::from_xywh(0, 0, 5, 5), IntRect::from_corners(-10, -10, 5, 5)},
        };

        for (const auto& pair : pairs) {
            set.clear_dirty_region();
            set.add_dirty_region(pair.first);
            set.add_dirty_region(pair.second);

            const IntRect region = set.dirty_region();
            REQUIRE(region == pair.expected);
            REQUIRE(region.contains(pair.first));
            REQUIRE(region.contains(pair.second));
        }
    }

    SECTION("a dirty layer makes the set dirty") {
        set.add_cast_layer(solid_cast(1, 7, 0, 0, 5, 5, kRed));
        set.clear_all_dirty_flags();
        REQUIRE_FALSE(set.is_dirty());

        set.get_cast_layer(7)->set_position(3, 3);
        REQUIRE(set.is_dirty());
        REQUIRE_FALSE(set.is_full_dirty());
    }

    SECTION("clear_dirty_region leaves layer flags") {
        set.add_cast_layer(solid_cast(1, 7, 0, 0, 5, 5, kRed));
        set.clear_dirty_region();
        REQUIRE(set.get_cast_layer(7)->is_dirty());
        REQUIRE(set.is_dirty());
    }

    SECTION("mark_full_dirty") {
        set.mark_full_dirty();
        REQUIRE(set.is_full_dirty());
    }
}

// =============================================================================
// Compositing
// =============================================================================

TEST_CASE("PictureLayerSet composite", "[compositor][picture]") {
    auto factory = std::make_shared<SoftwareImageFactory>();
    PictureLayerSet set(0, factory);
    set.set_background(std::make_unique<BackgroundLayer>(
        1, 0, SoftwareImage::create_filled(640, 480, kWhite)));
    set.add_cast_layer(solid_cast(2, 1, 10, 10, 32, 32, kRed));
    set.add_text_layer(solid_text(3, 10, 10, 40, 10, kBlue));

    const IntRect screen = IntRect::from_xywh(0, 0, 640, 480);

    SECTION("later layers paint over earlier ones") {
        auto buffer = set.composite(screen);
        REQUIRE(buffer != nullptr);
        REQUIRE(buffer->width() == 640);
        REQUIRE(buffer->height() == 480);

        REQUIRE(buffer->pixel_at(15, 15) == kBlue);
        REQUIRE(buffer->pixel_at(15, 30) == kRed);
        REQUIRE(buffer->pixel_at(45, 15) == kBlue);
        REQUIRE(buffer->pixel_at(5, 5) == kWhite);
        REQUIRE(set.stats().layers_drawn == 3);
        REQUIRE_FALSE(set.is_dirty());
    }

    SECTION("clean set returns the cached buffer") {
        auto first = set.composite(screen);
        auto second = set.composite(screen);
        REQUIRE(first == second);
        REQUIRE(set.stats().rebuilds == 1);
        REQUIRE(set.stats().cache_hits == 1);
        REQUIRE(factory->created_count() == 1);
    }

    SECTION("changes trigger a repaint into the same buffer") {
        auto first = set.composite(screen);
        set.get_cast_layer(1)->set_position(100, 100);
        auto second = set.composite(screen);

        REQUIRE(first == second);
        REQUIRE(set.stats().rebuilds == 2);
        REQUIRE(second->pixel_at(15, 30) == kWhite);
        REQUIRE(second->pixel_at(110, 110) == kRed);
    }

    SECTION("hidden layers are not painted") {
        set.get_cast_layer(1)->set_visible(false);
        auto buffer = set.composite(screen);
        REQUIRE(buffer->pixel_at(15, 30) == kWhite);
        REQUIRE(set.stats().layers_clipped == 1);
    }

    SECTION("visible rect offsets the buffer") {
        auto buffer = set.composite(IntRect::from_xywh(10, 10, 100, 100));
        REQUIRE(buffer->width() == 100);
        REQUIRE(buffer->pixel_at(0, 0) == kBlue);
        REQUIRE(buffer->pixel_at(0, 20) == kRed);
    }

    SECTION("layers outside the visible rect are clipped") {
        set.composite(IntRect::from_xywh(200, 200, 50, 50));
        REQUIRE(set.stats().layers_clipped == 2);
        REQUIRE(set.stats().layers_drawn == 1);
    }

    SECTION("empty rect returns the current buffer") {
        REQUIRE(set.composite(IntRect{}) == nullptr);
        REQUIRE(set.is_dirty());
    }

    SECTION("no factory gives no buffer") {
        PictureLayerSet bare(5);
        bare.add_cast_layer(solid_cast(1, 1, 0, 0, 4, 4, kRed));
        REQUIRE(bare.composite(screen) == nullptr);

        bare.set_image_factory(factory);
        REQUIRE(bare.composite(screen) != nullptr);
    }

    SECTION("preset buffer of the right size is reused") {
        auto preset = SoftwareImage::create(640, 480);
        set.set_composite_buffer(preset);
        REQUIRE(set.composite(screen) == preset);
        REQUIRE(factory->created_count() == 0);
        REQUIRE(set.composite_buffer() == preset);
    }

    SECTION("stats reset") {
        set.composite(screen);
        set.reset_stats();
        REQUIRE(set.stats().rebuilds == 0);
        REQUIRE(set.stats().layers_drawn == 0);
    }
}

TEST_CASE("PictureLayerSet occlusion culling", "[compositor][picture]") {
    auto factory = std::make_shared<SoftwareImageFactory>();
    PictureLayerSet set(0, factory);
    set.set_background(std::make_unique<BackgroundLayer>(
        1, 0, SoftwareImage::create_filled(100, 100, kWhite)));

    auto cover = solid_cast(2, 1, 0, 0, 100, 100, kRed);
    cover->set_opaque(true);
    set.add_cast_layer(std::move(cover));

    const IntRect screen = IntRect::from_xywh(0, 0, 100, 100);

    SECTION("covered background is skipped") {
        auto buffer = set.composite(screen);
        REQUIRE(set.stats().layers_occluded == 1);
        REQUIRE(set.stats().layers_drawn == 1);
        REQUIRE(buffer->pixel_at(50, 50) == kRed);
    }

    SECTION("culling disabled paints everything") {
        set.set_occlusion_culling(false);
        REQUIRE_FALSE(set.occlusion_culling());
        set.composite(screen);
        REQUIRE(set.stats().layers_occluded == 0);
        REQUIRE(set.stats().layers_drawn == 2);
    }

    SECTION("translucent covers do not occlude") {
        set.get_cast_layer(1)->set_opaque(false);
        set.composite(screen);
        REQUIRE(set.stats().layers_occluded == 0);
    }
}

TEST_CASE("should_skip_layer", "[compositor][occlusion]") {
    auto lower = solid_cast(1, 1, 10, 10, 20, 20, kRed);
    auto upper = solid_cast(2, 2, 0, 0, 50, 50, kBlue);
    upper->set_opaque(true);

    SECTION("opaque container hides the lower layer") {
        REQUIRE(should_skip_layer(LayerRef(lower.get()), {LayerRef(upper.get())}));
    }

    SECTION("partial overlap does not") {
        upper->set_bounds(IntRect::from_xywh(15, 15, 50, 50));
        REQUIRE_FALSE(should_skip_layer(LayerRef(lower.get()), {LayerRef(upper.get())}));
    }

    SECTION("hidden upper layers do not occlude") {
        upper->set_visible(false);
        REQUIRE_FALSE(should_skip_layer(LayerRef(lower.get()), {LayerRef(upper.get())}));
    }

    SECTION("hidden, empty or null lower layers are skipped") {
        REQUIRE(should_skip_layer(LayerRef{}, {}));
        lower->set_visible(false);
        REQUIRE(should_skip_layer(LayerRef(lower.get()), {}));
    }

    SECTION("nothing above") {
        REQUIRE_FALSE(should_skip_layer(LayerRef(lower.get()), {}));
    }

    SECTION("visibility helpers") {
        IntRect view = IntRect::from_xywh(0, 0, 15, 15);
        REQUIRE(is_layer_visible(LayerRef(lower.get()), view));
        REQUIRE(get_visible_region(LayerRef(lower.get()), view) == IntRect::from_corners(10, 10, 15, 15));
        REQUIRE_FALSE(is_layer_visible(LayerRef(lower.get()), IntRect::from_xywh(40, 40, 5, 5)));
    }
}
