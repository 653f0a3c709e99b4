// tableau_scene SceneGraph tests

#include <catch2/catch.hpp>
#include <tableau_engine/scene/scene_graph.hpp>
#include <tableau_engine/render/software_image.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <vector>

using namespace tableau_scene;
using tableau_render::Color;
using tableau_render::SoftwareImage;
using tableau_render::SoftwareImageFactory;

namespace {

std::shared_ptr<SoftwareImage> small_image() {
    return SoftwareImage::create_filled(2, 2, Color::rgb(255, 0, 0));
}

/// Record the order in which nodes are painted
void record_draws(SceneNode* node, std::vector<SpriteId>& out) {
    SpriteId id = node->id();
    node->set_draw_callback([&out, id](tableau_render::IImage&, float, float, float) {
        out.push_back(id);
    });
}

} // anonymous namespace

// =============================================================================
// Creation
// =============================================================================

TEST_CASE("SceneGraph creation", "[scene][graph]") {
    SceneGraph graph;

    SECTION("ids start at 1 and increase") {
        auto* a = graph.create_sprite(small_image());
        auto* b = graph.create_sprite(nullptr);
        REQUIRE(a->id() == 1);
        REQUIRE(b->id() == 2);
        REQUIRE(graph.count() == 2);
        REQUIRE(graph.next_id() == 3);
        REQUIRE(graph.get_sprite(1) == a);
        REQUIRE(graph.get_sprite(99) == nullptr);
    }

    SECTION("hidden sprite") {
        auto* node = graph.create_sprite_hidden(small_image());
        REQUIRE_FALSE(node->visible());
    }

    SECTION("sized sprite needs a factory") {
        REQUIRE(graph.create_sprite_with_size(10, 10) == nullptr);
    }

    SECTION("parent from another graph is rejected") {
        SceneGraph other;
        auto* foreign = other.create_root_sprite(small_image(), 0);
        // Id 1 does not exist in `graph` yet
        REQUIRE(graph.create_sprite_with_zpath(small_image(), foreign) == nullptr);
        REQUIRE(graph.count() == 0);
    }
}

TEST_CASE("SceneGraph sized sprites", "[scene][graph]") {
    auto factory = std::make_shared<SoftwareImageFactory>();
    SceneGraph graph(factory);

    auto* node = graph.create_sprite_with_size(16, 8);
    REQUIRE(node != nullptr);
    REQUIRE(node->size() == std::pair<std::int32_t, std::int32_t>{16, 8});
    REQUIRE(factory->created_count() == 1);

    REQUIRE(graph.create_sprite_with_size(0, 8) == nullptr);
    REQUIRE(graph.create_sprite_with_size(8, -2) == nullptr);
    REQUIRE(factory->created_count() == 1);
}

TEST_CASE("SceneGraph Z-path assignment", "[scene][graph]") {
    SceneGraph graph;
    auto* root = graph.create_root_sprite(small_image(), 5);
    auto* first = graph.create_sprite_with_zpath(small_image(), root);
    auto* second = graph.create_sprite_with_zpath(small_image(), root);

    REQUIRE(*root->zpath() == ZPath{5});
    REQUIRE(*first->zpath() == ZPath{5, 0});
    REQUIRE(*second->zpath() == ZPath{5, 1});
    REQUIRE(first->parent() == root);
    REQUIRE(root->children().size() == 2);

    SECTION("bring_to_front keeps the prefix") {
        auto result = graph.bring_to_front(first->id());
        REQUIRE(result.is_ok());
        REQUIRE(first->zpath()->local_z_order() > 1);
        REQUIRE(ZPath{5}.is_prefix_of(*first->zpath()));
        REQUIRE(first->zpath()->depth() == 2);

        auto order = graph.sorted_ids();
        REQUIRE(order == std::vector<SpriteId>{root->id(), second->id(), first->id()});
    }

    SECTION("grandchildren extend the parent path") {
        auto* grandchild = graph.create_sprite_with_zpath(small_image(), first);
        REQUIRE(*grandchild->zpath() == ZPath{5, 0, 0});
    }

    SECTION("root scope allocates from zero") {
        auto* top = graph.create_sprite_with_zpath(small_image(), nullptr);
        REQUIRE(*top->zpath() == ZPath{0});
    }
}

// =============================================================================
// Ordering
// =============================================================================

TEST_CASE("SceneGraph paint order", "[scene][graph]") {
    SceneGraph graph;

    SECTION("nodes without a Z-path paint first in id order") {
        auto* a = graph.create_root_sprite(small_image(), 0);
        auto* b = graph.create_sprite(small_image());
        auto* c = graph.create_sprite(small_image());
        REQUIRE(graph.sorted_ids() == std::vector<SpriteId>{b->id(), c->id(), a->id()});
    }

    SECTION("windows then their subtrees in pre-order") {
        auto* w2 = graph.create_root_sprite(small_image(), 2);
        auto* w1 = graph.create_root_sprite(small_image(), 1);
        auto* w1_child = graph.create_sprite_with_zpath(small_image(), w1);
        auto* w2_child = graph.create_sprite_with_zpath(small_image(), w2);
        auto* w1_grand = graph.create_sprite_with_zpath(small_image(), w1_child);

        REQUIRE(graph.sorted_ids() == std::vector<SpriteId>{
            w1->id(), w1_child->id(), w1_grand->id(), w2->id(), w2_child->id()});
    }

    SECTION("sort cache is invalidated by changes") {
        auto* a = graph.create_root_sprite(small_image(), 1);
        auto* b = graph.create_root_sprite(small_image(), 2);
        REQUIRE(graph.needs_sort());
        (void)graph.sorted_ids();
        REQUIRE_FALSE(graph.needs_sort());

        REQUIRE(graph.set_zpath(a->id(), ZPath{3}).is_ok());
        REQUIRE(graph.needs_sort());
        REQUIRE(graph.sorted_ids() == std::vector<SpriteId>{b->id(), a->id()});

        graph.mark_need_sort();
        REQUIRE(graph.needs_sort());
    }
}

TEST_CASE("SceneGraph bring_to_front and send_to_back", "[scene][graph]") {
    SceneGraph graph;
    auto* root = graph.create_root_sprite(small_image(), 0);
    auto* a = graph.create_sprite_with_zpath(small_image(), root);
    auto* b = graph.create_sprite_with_zpath(small_image(), root);
    auto* c = graph.create_sprite_with_zpath(small_image(), root);
    auto* a_child = graph.create_sprite_with_zpath(small_image(), a);

    SECTION("bring_to_front moves the subtree above siblings") {
        REQUIRE(graph.bring_to_front(a->id()).is_ok());
        REQUIRE(a->zpath()->local_z_order() > c->zpath()->local_z_order());
        REQUIRE(a->zpath()->is_prefix_of(*a_child->zpath()));

        auto order = graph.sorted_ids();
        REQUIRE(order == std::vector<SpriteId>{root->id(), b->id(), c->id(), a->id(), a_child->id()});
    }

    SECTION("send_to_back goes below the lowest sibling") {
        REQUIRE(graph.send_to_back(c->id()).is_ok());
        REQUIRE(c->zpath()->local_z_order() == -1);

        auto order = graph.sorted_ids();
        REQUIRE(order == std::vector<SpriteId>{root->id(), c->id(), a->id(), a_child->id(), b->id()});
    }

    SECTION("only child sent to back gets -1") {
        REQUIRE(graph.send_to_back(a_child->id()).is_ok());
        REQUIRE(*a_child->zpath() == ZPath{0, 0, -1});
    }

    SECTION("bring_to_front respects externally assigned siblings") {
        REQUIRE(graph.set_zpath(b->id(), ZPath{0, 50}).is_ok());
        REQUIRE(graph.bring_to_front(a->id()).is_ok());
        REQUIRE(a->zpath()->local_z_order() == 51);
    }

    SECTION("deep descendants keep their own local z-orders") {
        auto* acc0 = graph.create_sprite_with_zpath(small_image(), a_child);
        auto* acc1 = graph.create_sprite_with_zpath(small_image(), a_child);
        auto* accc = graph.create_sprite_with_zpath(small_image(), acc0);
        REQUIRE(*acc0->zpath() == ZPath{0, 0, 0, 0});
        REQUIRE(*acc1->zpath() == ZPath{0, 0, 0, 1});
        REQUIRE(*accc->zpath() == ZPath{0, 0, 0, 0, 0});

        REQUIRE(graph.bring_to_front(a->id()).is_ok());
        REQUIRE(*a->zpath() == ZPath{0, 3});
        REQUIRE(*a_child->zpath() == ZPath{0, 3, 0});
        REQUIRE(*acc0->zpath() == ZPath{0, 3, 0, 0});
        REQUIRE(*acc1->zpath() == ZPath{0, 3, 0, 1});
        REQUIRE(*accc->zpath() == ZPath{0, 3, 0, 0, 0});
        REQUIRE(*b->zpath() == ZPath{0, 1});

        REQUIRE(graph.send_to_back(a->id()).is_ok());
        REQUIRE(*a->zpath() == ZPath{0, -1});
        REQUIRE(*acc1->zpath() == ZPath{0, -1, 0, 1});
        REQUIRE(*accc->zpath() == ZPath{0, -1, 0, 0, 0});

        // Reordering at depth 3 rewrites only that subtree
        REQUIRE(graph.bring_to_front(acc0->id()).is_ok());
        REQUIRE(*acc0->zpath() == ZPath{0, -1, 0, 2});
        REQUIRE(*accc->zpath() == ZPath{0, -1, 0, 2, 0});
        REQUIRE(*acc1->zpath() == ZPath{0, -1, 0, 1});
        REQUIRE(accc->zpath()->depth() == 5);

        auto order = graph.sorted_ids();
        REQUIRE(order == std::vector<SpriteId>{root->id(), a->id(), a_child->id(), acc1->id(),
                                               acc0->id(), accc->id(), b->id(), c->id()});
    }

    SECTION("errors") {
        auto missing = graph.bring_to_front(999);
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code() == tableau_core::ErrorCode::NotFound);

        auto* plain = graph.create_sprite(small_image());
        auto no_path = graph.send_to_back(plain->id());
        REQUIRE(no_path.is_err());
        REQUIRE(no_path.error().code() == tableau_core::ErrorCode::InvalidState);
    }
}

TEST_CASE("SceneGraph reparent", "[scene][graph]") {
    SceneGraph graph;
    auto* w1 = graph.create_root_sprite(small_image(), 1);
    auto* w2 = graph.create_root_sprite(small_image(), 2);
    auto* child = graph.create_sprite_with_zpath(small_image(), w1);
    auto* grand = graph.create_sprite_with_zpath(small_image(), child);

    SECTION("moves the subtree under the new parent") {
        REQUIRE(graph.reparent(child->id(), w2->id()).is_ok());
        REQUIRE(child->parent() == w2);
        REQUIRE_FALSE(w1->has_children());
        REQUIRE(ZPath{2}.is_prefix_of(*child->zpath()));
        REQUIRE(child->zpath()->is_prefix_of(*grand->zpath()));
        REQUIRE(grand->zpath()->depth() == 3);
    }

    SECTION("reparent to root") {
        REQUIRE(graph.reparent(child->id(), 0).is_ok());
        REQUIRE(child->parent() == nullptr);
        REQUIRE(child->zpath()->depth() == 1);
        REQUIRE(grand->zpath()->depth() == 2);
    }

    SECTION("cycles are rejected") {
        auto result = graph.reparent(child->id(), grand->id());
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<tableau_core::SceneError>()->kind ==
                tableau_core::SceneError::Kind::CycleDetected);
        REQUIRE(child->parent() == w1);

        REQUIRE(graph.reparent(child->id(), child->id()).is_err());
    }

    SECTION("unknown ids") {
        REQUIRE(graph.reparent(999, w1->id()).is_err());
        REQUIRE(graph.reparent(child->id(), 999).is_err());
    }
}

// =============================================================================
// Removal
// =============================================================================

TEST_CASE("SceneGraph removal", "[scene][graph]") {
    SceneGraph graph;
    auto* root = graph.create_root_sprite(small_image(), 0);
    auto* keep = graph.create_sprite_with_zpath(small_image(), root);
    auto* doomed = graph.create_sprite_with_zpath(small_image(), root);
    auto* doomed_child = graph.create_sprite_with_zpath(small_image(), doomed);
    SpriteId doomed_id = doomed->id();
    SpriteId doomed_child_id = doomed_child->id();

    SECTION("remove_sprite removes the subtree") {
        REQUIRE(graph.remove_sprite(doomed_id));
        REQUIRE(graph.count() == 2);
        REQUIRE(graph.get_sprite(doomed_id) == nullptr);
        REQUIRE(graph.get_sprite(doomed_child_id) == nullptr);
        REQUIRE(root->children().size() == 1);
        REQUIRE(root->children()[0] == keep);
        REQUIRE(graph.sorted_ids() == std::vector<SpriteId>{root->id(), keep->id()});
    }

    SECTION("unknown id") {
        REQUIRE_FALSE(graph.remove_sprite(999));
        REQUIRE(graph.count() == 4);
    }

    SECTION("clear keeps counters running") {
        SpriteId next = graph.next_id();
        int next_root_local = graph.zorder_counter().current(kRootScope);

        graph.clear();
        REQUIRE(graph.count() == 0);
        REQUIRE(graph.next_id() == next);
        REQUIRE(graph.zorder_counter().current(kRootScope) == next_root_local);

        auto* fresh = graph.create_sprite(small_image());
        REQUIRE(fresh->id() == next);
    }
}

// =============================================================================
// Drawing
// =============================================================================

TEST_CASE("SceneGraph draw", "[scene][graph]") {
    SceneGraph graph;

    SECTION("nodes are painted in Z-path order") {
        std::vector<SpriteId> painted;
        auto* w2 = graph.create_root_sprite(small_image(), 2);
        auto* w1 = graph.create_root_sprite(small_image(), 1);
        auto* c1 = graph.create_sprite_with_zpath(small_image(), w1);
        for (auto* node : {w2, w1, c1}) {
            record_draws(node, painted);
        }

        auto surface = SoftwareImage::create(8, 8);
        graph.draw(*surface);
        REQUIRE(painted == std::vector<SpriteId>{w1->id(), c1->id(), w2->id()});
    }

    SECTION("hidden ancestors suppress the subtree") {
        std::vector<SpriteId> painted;
        auto* n1 = graph.create_root_sprite(small_image(), 0);
        auto* n2 = graph.create_sprite_with_zpath(small_image(), n1);
        auto* n3 = graph.create_sprite_with_zpath(small_image(), n2);
        auto* n4 = graph.create_sprite_with_zpath(small_image(), n3);
        for (auto* node : {n1, n2, n3, n4}) {
            record_draws(node, painted);
        }
        n2->set_visible(false);

        auto surface = SoftwareImage::create(8, 8);
        graph.draw(*surface);
        REQUIRE(painted == std::vector<SpriteId>{n1->id()});
    }

    SECTION("images are blitted at absolute positions") {
        auto* parent = graph.create_root_sprite(nullptr, 0);
        parent->set_position(2.0f, 3.0f);
        auto* child = graph.create_sprite_with_zpath(small_image(), parent);
        child->set_position(1.0f, 1.0f);

        auto surface = SoftwareImage::create(8, 8);
        graph.draw(*surface);
        REQUIRE(surface->pixel_at(3, 4) == Color::rgb(255, 0, 0));
        REQUIRE(surface->pixel_at(4, 5) == Color::rgb(255, 0, 0));
        REQUIRE(surface->pixel_at(2, 3) == Color::transparent());
    }

    SECTION("debug callback runs after each painted node") {
        graph.create_root_sprite(small_image(), 0);
        auto* hidden = graph.create_root_sprite(small_image(), 1);
        hidden->set_visible(false);

        std::vector<SpriteId> overlays;
        graph.set_debug_draw_callback([&overlays](tableau_render::IImage&, const NodeDrawInfo& info) {
            overlays.push_back(info.id);
        });

        auto surface = SoftwareImage::create(4, 4);
        graph.draw(*surface);
        REQUIRE(overlays == std::vector<SpriteId>{1});
    }
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_CASE("SceneGraph diagnostics", "[scene][graph]") {
    SceneGraph graph;
    auto* root = graph.create_root_sprite(small_image(), 5);
    auto* child = graph.create_sprite_with_zpath(small_image(), root);
    child->set_visible(false);

    SECTION("hierarchy text") {
        std::string text = graph.print_hierarchy();
        REQUIRE(text.find("- Sprite 1:") != std::string::npos);
        REQUIRE(text.find("  - Sprite 2:") != std::string::npos);
        REQUIRE(text.find("zpath=[5, 0]") != std::string::npos);
        REQUIRE(text.find("(hidden)") != std::string::npos);
    }

    SECTION("draw order text") {
        std::string text = graph.print_draw_order();
        REQUIRE(text.find("Draw Order:") == 0);
        REQUIRE(text.find("1. Sprite 1") != std::string::npos);
        REQUIRE(text.find("2. Sprite 2") != std::string::npos);
    }

    SECTION("state text") {
        std::string text = graph.dump_state_text();
        REQUIRE(text.find("SceneGraph: 2 sprites (1 visible), next id 3") == 0);
    }

    SECTION("state json") {
        nlohmann::json j = graph.dump_state_json();
        REQUIRE(j["total_sprites"] == 2);
        REQUIRE(j["sprites"].size() == 1);

        const auto& r = j["sprites"][0];
        REQUIRE(r["id"] == 1);
        REQUIRE(r["z_path"] == nlohmann::json::array({5}));
        REQUIRE(r["parent_id"].is_null());
        REQUIRE(r["children"].size() == 1);
        REQUIRE(r["children"][0]["effectively_visible"] == false);
        REQUIRE(r["children"][0]["parent_id"] == 1);
        REQUIRE(r["children"][0]["size"]["width"] == 2);
    }
}
