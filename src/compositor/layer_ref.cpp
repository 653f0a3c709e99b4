/// @file layer_ref.cpp
/// @brief LayerRef dispatch

#include <tableau_engine/compositor/layer_ref.hpp>

namespace tableau_compositor {

LayerBase* LayerRef::base() const {
    return std::visit([](auto layer) -> LayerBase* {
        if constexpr (std::is_same_v<decltype(layer), std::monostate>) {
            return nullptr;
        } else {
            return layer;
        }
    }, m_layer);
}

LayerKind LayerRef::kind() const {
    return std::visit([](auto layer) -> LayerKind {
        if constexpr (std::is_same_v<decltype(layer), std::monostate>) {
            return LayerKind::Background;
        } else {
            return std::remove_pointer_t<decltype(layer)>::kKind;
        }
    }, m_layer);
}

LayerId LayerRef::id() const {
    auto* b = base();
    return b ? b->id() : 0;
}

tableau_render::IntRect LayerRef::bounds() const {
    auto* b = base();
    return b ? b->bounds() : tableau_render::IntRect{};
}

int LayerRef::z_order() const {
    auto* b = base();
    return b ? b->z_order() : 0;
}

bool LayerRef::is_visible() const {
    auto* b = base();
    return b && b->is_visible();
}

bool LayerRef::is_opaque() const {
    auto* b = base();
    return b && b->is_opaque();
}

bool LayerRef::is_dirty() const {
    auto* b = base();
    return b && b->is_dirty();
}

void LayerRef::set_dirty(bool dirty) const {
    if (auto* b = base()) {
        b->set_dirty(dirty);
    }
}

void LayerRef::set_visible(bool visible) const {
    if (auto* b = base()) {
        b->set_visible(visible);
    }
}

void LayerRef::set_z_order(int z_order) const {
    // Dispatch on the concrete type so the background keeps z-order 0
    std::visit([z_order](auto layer) {
        if constexpr (!std::is_same_v<decltype(layer), std::monostate>) {
            layer->set_z_order(z_order);
        }
    }, m_layer);
}

std::shared_ptr<tableau_render::IImage> LayerRef::image() const {
    return std::visit([](auto layer) -> std::shared_ptr<tableau_render::IImage> {
        if constexpr (std::is_same_v<decltype(layer), std::monostate>) {
            return nullptr;
        } else {
            return layer->image();
        }
    }, m_layer);
}

void LayerRef::invalidate() const {
    std::visit([](auto layer) {
        if constexpr (!std::is_same_v<decltype(layer), std::monostate>) {
            layer->invalidate();
        }
    }, m_layer);
}

LayerRef ref_of(const OwnedLayer& layer) {
    return std::visit([](const auto& owned) { return LayerRef(owned.get()); }, layer);
}

} // namespace tableau_compositor
