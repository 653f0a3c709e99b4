#pragma once

/// @file layer_ref.hpp
/// @brief Non-owning handle giving one interface over every layer kind

#include "fwd.hpp"
#include "layer.hpp"

#include <memory>
#include <type_traits>
#include <variant>

namespace tableau_compositor {

// =============================================================================
// LayerRef
// =============================================================================

/// Tagged, non-owning reference to a layer of any kind
///
/// A default-constructed (or null) LayerRef means "not found"; every query
/// on it returns a neutral value and every mutation is a no-op.
class LayerRef {
public:
    using Variant = std::variant<
        std::monostate,
        BackgroundLayer*,
        DrawingLayer*,
        DrawingEntry*,
        CastLayer*,
        TextLayer*
    >;

    LayerRef() = default;

    /// Wrap a layer pointer; nullptr gives a null reference
    template<typename T>
        requires std::is_base_of_v<LayerBase, T>
    LayerRef(T* layer) {
        if (layer) {
            m_layer = layer;
        }
    }

    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(m_layer);
    }

    explicit operator bool() const noexcept { return !is_null(); }

    /// Kind of the referenced layer (Background for a null reference)
    [[nodiscard]] LayerKind kind() const;

    [[nodiscard]] LayerId id() const;
    [[nodiscard]] tableau_render::IntRect bounds() const;
    [[nodiscard]] int z_order() const;
    [[nodiscard]] bool is_visible() const;
    [[nodiscard]] bool is_opaque() const;
    [[nodiscard]] bool is_dirty() const;

    void set_dirty(bool dirty) const;
    void set_visible(bool visible) const;
    void set_z_order(int z_order) const;

    /// Current image; Cast and Text layers rebuild a dropped cache
    [[nodiscard]] std::shared_ptr<tableau_render::IImage> image() const;

    /// Mark dirty; Cast and Text layers also drop their cache
    void invalidate() const;

    /// Typed access, nullptr when the kind differs
    template<typename T>
    [[nodiscard]] T* as() const {
        auto* p = std::get_if<T*>(&m_layer);
        return p ? *p : nullptr;
    }

    /// Shared record, nullptr for a null reference
    [[nodiscard]] LayerBase* base() const;

    [[nodiscard]] const Variant& variant() const noexcept { return m_layer; }

    [[nodiscard]] bool operator==(const LayerRef& other) const { return m_layer == other.m_layer; }

private:
    Variant m_layer;
};

// =============================================================================
// OwnedLayer
// =============================================================================

/// Owning variant used by WindowLayerSet
using OwnedLayer = std::variant<
    std::unique_ptr<BackgroundLayer>,
    std::unique_ptr<DrawingLayer>,
    std::unique_ptr<DrawingEntry>,
    std::unique_ptr<CastLayer>,
    std::unique_ptr<TextLayer>
>;

/// Non-owning reference to an owned layer
[[nodiscard]] LayerRef ref_of(const OwnedLayer& layer);

} // namespace tableau_compositor
