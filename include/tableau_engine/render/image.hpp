#pragma once

/// @file image.hpp
/// @brief Image abstraction consumed by the scene graph and compositor
///
/// Pixel algorithms (blending, scaling, masking) belong to the backend that
/// implements IImage. The scene graph and layer sets only ask for dimensions,
/// sub-rectangles and "draw this image at an offset with an alpha scale".

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>

namespace tableau_render {

// =============================================================================
// IImage
// =============================================================================

/// Drawable pixel surface
class IImage {
public:
    virtual ~IImage() = default;

    /// Width in pixels
    [[nodiscard]] virtual std::int32_t width() const = 0;

    /// Height in pixels
    [[nodiscard]] virtual std::int32_t height() const = 0;

    /// Bounds at the origin
    [[nodiscard]] IntRect bounds() const {
        return IntRect{0, 0, width(), height()};
    }

    /// Copy of the given sub-rectangle (clipped to bounds), nullptr if empty
    [[nodiscard]] virtual std::shared_ptr<IImage> sub_image(const IntRect& rect) const = 0;

    /// Read one pixel (transparent outside bounds)
    [[nodiscard]] virtual Color pixel_at(std::int32_t x, std::int32_t y) const = 0;

    /// Reset every pixel to transparent
    virtual void clear() = 0;

    /// Fill every pixel with a color
    virtual void fill(const Color& color) = 0;

    /// Draw src with its origin at (dx, dy), alpha multiplied by `alpha`
    virtual void draw_image(const IImage& src, float dx, float dy, float alpha = 1.0f) = 0;
};

// =============================================================================
// IImageFactory
// =============================================================================

/// Creates images of a backend
class IImageFactory {
public:
    virtual ~IImageFactory() = default;

    /// Create a cleared image; nullptr for non-positive sizes
    [[nodiscard]] virtual std::shared_ptr<IImage> create_image(std::int32_t width, std::int32_t height) = 0;
};

} // namespace tableau_render
