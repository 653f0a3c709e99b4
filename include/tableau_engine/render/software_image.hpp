#pragma once

/// @file software_image.hpp
/// @brief CPU RGBA8 image backend
///
/// Reference implementation of IImage used by tests, demos and headless
/// runs. Drawing uses Porter-Duff "source over" with straight alpha.

#include "image.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace tableau_render {

// =============================================================================
// SoftwareImage
// =============================================================================

/// RGBA8 image stored in a CPU buffer
class SoftwareImage : public IImage {
public:
    SoftwareImage(std::int32_t width, std::int32_t height);

    /// Create a cleared image; nullptr for non-positive sizes
    [[nodiscard]] static std::shared_ptr<SoftwareImage> create(std::int32_t width, std::int32_t height);

    /// Create an image filled with one color
    [[nodiscard]] static std::shared_ptr<SoftwareImage> create_filled(
        std::int32_t width, std::int32_t height, const Color& color);

    [[nodiscard]] std::int32_t width() const override { return m_width; }
    [[nodiscard]] std::int32_t height() const override { return m_height; }

    [[nodiscard]] std::shared_ptr<IImage> sub_image(const IntRect& rect) const override;
    [[nodiscard]] Color pixel_at(std::int32_t x, std::int32_t y) const override;

    void clear() override;
    void fill(const Color& color) override;
    void draw_image(const IImage& src, float dx, float dy, float alpha = 1.0f) override;

    /// Write one pixel (ignored outside bounds)
    void set_pixel(std::int32_t x, std::int32_t y, const Color& color);

    /// Raw RGBA8 pixels, row-major
    [[nodiscard]] const std::vector<std::uint8_t>& pixels() const { return m_pixels; }

private:
    std::int32_t m_width;
    std::int32_t m_height;
    std::vector<std::uint8_t> m_pixels;
};

// =============================================================================
// SoftwareImageFactory
// =============================================================================

/// Factory producing SoftwareImage instances
class SoftwareImageFactory : public IImageFactory {
public:
    [[nodiscard]] std::shared_ptr<IImage> create_image(std::int32_t width, std::int32_t height) override;

    /// Number of images created so far
    [[nodiscard]] std::size_t created_count() const { return m_created; }

private:
    std::size_t m_created = 0;
};

} // namespace tableau_render
