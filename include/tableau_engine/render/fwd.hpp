#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tableau_render

namespace tableau_render {

struct IntRect;
struct Color;
struct Vec2;

class IImage;
class IImageFactory;
class SoftwareImage;
class SoftwareImageFactory;

} // namespace tableau_render
