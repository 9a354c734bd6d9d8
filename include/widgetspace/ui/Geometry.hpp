#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace WS::UI {

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr auto operator+(Vec2 const& rhs) const -> Vec2 { return Vec2{x + rhs.x, y + rhs.y}; }
    constexpr auto operator-(Vec2 const& rhs) const -> Vec2 { return Vec2{x - rhs.x, y - rhs.y}; }
    constexpr auto operator*(float s) const -> Vec2 { return Vec2{x * s, y * s}; }
    constexpr auto operator+=(Vec2 const& rhs) -> Vec2& {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }
    constexpr auto operator==(Vec2 const&) const -> bool = default;
};

inline constexpr float kUnbounded = std::numeric_limits<float>::infinity();
inline constexpr float kUnset     = std::numeric_limits<float>::quiet_NaN();

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    [[nodiscard]] static constexpr auto from(Vec2 position, Vec2 size) -> Rect {
        return Rect{position.x, position.y, size.x, size.y};
    }

    [[nodiscard]] constexpr auto position() const -> Vec2 { return Vec2{x, y}; }
    [[nodiscard]] constexpr auto size() const -> Vec2 { return Vec2{w, h}; }
    [[nodiscard]] constexpr auto right() const -> float { return x + w; }
    [[nodiscard]] constexpr auto bottom() const -> float { return y + h; }

    // Grows the rect by dw/dh on every side.
    [[nodiscard]] constexpr auto inflate(float dw, float dh) const -> Rect {
        return Rect{x - dw, y - dh, w + dw * 2.0f, h + dh * 2.0f};
    }

    [[nodiscard]] constexpr auto contains(Vec2 pt) const -> bool {
        return pt.x >= x && pt.x <= x + w && pt.y >= y && pt.y <= y + h;
    }

    // Smallest rect covering both; an empty rect is treated as a point at its origin.
    [[nodiscard]] constexpr auto extend_to(Vec2 pt) const -> Rect {
        auto const min_x = std::min(x, pt.x);
        auto const min_y = std::min(y, pt.y);
        auto const max_x = std::max(right(), pt.x);
        auto const max_y = std::max(bottom(), pt.y);
        return Rect{min_x, min_y, max_x - min_x, max_y - min_y};
    }

    constexpr auto operator==(Rect const&) const -> bool = default;
};

struct Thickness {
    float left   = 0.0f;
    float top    = 0.0f;
    float right  = 0.0f;
    float bottom = 0.0f;

    [[nodiscard]] static constexpr auto zero() -> Thickness { return Thickness{}; }
    [[nodiscard]] static constexpr auto uniform(float v) -> Thickness { return Thickness{v, v, v, v}; }
    [[nodiscard]] static constexpr auto left_only(float v) -> Thickness { return Thickness{v, 0.0f, 0.0f, 0.0f}; }
    [[nodiscard]] static constexpr auto top_only(float v) -> Thickness { return Thickness{0.0f, v, 0.0f, 0.0f}; }
    [[nodiscard]] static constexpr auto right_only(float v) -> Thickness { return Thickness{0.0f, 0.0f, v, 0.0f}; }
    [[nodiscard]] static constexpr auto bottom_only(float v) -> Thickness { return Thickness{0.0f, 0.0f, 0.0f, v}; }

    [[nodiscard]] constexpr auto horizontal() const -> float { return left + right; }
    [[nodiscard]] constexpr auto vertical() const -> float { return top + bottom; }
    [[nodiscard]] constexpr auto total() const -> Vec2 { return Vec2{horizontal(), vertical()}; }

    constexpr auto operator==(Thickness const&) const -> bool = default;
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    [[nodiscard]] static constexpr auto opaque(std::uint8_t r, std::uint8_t g, std::uint8_t b) -> Color {
        return Color{r, g, b, 255};
    }

    constexpr auto operator==(Color const&) const -> bool = default;
};

namespace Colors {
inline constexpr Color White       = Color{255, 255, 255, 255};
inline constexpr Color Black       = Color{0, 0, 0, 255};
inline constexpr Color Transparent = Color{0, 0, 0, 0};
} // namespace Colors

[[nodiscard]] inline auto non_negative(float v) -> float {
    return std::isnan(v) ? 0.0f : std::max(0.0f, v);
}

// min wins when the bounds are inverted.
[[nodiscard]] inline auto clamp_to_bounds(float v, float min_v, float max_v) -> float {
    return std::max(min_v, std::min(v, max_v));
}

} // namespace WS::UI
