#pragma once
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <limits>

namespace types {

// ---------------------------------------------------------------------------
// Rect: real-valued rectangle in image space (y grows downward).
// Two distinguished values:
//   null     -> "no content found" (coordinates meaningless)
//   infinite -> unbounded extent (e.g. a colour generator before cropping)
// Any other rect has width >= 0 and height >= 0.
// ---------------------------------------------------------------------------
struct Rect {
    enum class Kind : uint8_t {
        FINITE = 0,
        NUL,
        INFINITE,
    };

    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    Kind kind = Kind::FINITE;

    constexpr Rect() = default;
    constexpr Rect(double x_, double y_, double w_, double h_)
    : x(x_), y(y_), width(w_ < 0.0 ? 0.0 : w_), height(h_ < 0.0 ? 0.0 : h_) {}

    static constexpr Rect Null() {
        Rect r;
        r.kind = Kind::NUL;
        return r;
    }

    static constexpr Rect Infinite() {
        Rect r;
        r.kind = Kind::INFINITE;
        return r;
    }

    bool isNull() const { return kind == Kind::NUL; }
    bool isInfinite() const { return kind == Kind::INFINITE; }

    // Null and zero-area rects are both "empty"; infinite is not.
    bool isEmpty() const {
        if (isNull()) return true;
        if (isInfinite()) return false;
        return width <= 0.0 || height <= 0.0;
    }

    double maxX() const { return x + width; }
    double maxY() const { return y + height; }

    Rect translated(double dx, double dy) const {
        if (kind != Kind::FINITE) return *this;
        return Rect(x + dx, y + dy, width, height);
    }

    // Smallest integer-aligned rect containing this one.
    Rect integral() const {
        if (kind != Kind::FINITE) return *this;
        const double x0 = std::floor(x + 1e-9);
        const double y0 = std::floor(y + 1e-9);
        const double x1 = std::ceil(maxX() - 1e-9);
        const double y1 = std::ceil(maxY() - 1e-9);
        return Rect(x0, y0, x1 - x0, y1 - y0);
    }

    Rect intersect(const Rect& o) const {
        if (isNull() || o.isNull()) return Null();
        if (isInfinite()) return o;
        if (o.isInfinite()) return *this;
        const double x0 = std::max(x, o.x);
        const double y0 = std::max(y, o.y);
        const double x1 = std::min(maxX(), o.maxX());
        const double y1 = std::min(maxY(), o.maxY());
        if (x1 <= x0 || y1 <= y0) return Null();
        return Rect(x0, y0, x1 - x0, y1 - y0);
    }

    Rect unite(const Rect& o) const {
        if (isInfinite() || o.isInfinite()) return Infinite();
        // zero-area rects contribute nothing
        if (isEmpty()) return o;
        if (o.isEmpty()) return *this;
        const double x0 = std::min(x, o.x);
        const double y0 = std::min(y, o.y);
        const double x1 = std::max(maxX(), o.maxX());
        const double y1 = std::max(maxY(), o.maxY());
        return Rect(x0, y0, x1 - x0, y1 - y0);
    }

    bool operator==(const Rect& o) const {
        if (kind != o.kind) return false;
        if (kind != Kind::FINITE) return true;
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// Color: straight (non-premultiplied) RGBA, each channel in [0,1].
// ---------------------------------------------------------------------------
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    static constexpr Color fromRGB8(uint8_t r8, uint8_t g8, uint8_t b8) {
        return Color{r8 / 255.0f, g8 / 255.0f, b8 / 255.0f, 1.0f};
    }

    static constexpr Color White() { return Color{1.0f, 1.0f, 1.0f, 1.0f}; }
    static constexpr Color Black() { return Color{0.0f, 0.0f, 0.0f, 1.0f}; }
    static constexpr Color Clear() { return Color{0.0f, 0.0f, 0.0f, 0.0f}; }
};

} // namespace types
