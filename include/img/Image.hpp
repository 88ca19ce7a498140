#pragma once
#include <memory>
#include <opencv2/core.hpp>

#include "types/Geometry.hpp"

namespace img {

// ---------------------------------------------------------------------------
// Image: immutable raster value.
//
// An Image is an extent plus a pixel source. The pixel source is either
//   - backing pixels: premultiplied RGBA, CV_32FC4, channels in [0,1],
//     whose pixel (0,0) sits at m_origin in image space, or
//   - a constant colour generator (infinite until cropped).
// Pixels inside the extent but outside the backing store are transparent
// (virtual padding). Pixels outside the extent do not exist.
//
// Copies share the backing store read-only; nothing ever writes to it after
// construction, so every "operation" produces a new Image.
// ---------------------------------------------------------------------------
class Image {
public:
    // Empty image (null extent, no pixels).
    Image() = default;

    // Wrap an 8-bit straight-alpha RGBA (CV_8UC4) or RGB/gray matrix.
    // Extent = (0, 0, cols, rows). Returns an empty Image for an empty matrix.
    static Image fromRGBA8(const cv::Mat& rgba);

    // Wrap premultiplied CV_32FC4 pixels whose (0,0) sits at 'origin'.
    static Image fromPremultiplied(const cv::Mat& rgba32f, const cv::Point2d& origin);

    // Constant colour with infinite extent.
    static Image solid(const types::Color& c);

    const types::Rect& extent() const { return m_extent; }
    bool isInfinite() const { return m_extent.isInfinite(); }
    bool isEmpty() const { return m_extent.isEmpty(); }

    // Pixel width/height of the integral extent (0 for infinite/empty).
    int pixelWidth() const;
    int pixelHeight() const;

    // Restrict the extent. A null rect returns *this unchanged; cropping an
    // infinite generator yields a finite one.
    Image cropped(const types::Rect& r) const;

    // Move the image (extent and pixels) by (dx, dy).
    Image translated(double dx, double dy) const;

    // Same pixels with a larger (or smaller) extent; the difference is
    // transparent padding.
    Image withExtent(const types::Rect& r) const;

    // Render the region 'bounds' (integral, finite) into a premultiplied
    // CV_32FC4 matrix of bounds size. Returns false if bounds is not finite.
    bool render(const types::Rect& bounds, cv::Mat& out) const;

    // Render the whole integral extent to straight-alpha RGBA8.
    // Returns false for infinite or empty images.
    bool renderRGBA8(cv::Mat& out) const;

private:
    std::shared_ptr<const cv::Mat> m_pixels;   // premultiplied CV_32FC4
    cv::Point2d m_origin{0.0, 0.0};

    bool m_is_solid = false;
    types::Color m_color{};

    types::Rect m_extent = types::Rect::Null();
};

} // namespace img
