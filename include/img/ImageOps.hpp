#pragma once
#include <cstdint>
#include <string>

#include "img/Image.hpp"
#include "types/Geometry.hpp"

namespace img {

enum class OpStatus : uint8_t {
    OK = 0,
    // GEOMETRY
    INFINITE_EXTENT,
    EMPTY_EXTENT,
    BAD_SCALE,
    // OPERATOR
    UNKNOWN_OPERATOR,
    FILTER_FAILED,
};

const char* OpStatusStr(OpStatus s);

// Blend operators for composite(). Self is the top layer.
enum class BlendOp : uint8_t {
    SOURCE_OVER = 0,
    MULTIPLY,
    SCREEN,
    OVERLAY,
    DARKEN,
};

// Mask operators for masked().
enum class MaskOp : uint8_t {
    SOURCE_IN = 0,      // keep 'in' where the mask is opaque
    SOURCE_OUT,         // keep 'in' where the mask is transparent
    BLEND_WITH_MASK,    // 'in' over clear, weighted by the mask's luminance
};

// Rec. 709 luminance of a premultiplied pixel. Transparent counts as black.
static constexpr float LUMA_R = 0.2126f;
static constexpr float LUMA_G = 0.7152f;
static constexpr float LUMA_B = 0.0722f;

const char* BlendOpStr(BlendOp op);
const char* MaskOpStr(MaskOp op);

// Parse an operator name. Accepts the canonical names ("source-in",
// "source-out", "blend-with-mask") and the aliases used by the old command
// line ("dst-in", "sourcein", "dst-out", "sourceout", "multiply", "blend").
// Unknown names return false and leave 'out' untouched.
bool parseMaskOp(const std::string& name, MaskOp& out);
bool parseBlendOp(const std::string& name, BlendOp& out);

// Directional blur followed by a downward shift; always applied together.
struct BlurDown {
    uint32_t spread_px = 0;
    int32_t  page_y    = 0;
};

// Vertical centering is scaled by this empirically tuned factor. It matches
// the current folder template artwork, not a geometric identity; recalibrate
// it when the template assets change.
static constexpr double VERTICAL_CENTERING_FACTOR = 0.87;

namespace ops {

// Solid 'color' clipped to the alpha footprint of 'in' (source-in).
OpStatus tint(const Image& in, const types::Color& color, Image& out);

// Same contract as tint(), cropped back to the extent of 'in'.
OpStatus fillColorize(const Image& in, const types::Color& color, Image& out);

// White where 'in' is transparent, transparent where it is opaque.
OpStatus invertedAlphaWhiteBackground(const Image& in, Image& out);

// Vertical motion blur of the given magnitude. Symmetric along the axis.
OpStatus motionBlurDown(const Image& in, uint32_t spread_px, Image& out);

// motionBlurDown() then translate down by page_y. If the blur stage fails the
// unblurred input is translated instead.
OpStatus blurDown(const Image& in, const BlurDown& blur, Image& out);

// Multiply alpha by clamp(alpha, 0, 1). Colour channels are untouched.
OpStatus applyingOpacity(const Image& in, float alpha, Image& out);

// 'top' composited over 'background'. Result extent = union of both.
OpStatus composite(const Image& top, const Image& background, BlendOp op, Image& out);

// 'in' applied through 'mask'. source-in / source-out use the mask's alpha,
// blend-with-mask its luminance (white keeps 'in', black clears it).
OpStatus masked(const Image& in, const Image& mask, MaskOp op, Image& out);

// Fit inside (max_w, max_h) preserving aspect ratio, then scale by 1/ratio.
OpStatus scaled(const Image& in, double max_w, double max_h, double ratio, Image& out);

// Translate 'in' so its center aligns with the center of 'background'.
OpStatus centering(const Image& in, const Image& background, Image& out);

// Gaussian blur; the extent grows by 3 sigma on each side.
OpStatus blurred(const Image& in, double radius, Image& out);

// Invert colour and alpha.
OpStatus invertedMask(const Image& in, Image& out);

} // namespace ops
} // namespace img
