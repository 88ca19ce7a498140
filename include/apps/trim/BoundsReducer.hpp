#pragma once
#include <cstdint>

#include "img/Image.hpp"
#include "types/Geometry.hpp"

namespace trim {

enum class Status : uint8_t {
    OK = 0,

    // GPU
    NOT_READY,        // runtime not initialized
    RENDER_FAIL,      // image -> surface
    DISPATCH_FAIL,    // kernel launch / wait / readback

    // EXTERNAL TOOL
    WRITE_FAIL,       // temp input could not be written
    CLI_SPAWN_FAIL,
    CLI_NONZERO_EXIT,
    CLI_BAD_OUTPUT,
};

const char* StatusStr(Status s);

// ---------------------------------------------------------------------------
// Config shared by the reducers (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct BoundsReducerConfig {
    // A pixel counts as content when alpha > ALPHA_THRESHOLD. Applied in 8-bit
    // DN units as floor(ALPHA_THRESHOLD * 255): 0.3 -> alpha 76 is excluded,
    // alpha 77 is included. Higher than "non-zero" so anti-aliasing fringes
    // do not count.
    float ALPHA_THRESHOLD = 0.3f;

    bool verbose = false;
};

// Clamp ALPHA_THRESHOLD to [0,1] (NaN -> 0). Applied by every reducer.
BoundsReducerConfig sanitise(const BoundsReducerConfig& in);

// Integer alpha threshold used by every reducer.
int alphaThresholdDN(float alpha_threshold);

// ---------------------------------------------------------------------------
// IBoundsReducer: smallest rectangle (image coordinates) holding every pixel
// above the alpha threshold.
//
// Infinite, empty or degenerate input yields Rect::Null() with Status::OK and
// no work is done. A fully transparent image also yields Rect::Null(). On any
// error 'out' is Rect::Null() and no partial result is reported.
// ---------------------------------------------------------------------------
class IBoundsReducer {
public:
    virtual Status boundingBox(const img::Image& image, types::Rect& out) = 0;
    virtual const char* name() const = 0;
    virtual ~IBoundsReducer() = default;
};

// Crop 'image' to its bounding box. A null box returns the input unchanged.
Status trimImage(IBoundsReducer& reducer, const img::Image& image, img::Image& out);

// Move 'image' so its extent starts at (0,0) and render it to straight RGBA8
// of the rounded-up extent size. Returns false for degenerate input.
bool renderSurface(const img::Image& image, cv::Mat& rgba8);

// True if the extent is infinite, empty or rounds to zero pixels.
bool isDegenerate(const img::Image& image);

// ---------------------------------------------------------------------------
// CpuBoundsReducer: single-threaded scan with the same threshold rule as the
// GPU kernel. Used where no OpenCL device exists and as the reference the GPU
// path is checked against. Never chosen implicitly.
// ---------------------------------------------------------------------------
class CpuBoundsReducer : public IBoundsReducer {
public:
    explicit CpuBoundsReducer(const BoundsReducerConfig& cfg = {});

    Status boundingBox(const img::Image& image, types::Rect& out) override;
    const char* name() const override { return "cpu"; }

private:
    BoundsReducerConfig m_cfg{};
    int m_threshold_dn = 76;
};

} // namespace trim
