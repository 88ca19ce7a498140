#pragma once
#include "img/ImageOps.hpp"
#include "types/Geometry.hpp"

namespace engrave {

// One bevel edge of the engraving: a tinted, shifted, masked layer.
struct Bezel {
    types::Color color{};
    img::BlurDown blur{};
    img::MaskOp mask_op = img::MaskOp::SOURCE_IN;
    float opacity = 1.0f;   // clamped to [0,1] when applied
};

// Built once per run, read-only afterwards.
struct EngravingInputs {
    types::Color fill{};
    Bezel top{};
    Bezel bottom{};

    // Values the folder artwork is tuned for.
    static EngravingInputs Default() {
        EngravingInputs in;
        in.fill = types::Color::fromRGB8(8, 134, 206);

        in.top.color   = types::Color::fromRGB8(58, 152, 208);
        in.top.blur    = img::BlurDown{0, 2};
        in.top.mask_op = img::MaskOp::SOURCE_IN;
        in.top.opacity = 0.5f;

        in.bottom.color   = types::Color::fromRGB8(174, 225, 253);
        in.bottom.blur    = img::BlurDown{2, 2};
        in.bottom.mask_op = img::MaskOp::SOURCE_OUT;
        in.bottom.opacity = 0.75f;
        return in;
    }
};

} // namespace engrave
