#include "apps/trim/BoundsReducer.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <iostream>

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << "[TEST] " << (ok ? "PASS  " : "FAIL  ") << what << "\n";
    if (!ok) ++g_failures;
}

static cv::Mat blank(int w, int h) {
    return cv::Mat(h, w, CV_8UC4, cv::Scalar(0, 0, 0, 0));
}

int main() {
    trim::CpuBoundsReducer reducer;
    types::Rect box;

    check(trim::alphaThresholdDN(0.3f) == 76, "threshold 0.3 -> DN 76");
    check(trim::alphaThresholdDN(-1.0f) == 0 && trim::alphaThresholdDN(2.0f) == 255, "threshold DN is clamped");

    // --- degenerate input: null, no error ---
    check(reducer.boundingBox(img::Image(), box) == trim::Status::OK && box.isNull(), "empty image -> null");
    check(reducer.boundingBox(img::Image::solid(types::Color::Black()), box) == trim::Status::OK && box.isNull(),
          "infinite image -> null");
    check(reducer.boundingBox(img::Image::fromRGBA8(blank(32, 32)), box) == trim::Status::OK && box.isNull(),
          "fully transparent -> null");

    // --- inclusive sizing ---
    {
        cv::Mat m = blank(16, 16);
        m.at<cv::Vec4b>(5, 5) = cv::Vec4b(255, 255, 255, 255);
        check(reducer.boundingBox(img::Image::fromRGBA8(m), box) == trim::Status::OK, "single pixel ok");
        check(box == types::Rect(5, 5, 1, 1), "single pixel at (5,5) -> {5,5,1,1}");
    }

    // --- threshold boundary: alpha 76 excluded, 77 included ---
    {
        cv::Mat m = blank(16, 16);
        m.at<cv::Vec4b>(3, 4) = cv::Vec4b(0, 0, 0, 76);
        reducer.boundingBox(img::Image::fromRGBA8(m), box);
        check(box.isNull(), "alpha 76 is not content");

        m.at<cv::Vec4b>(3, 4) = cv::Vec4b(0, 0, 0, 77);
        reducer.boundingBox(img::Image::fromRGBA8(m), box);
        check(box == types::Rect(4, 3, 1, 1), "alpha 77 is content");
    }

    // --- extent origin is added back ---
    {
        cv::Mat m = blank(40, 30);
        cv::rectangle(m, cv::Rect(10, 5, 8, 12), cv::Scalar(255, 0, 0, 255), cv::FILLED);
        const img::Image moved = img::Image::fromRGBA8(m).translated(100, -20);
        reducer.boundingBox(moved, box);
        check(box == types::Rect(110, -15, 8, 12), "box is in image coordinates");
    }

    // --- trim + idempotence ---
    {
        cv::Mat m = blank(64, 64);
        cv::circle(m, cv::Point(30, 40), 10, cv::Scalar(0, 0, 0, 255), cv::FILLED);
        const img::Image in = img::Image::fromRGBA8(m);

        img::Image once, twice;
        check(trim::trimImage(reducer, in, once) == trim::Status::OK, "trim ok");
        check(trim::trimImage(reducer, once, twice) == trim::Status::OK, "trim of trimmed ok");
        check(once.extent() == twice.extent(), "trim is idempotent");
        check(once.pixelWidth() == 21 && once.pixelHeight() == 21, "trimmed to the disc");

        img::Image same;
        const img::Image empty = img::Image::fromRGBA8(blank(8, 8));
        trim::trimImage(reducer, empty, same);
        check(same.extent() == empty.extent(), "null box leaves the image unchanged");
    }

    // --- config cleaning shared by every reducer ---
    {
        trim::BoundsReducerConfig cfg;
        cfg.ALPHA_THRESHOLD = -0.5f;
        check(trim::sanitise(cfg).ALPHA_THRESHOLD == 0.0f, "negative threshold -> 0");
        cfg.ALPHA_THRESHOLD = 3.0f;
        check(trim::sanitise(cfg).ALPHA_THRESHOLD == 1.0f, "threshold above 1 -> 1");
        cfg.ALPHA_THRESHOLD = std::nanf("");
        check(trim::sanitise(cfg).ALPHA_THRESHOLD == 0.0f, "NaN threshold -> 0");
        cfg.ALPHA_THRESHOLD = 0.3f;
        check(trim::sanitise(cfg).ALPHA_THRESHOLD == 0.3f, "valid threshold kept");
    }

    // --- configurable threshold ---
    {
        trim::BoundsReducerConfig cfg;
        cfg.ALPHA_THRESHOLD = 5.0f;   // clamps to 1.0 -> nothing can exceed 255
        trim::CpuBoundsReducer strict(cfg);

        cv::Mat m = blank(8, 8);
        m.setTo(cv::Scalar(0, 0, 0, 255));
        strict.boundingBox(img::Image::fromRGBA8(m), box);
        check(box.isNull(), "threshold above 1 is clamped to 1");
    }

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] All checks passed\n";
    return 0;
}
