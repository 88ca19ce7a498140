#include "apps/engrave/Engraver.hpp"
#include "apps/engrave/EngravingInputs.hpp"
#include "img/ImageOps.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << "[TEST] " << (ok ? "PASS  " : "FAIL  ") << what << "\n";
    if (!ok) ++g_failures;
}

static img::Image opaque(int size, const cv::Scalar& rgba) {
    return img::Image::fromRGBA8(cv::Mat(size, size, CV_8UC4, rgba));
}

static img::Image circle_mask(int size) {
    cv::Mat m(size, size, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    cv::circle(m, cv::Point(size / 2, size / 2), size / 3, cv::Scalar(0, 0, 0, 255), cv::FILLED, cv::LINE_AA);
    return img::Image::fromRGBA8(m);
}

static img::Image rounded_template(int size) {
    cv::Mat m(size, size, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    const int inset = size / 8;
    const int r = size / 10;
    const cv::Scalar blue(90, 170, 230, 255);
    cv::rectangle(m, cv::Rect(inset + r, inset, size - 2 * (inset + r), size - 2 * inset), blue, cv::FILLED);
    cv::rectangle(m, cv::Rect(inset, inset + r, size - 2 * inset, size - 2 * (inset + r)), blue, cv::FILLED);
    for (int cx : {inset + r, size - inset - r - 1}) {
        for (int cy : {inset + r, size - inset - r - 1}) {
            cv::circle(m, cv::Point(cx, cy), r, blue, cv::FILLED, cv::LINE_AA);
        }
    }
    return img::Image::fromRGBA8(m);
}

int main() {
    const engrave::EngravingInputs inputs = engrave::EngravingInputs::Default();

    // --- opaque template hides nothing of its own extent ---
    {
        engrave::Engraver engraver;
        const img::Image mask = opaque(128, cv::Scalar(0, 0, 0, 255));
        const img::Image tmpl = opaque(256, cv::Scalar(120, 120, 120, 255));

        img::Image out;
        check(engraver.engrave(mask, tmpl, inputs, out), "engrave ok");
        check(engraver.lastStatus() == engrave::Engraver::Status::OK, "status OK");
        check(out.pixelWidth() == 256 && out.pixelHeight() == 256, "output is 256x256");
        check(out.extent() == tmpl.extent(), "output extent equals the template extent");

        cv::Mat rgba;
        out.renderRGBA8(rgba);
        std::vector<cv::Mat> ch;
        cv::split(rgba, ch);
        double lo = 0.0;
        cv::minMaxLoc(ch[3], &lo);
        check(lo == 255.0, "alpha is 255 everywhere");
    }

    // --- stage observer ---
    {
        std::vector<std::string> seen;
        engrave::EngraverConfig cfg;
        cfg.sink = [&seen](const char* stage, const img::Image&) { seen.emplace_back(stage); };
        engrave::Engraver engraver(cfg);

        img::Image out;
        engraver.engrave(circle_mask(64), rounded_template(128), inputs, out);

        bool in_order = seen.size() == engrave::Engraver::NUM_STAGES;
        for (std::size_t i = 0; in_order && i < seen.size(); ++i) {
            in_order = seen[i] == engrave::Engraver::STAGES[i];
        }
        check(in_order, "sink sees every stage in order");
    }

    // --- determinism ---
    {
        engrave::Engraver a, b;
        const img::Image mask = circle_mask(96);
        const img::Image tmpl = rounded_template(128);

        img::Image out_a, out_b;
        a.engrave(mask, tmpl, inputs, out_a);
        b.engrave(mask, tmpl, inputs, out_b);

        cv::Mat pa, pb;
        const bool rendered = out_a.renderRGBA8(pa) && out_b.renderRGBA8(pb);
        check(rendered && pa.size() == pb.size() && cv::norm(pa, pb, cv::NORM_INF) == 0.0,
              "identical inputs give identical bytes");
    }

    // --- the silhouette shows through a translucent template ---
    {
        engrave::Engraver engraver;
        const img::Image tmpl = opaque(128, cv::Scalar(90, 170, 230, 128));
        img::Image out;
        engraver.engrave(circle_mask(128), tmpl, inputs, out);

        cv::Mat before, after;
        tmpl.renderRGBA8(before);
        out.renderRGBA8(after);
        check(cv::norm(before, after, cv::NORM_INF) > 0.0, "engraving changes the template");
    }

    // --- colour changes stay inside the centered mask footprint ---
    {
        engrave::Engraver engraver;
        const img::Image tmpl = opaque(128, cv::Scalar(90, 170, 230, 128));

        img::Image centered;
        check(img::ops::centering(circle_mask(48), tmpl, centered) == img::OpStatus::OK, "mask centered");

        img::Image out;
        check(engraver.engrave(centered, tmpl, inputs, out), "engrave centered mask ok");

        // Bezel blur spreads the bottom layer vertically and both bezels are shifted down;
        // one extra pixel covers the sub-pixel vertical offset.
        const int grow = static_cast<int>(inputs.bottom.blur.spread_px) + inputs.bottom.blur.page_y +
                         inputs.top.blur.page_y + 1;
        const types::Rect& e = centered.extent();
        const int x0 = std::max(0, static_cast<int>(std::floor(e.x)) - grow);
        const int y0 = std::max(0, static_cast<int>(std::floor(e.y)) - grow);
        const int x1 = std::min(128, static_cast<int>(std::ceil(e.x + e.width)) + grow);
        const int y1 = std::min(128, static_cast<int>(std::ceil(e.y + e.height)) + grow);
        const cv::Rect footprint(x0, y0, x1 - x0, y1 - y0);
        check(footprint.width < 128 && footprint.height < 128, "footprint leaves a margin");

        cv::Mat before, after;
        const bool rendered = tmpl.renderRGBA8(before) && out.renderRGBA8(after) && before.size() == after.size();
        check(rendered, "template and output render at the same size");
        if (rendered) {
            cv::Mat diff;
            cv::absdiff(before, after, diff);
            check(cv::norm(diff(footprint), cv::NORM_INF) > 0.0, "some pixel inside the footprint changes");

            diff(footprint).setTo(cv::Scalar::all(0));
            check(cv::norm(diff, cv::NORM_INF) == 0.0, "every pixel outside the footprint equals the template");
        }
    }

    // --- degenerate inputs ---
    {
        engrave::Engraver engraver;
        img::Image out;
        check(!engraver.engrave(img::Image(), rounded_template(32), inputs, out) &&
              engraver.lastStatus() == engrave::Engraver::Status::EMPTY_MASK, "empty mask rejected");
        check(!engraver.engrave(circle_mask(32), img::Image(), inputs, out) &&
              engraver.lastStatus() == engrave::Engraver::Status::EMPTY_TEMPLATE, "empty template rejected");
        check(!engraver.engrave(img::Image::solid(types::Color::Black()), rounded_template(32), inputs, out) &&
              engraver.lastStatus() == engrave::Engraver::Status::EMPTY_MASK, "infinite mask rejected");
    }

    // --- debug dumps ---
    {
        std::error_code ec;
        const fs::path base = fs::temp_directory_path(ec) / "iconic_engrave_test";
        fs::create_directories(base, ec);

        engrave::DebugDumpSink dump(base.string());
        check(dump.runId() >= 1000 && dump.runId() <= 10000, "run id in [1000, 10000]");

        engrave::EngraverConfig cfg;
        cfg.sink = dump;
        engrave::Engraver engraver(cfg);

        img::Image out;
        engraver.engrave(circle_mask(32), rounded_template(64), inputs, out);

        const std::string id = std::to_string(dump.runId());
        bool all = true;
        for (const char* stage : engrave::Engraver::STAGES) {
            const fs::path p = fs::path(dump.dir()) / ("step_" + std::string(stage) + "_" + id + ".png");
            if (!fs::exists(p, ec)) {
                std::cerr << "[TEST] missing " << p.string() << "\n";
                all = false;
            }
        }
        check(all, "one dump per stage");

        fs::remove_all(base, ec);
    }

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] All checks passed\n";
    return 0;
}
