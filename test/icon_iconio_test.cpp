#include "icon/IconIO.hpp"

#include <opencv2/core.hpp>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << "[TEST] " << (ok ? "PASS  " : "FAIL  ") << what << "\n";
    if (!ok) ++g_failures;
}

static img::Image square(int size) {
    return img::Image::fromRGBA8(cv::Mat(size, size, CV_8UC4, cv::Scalar(20, 40, 60, 255)));
}

static std::vector<uint8_t> slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

static uint32_t be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

int main() {
    std::error_code ec;
    const fs::path dir = fs::temp_directory_path(ec) / "iconic_iconio_test";
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    // --- slot table ---
    check(std::strcmp(icon::icnsTypeForSize(16), "icp4") == 0, "16 -> icp4");
    check(std::strcmp(icon::icnsTypeForSize(256), "ic08") == 0, "256 -> ic08");
    check(std::strcmp(icon::icnsTypeForSize(1024), "ic10") == 0, "1024 -> ic10");
    check(icon::icnsTypeForSize(100) == nullptr, "100 has no slot");

    // --- icns write + read back ---
    {
        const fs::path p = dir / "out.icns";
        check(icon::writeIcns({square(16), square(32), square(100), square(32)}, p.string()) == icon::IoStatus::OK,
              "writeIcns ok");

        const std::vector<uint8_t> bytes = slurp(p);
        check(bytes.size() > 8 && std::memcmp(bytes.data(), "icns", 4) == 0, "icns magic");
        check(bytes.size() > 8 && be32(bytes.data() + 4) == bytes.size(), "declared size equals file size");
        check(bytes.size() > 12 && std::memcmp(bytes.data() + 8, "icp4", 4) == 0, "first entry is icp4");
        if (bytes.size() > 16) {
            const uint32_t first = be32(bytes.data() + 12);
            check(8 + first + 4 <= bytes.size() && std::memcmp(bytes.data() + 8 + first, "icp5", 4) == 0,
                  "second entry is icp5");
        }

        std::vector<img::Image> reps;
        check(icon::loadRepresentations(p.string(), reps) == icon::IoStatus::OK, "icns reload ok");
        check(reps.size() == 2, "unsupported and duplicate sizes were skipped");
        check(reps.size() == 2 && reps[0].pixelWidth() == 16 && reps[1].pixelWidth() == 32, "smallest first");

        img::Image big;
        check(icon::largestRepresentation(reps, big) && big.pixelWidth() == 32, "largest representation");
        check(!icon::largestRepresentation({}, big), "no representations -> false");

        check(icon::writeIcns({square(100)}, (dir / "none.icns").string()) == icon::IoStatus::EMPTY_INPUT,
              "nothing fits -> EMPTY_INPUT");
        check(icon::writeIcns({}, (dir / "none.icns").string()) == icon::IoStatus::EMPTY_INPUT,
              "no images -> EMPTY_INPUT");
    }

    // --- legacy entries are skipped ---
    {
        std::vector<uint8_t> bytes = {'i', 'c', 'n', 's', 0, 0, 0, 20,
                                      'i', 's', '3', '2', 0, 0, 0, 12, 1, 2, 3, 4};
        std::vector<img::Image> reps;
        check(icon::parseIcns(bytes, reps) == icon::IoStatus::OK && reps.empty(), "legacy entry skipped");

        bytes[15] = 200;   // entry runs past the end
        check(icon::parseIcns(bytes, reps) == icon::IoStatus::UNREADABLE_FORMAT, "corrupt entry rejected");
        check(icon::parseIcns({'n', 'o', 'p', 'e'}, reps) == icon::IoStatus::UNREADABLE_FORMAT, "bad header");
    }

    // --- iconset ---
    {
        const fs::path set = dir / "out.iconset";
        check(icon::writeIconset({square(16), square(32)}, set.string()) == icon::IoStatus::OK, "writeIconset ok");
        check(fs::exists(set / "16x16.png", ec) && fs::exists(set / "32x32.png", ec), "one png per size");

        std::vector<img::Image> reps;
        check(icon::loadRepresentations(set.string(), reps) == icon::IoStatus::OK && reps.size() == 2,
              "iconset reload");
    }

    // --- single images ---
    {
        cv::Mat m(1, 1, CV_8UC4, cv::Scalar(200, 100, 50, 255));
        const fs::path p = dir / "pixel.png";
        check(icon::writePng(img::Image::fromRGBA8(m), p.string()) == icon::IoStatus::OK, "writePng ok");

        img::Image back;
        check(icon::loadImage(p.string(), back) == icon::IoStatus::OK, "loadImage ok");
        cv::Mat rgba;
        check(back.renderRGBA8(rgba) && rgba.at<cv::Vec4b>(0, 0) == cv::Vec4b(200, 100, 50, 255),
              "png keeps RGBA order");

        check(icon::loadImage((dir / "missing.png").string(), back) == icon::IoStatus::NOT_FOUND, "missing file");
        std::vector<img::Image> reps;
        check(icon::loadRepresentations((dir / "missing.icns").string(), reps) == icon::IoStatus::NOT_FOUND,
              "missing container");

        {
            std::ofstream f(dir / "garbage.png");
            f << "this is not an image";
        }
        check(icon::loadImage((dir / "garbage.png").string(), back) == icon::IoStatus::UNREADABLE_FORMAT,
              "garbage -> UNREADABLE_FORMAT");

        std::vector<uint8_t> png;
        check(icon::encodePng(img::Image(), png) == icon::IoStatus::EMPTY_INPUT, "empty image not encoded");
    }

    fs::remove_all(dir, ec);

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] All checks passed\n";
    return 0;
}
