#include "icon/IconIO.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace {

static const uint8_t PNG_SIG[8]  = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
static const uint8_t JP2_SIG[12] = {0x00, 0x00, 0x00, 0x0C, 'j', 'P', ' ', ' ', 0x0D, 0x0A, 0x87, 0x0A};

static inline uint32_t read_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

static inline void append_be32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(uint8_t((v >> 24) & 0xFF));
    out.push_back(uint8_t((v >> 16) & 0xFF));
    out.push_back(uint8_t((v >> 8) & 0xFF));
    out.push_back(uint8_t(v & 0xFF));
}

static inline bool starts_with(const uint8_t* p, size_t n, const uint8_t* sig, size_t sig_n) {
    return n >= sig_n && std::memcmp(p, sig, sig_n) == 0;
}

static std::string lower_ext(const fs::path& p) {
    std::string e = p.extension().string();
    std::transform(e.begin(), e.end(), e.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return e;
}

static bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

// imread/imdecode output (BGR order, any depth) -> straight RGBA8 Image
static bool to_image(const cv::Mat& decoded, img::Image& out) {
    if (decoded.empty()) return false;

    cv::Mat m8;
    if (decoded.depth() == CV_16U) {
        decoded.convertTo(m8, CV_8U, 1.0 / 257.0);
    } else if (decoded.depth() == CV_8U) {
        m8 = decoded;
    } else {
        decoded.convertTo(m8, CV_8U);
    }

    cv::Mat rgba;
    switch (m8.channels()) {
        case 4: cv::cvtColor(m8, rgba, cv::COLOR_BGRA2RGBA); break;
        case 3: cv::cvtColor(m8, rgba, cv::COLOR_BGR2RGBA); break;
        case 1: cv::cvtColor(m8, rgba, cv::COLOR_GRAY2RGBA); break;
        default: return false;
    }

    out = img::Image::fromRGBA8(rgba);
    return !out.isEmpty();
}

static double area(const img::Image& im) {
    return static_cast<double>(im.pixelWidth()) * static_cast<double>(im.pixelHeight());
}

static void sort_by_size(std::vector<img::Image>& reps) {
    std::stable_sort(reps.begin(), reps.end(),
                     [](const img::Image& a, const img::Image& b) { return area(a) < area(b); });
}

} // anonymous namespace

namespace icon {

const char* IoStatusStr(IoStatus s) {
    switch (s) {
        case IoStatus::OK:                return "OK";
        case IoStatus::NOT_FOUND:         return "NOT_FOUND";
        case IoStatus::UNREADABLE_FORMAT: return "UNREADABLE_FORMAT";
        case IoStatus::WRITE_FAIL:        return "WRITE_FAIL";
        case IoStatus::EMPTY_INPUT:       return "EMPTY_INPUT";
    }
    return "UNKNOWN";
}

// -------------------- read --------------------

IoStatus loadImage(const std::string& path, img::Image& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::cerr << "[ICON] ERROR: no such file: " << path << "\n";
        return IoStatus::NOT_FOUND;
    }

    try {
        const cv::Mat decoded = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (!to_image(decoded, out)) {
            std::cerr << "[ICON] ERROR: could not decode " << path << "\n";
            return IoStatus::UNREADABLE_FORMAT;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[ICON] ERROR: could not decode " << path << ": " << e.what() << "\n";
        return IoStatus::UNREADABLE_FORMAT;
    }
    return IoStatus::OK;
}

IoStatus decodeImage(const std::vector<uint8_t>& bytes, img::Image& out) {
    if (bytes.empty()) return IoStatus::EMPTY_INPUT;
    try {
        const cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
        if (!to_image(decoded, out)) return IoStatus::UNREADABLE_FORMAT;
    } catch (const cv::Exception& e) {
        std::cerr << "[ICON] ERROR: decode failed: " << e.what() << "\n";
        return IoStatus::UNREADABLE_FORMAT;
    }
    return IoStatus::OK;
}

IoStatus parseIcns(const std::vector<uint8_t>& bytes, std::vector<img::Image>& out) {
    out.clear();
    if (bytes.size() < 8 || std::memcmp(bytes.data(), "icns", 4) != 0) {
        std::cerr << "[ICON] ERROR: missing icns header\n";
        return IoStatus::UNREADABLE_FORMAT;
    }

    // Declared size may be shorter than the buffer; never read past either
    const size_t total = std::min<size_t>(read_be32(bytes.data() + 4), bytes.size());
    size_t off = 8;

    while (off + 8 <= total) {
        const uint8_t* entry = bytes.data() + off;
        const std::string type(reinterpret_cast<const char*>(entry), 4);
        const uint32_t len = read_be32(entry + 4);

        if (len < 8 || off + len > total) {
            std::cerr << "[ICON] ERROR: corrupt icns entry '" << type << "' at offset " << off << "\n";
            return IoStatus::UNREADABLE_FORMAT;
        }

        const uint8_t* data = entry + 8;
        const size_t n = len - 8;

        if (starts_with(data, n, PNG_SIG, sizeof(PNG_SIG)) || starts_with(data, n, JP2_SIG, sizeof(JP2_SIG))) {
            img::Image im;
            const std::vector<uint8_t> blob(data, data + n);
            if (decodeImage(blob, im) == IoStatus::OK) {
                out.push_back(im);
            } else {
                std::cerr << "[ICON] skipping undecodable entry '" << type << "'\n";
            }
        } else if (type != "TOC " && type != "icnV" && type != "name" && type != "info") {
            std::cerr << "[ICON] skipping legacy entry '" << type << "'\n";
        }

        off += len;
    }

    sort_by_size(out);
    return IoStatus::OK;
}

IoStatus loadRepresentations(const std::string& path, std::vector<img::Image>& out) {
    out.clear();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cerr << "[ICON] ERROR: no such file or directory: " << path << "\n";
        return IoStatus::NOT_FOUND;
    }

    // Iconset folder
    if (fs::is_directory(path, ec)) {
        std::vector<fs::path> files;
        for (const auto& de : fs::directory_iterator(path, ec)) {
            std::error_code fe;
            if (de.is_regular_file(fe) && lower_ext(de.path()) == ".png") files.push_back(de.path());
        }
        if (ec) {
            std::cerr << "[ICON] ERROR: could not list " << path << ": " << ec.message() << "\n";
            return IoStatus::NOT_FOUND;
        }
        std::sort(files.begin(), files.end());

        for (const fs::path& f : files) {
            img::Image im;
            const IoStatus st = loadImage(f.string(), im);
            if (st != IoStatus::OK) return st;
            out.push_back(im);
        }
        sort_by_size(out);
        return IoStatus::OK;
    }

    // Container
    if (lower_ext(path) == ".icns") {
        std::vector<uint8_t> bytes;
        if (!read_file(path, bytes)) {
            std::cerr << "[ICON] ERROR: could not read " << path << "\n";
            return IoStatus::NOT_FOUND;
        }
        const IoStatus st = parseIcns(bytes, out);
        if (st != IoStatus::OK) std::cerr << "[ICON] ERROR: bad container " << path << "\n";
        return st;
    }

    // Single image
    img::Image im;
    const IoStatus st = loadImage(path, im);
    if (st != IoStatus::OK) return st;
    out.push_back(im);
    return IoStatus::OK;
}

bool largestRepresentation(const std::vector<img::Image>& reps, img::Image& out) {
    if (reps.empty()) return false;
    const auto it = std::max_element(reps.begin(), reps.end(),
                                     [](const img::Image& a, const img::Image& b) { return area(a) < area(b); });
    out = *it;
    return true;
}

// -------------------- write --------------------

IoStatus encodePng(const img::Image& image, std::vector<uint8_t>& out) {
    out.clear();
    try {
        cv::Mat rgba;
        if (!image.renderRGBA8(rgba)) return IoStatus::EMPTY_INPUT;

        cv::Mat bgra;
        cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
        if (!cv::imencode(".png", bgra, out)) return IoStatus::WRITE_FAIL;
    } catch (const cv::Exception& e) {
        std::cerr << "[ICON] ERROR: PNG encode failed: " << e.what() << "\n";
        return IoStatus::WRITE_FAIL;
    }
    return IoStatus::OK;
}

IoStatus writePng(const img::Image& image, const std::string& path) {
    std::vector<uint8_t> png;
    const IoStatus st = encodePng(image, png);
    if (st != IoStatus::OK) return st;

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        std::cerr << "[ICON] ERROR: could not open " << path << " for writing\n";
        return IoStatus::WRITE_FAIL;
    }
    f.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    if (!f.good()) {
        std::cerr << "[ICON] ERROR: short write to " << path << "\n";
        return IoStatus::WRITE_FAIL;
    }
    return IoStatus::OK;
}

const char* icnsTypeForSize(int px) {
    switch (px) {
        case 16:   return "icp4";
        case 32:   return "icp5";
        case 64:   return "icp6";
        case 128:  return "ic07";
        case 256:  return "ic08";
        case 512:  return "ic09";
        case 1024: return "ic10";
        default:   return nullptr;
    }
}

IoStatus writeIcns(const std::vector<img::Image>& images, const std::string& path) {
    if (images.empty()) return IoStatus::EMPTY_INPUT;

    std::vector<uint8_t> blob = {'i', 'c', 'n', 's', 0, 0, 0, 0};
    std::set<int> written;

    for (const img::Image& im : images) {
        const int w = im.pixelWidth();
        const int h = im.pixelHeight();
        const char* type = (w == h) ? icnsTypeForSize(w) : nullptr;
        if (!type) {
            std::cerr << "[ICON] skipping " << w << "x" << h << ": no icns slot for this size\n";
            continue;
        }
        if (written.count(w)) {
            std::cerr << "[ICON] skipping duplicate " << w << "x" << h << "\n";
            continue;
        }

        std::vector<uint8_t> png;
        const IoStatus st = encodePng(im, png);
        if (st != IoStatus::OK) return st;

        blob.insert(blob.end(), type, type + 4);
        append_be32(blob, static_cast<uint32_t>(8 + png.size()));
        blob.insert(blob.end(), png.begin(), png.end());
        written.insert(w);
    }

    if (written.empty()) {
        std::cerr << "[ICON] ERROR: none of the " << images.size() << " images fits an icns slot\n";
        return IoStatus::EMPTY_INPUT;
    }

    // Patch total size
    const uint32_t total = static_cast<uint32_t>(blob.size());
    blob[4] = uint8_t((total >> 24) & 0xFF);
    blob[5] = uint8_t((total >> 16) & 0xFF);
    blob[6] = uint8_t((total >> 8) & 0xFF);
    blob[7] = uint8_t(total & 0xFF);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        std::cerr << "[ICON] ERROR: could not open " << path << " for writing\n";
        return IoStatus::WRITE_FAIL;
    }
    f.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
    if (!f.good()) {
        std::cerr << "[ICON] ERROR: short write to " << path << "\n";
        return IoStatus::WRITE_FAIL;
    }
    return IoStatus::OK;
}

IoStatus writeIconset(const std::vector<img::Image>& images, const std::string& dir) {
    if (images.empty()) return IoStatus::EMPTY_INPUT;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[ICON] ERROR: could not create " << dir << ": " << ec.message() << "\n";
        return IoStatus::WRITE_FAIL;
    }

    for (const img::Image& im : images) {
        const std::string name = std::to_string(im.pixelWidth()) + "x" + std::to_string(im.pixelHeight()) + ".png";
        const IoStatus st = writePng(im, (fs::path(dir) / name).string());
        if (st != IoStatus::OK) return st;
    }
    return IoStatus::OK;
}

} // namespace icon
