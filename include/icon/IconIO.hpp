#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "img/Image.hpp"

namespace icon {

enum class IoStatus : uint8_t {
    OK = 0,
    NOT_FOUND,
    UNREADABLE_FORMAT,
    WRITE_FAIL,
    EMPTY_INPUT,       // nothing to write / nothing decodable
};

const char* IoStatusStr(IoStatus s);

// ------------------------------
// Read
// ------------------------------

// Decode one image file (PNG, JPEG, TIFF, ... whatever imread supports).
IoStatus loadImage(const std::string& path, img::Image& out);

// Decode an in-memory encoded image.
IoStatus decodeImage(const std::vector<uint8_t>& bytes, img::Image& out);

// All representations of a multi-resolution icon, smallest first:
//   *.icns     -> every PNG / JPEG 2000 entry (legacy RLE entries are skipped)
//   directory  -> every *.png inside (iconset)
//   otherwise  -> the single image
// Zero representations is a valid result for a container without images.
IoStatus loadRepresentations(const std::string& path, std::vector<img::Image>& out);

// Parse an in-memory .icns container.
IoStatus parseIcns(const std::vector<uint8_t>& bytes, std::vector<img::Image>& out);

// Largest representation by pixel area. Returns false if 'reps' is empty.
bool largestRepresentation(const std::vector<img::Image>& reps, img::Image& out);

// ------------------------------
// Write
// ------------------------------

IoStatus encodePng(const img::Image& image, std::vector<uint8_t>& out);
IoStatus writePng(const img::Image& image, const std::string& path);

// ICNS entry type for a square PNG of 'px' pixels, nullptr if unsupported.
//   16 icp4, 32 icp5, 64 icp6, 128 ic07, 256 ic08, 512 ic09, 1024 ic10
const char* icnsTypeForSize(int px);

// Big-endian "icns" container of PNG entries. Non-square or unsupported sizes
// and duplicate sizes are skipped with a log.
IoStatus writeIcns(const std::vector<img::Image>& images, const std::string& path);

// Folder with one "<w>x<h>.png" per image; created if missing.
IoStatus writeIconset(const std::vector<img::Image>& images, const std::string& dir);

} // namespace icon
