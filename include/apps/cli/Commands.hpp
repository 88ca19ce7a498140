#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "img/Image.hpp"

namespace cli {

enum class Command : uint8_t {
    NONE = 0,
    GET,
    SET,
    MASK,
};

enum class ColorScheme : uint8_t {
    AUTO = 0,
    LIGHT,
    DARK,
};

enum class TrimBackend : uint8_t {
    GPU = 0,
    CPU,
    EXTERNAL,
};

// Exit codes
static constexpr int EXIT_OK    = 0;
static constexpr int EXIT_FAIL  = 1;
static constexpr int EXIT_USAGE = 2;

struct Args {
    Command cmd = Command::NONE;
    std::vector<std::string> positional;

    std::string icns;            // --icns <file>
    std::string iconset;         // --iconset <dir>
    std::string template_path;   // --template <file>, default from colour scheme
    std::string kernel_dir;      // --kernel-dir <dir>

    ColorScheme scheme = ColorScheme::AUTO;
    TrimBackend trim = TrimBackend::GPU;

    bool reveal = false;
    bool no_trim = false;
    bool debug_dump = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* exe);
bool parse_args(int argc, char** argv, Args& out);

// "Adwaita:dark" -> true
bool isDarkTheme(const char* gtk_theme);

// <home>/.local/share/iconic/folder-<light|dark>.icns
std::string defaultTemplatePath(ColorScheme scheme, const char* home, const char* gtk_theme);

// Square representations at the icns sizes up to the icon's own size
// (at least 16 px). Non-square icons are centered on a transparent canvas.
bool standardRepresentations(const img::Image& icon, std::vector<img::Image>& out);

int runGet(const Args& args);
int runSet(const Args& args);
int runMask(const Args& args);

// Dispatch on args.cmd.
int run(const Args& args);

} // namespace cli
