#include "platform/linux/DesktopEntryIconStore.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << "[TEST] " << (ok ? "PASS  " : "FAIL  ") << what << "\n";
    if (!ok) ++g_failures;
}

static void write_text(const fs::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::trunc);
    f << text;
}

int main() {
    // --- .directory line handling ---
    {
        std::vector<std::string> lines = {"[Desktop Entry]", "Icon[de]=ordner", "Icon=folder-blue",
                                          "", "[Settings]", "Icon=unrelated"};
        check(platform::desktopEntryIcon(lines) == "folder-blue", "Icon= of [Desktop Entry] is read");

        platform::setDesktopEntryIcon(lines, "/x/icon.png");
        check(lines.size() == 6 && lines[2] == "Icon=/x/icon.png", "existing key replaced in place");
        check(lines[1] == "Icon[de]=ordner", "localized key left alone");
        check(lines[5] == "Icon=unrelated", "other sections left alone");
    }
    {
        std::vector<std::string> lines = {"[Desktop Entry]", "Name=Stuff"};
        platform::setDesktopEntryIcon(lines, "/y.png");
        check(lines.size() == 3 && lines[1] == "Icon=/y.png" && lines[2] == "Name=Stuff",
              "key inserted after the header");
    }
    {
        std::vector<std::string> lines = {"[Dolphin]", "Timestamp=1"};
        platform::setDesktopEntryIcon(lines, "/z.png");
        check(lines.size() == 5 && lines[2].empty() && lines[3] == "[Desktop Entry]" && lines[4] == "Icon=/z.png",
              "section appended after a blank line");
        check(platform::desktopEntryIcon({"[Dolphin]", "Icon=nope"}).empty(), "Icon outside the section ignored");
    }

    std::error_code ec;
    const fs::path root = fs::temp_directory_path(ec) / "iconic_store_test";
    fs::remove_all(root, ec);
    fs::create_directories(root / "folder", ec);

    platform::DesktopEntryIconStore store;
    img::Image icon;

    // --- status cases ---
    check(store.getIcon((root / "missing").string(), icon) == platform::StoreStatus::NOT_FOUND, "missing -> NOT_FOUND");
    write_text(root / "file.txt", "hello");
    check(store.getIcon((root / "file.txt").string(), icon) == platform::StoreStatus::UNSUPPORTED,
          "regular file -> UNSUPPORTED");
    check(store.getIcon((root / "folder").string(), icon) == platform::StoreStatus::NO_ICON,
          "no .directory -> NO_ICON");

    write_text(root / "folder" / ".directory", "[Desktop Entry]\nIcon=folder-red\n");
    check(store.getIcon((root / "folder").string(), icon) == platform::StoreStatus::NO_ICON,
          "theme icon name -> NO_ICON");

    write_text(root / "folder" / ".directory", "[Desktop Entry]\nIcon=gone.png\n");
    check(store.getIcon((root / "folder").string(), icon) == platform::StoreStatus::NO_ICON,
          "dangling icon path -> NO_ICON");

    // --- set + get ---
    {
        write_text(root / "folder" / ".directory", "[Desktop Entry]\nIcon=folder-red\n\n[Dolphin]\nViewMode=1\n");

        const img::Image in = img::Image::fromRGBA8(cv::Mat(48, 48, CV_8UC4, cv::Scalar(10, 200, 30, 255)));
        check(store.setIcon((root / "folder").string(), in) == platform::StoreStatus::OK, "setIcon ok");
        check(fs::exists(root / "folder" / platform::DesktopEntryIconStore::ICON_FILE, ec), "icon file written");

        check(store.getIcon((root / "folder").string(), icon) == platform::StoreStatus::OK, "getIcon ok");
        check(icon.pixelWidth() == 48 && icon.pixelHeight() == 48, "icon size round-trips");

        std::ifstream f(root / "folder" / ".directory");
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        check(text.find("ViewMode=1") != std::string::npos, "other sections kept");
        check(text.find("folder-red") == std::string::npos, "old icon replaced");

        check(store.setIcon((root / "file.txt").string(), in) == platform::StoreStatus::UNSUPPORTED,
              "setIcon on a file -> UNSUPPORTED");
    }

    // --- relative and file:// values ---
    {
        const img::Image in = img::Image::fromRGBA8(cv::Mat(8, 8, CV_8UC4, cv::Scalar(1, 2, 3, 255)));
        fs::create_directories(root / "rel", ec);
        check(store.setIcon((root / "rel").string(), in) == platform::StoreStatus::OK, "setIcon on a second folder");

        write_text(root / "rel" / ".directory", "[Desktop Entry]\nIcon=.directory-icon.png\n");
        check(store.getIcon((root / "rel").string(), icon) == platform::StoreStatus::OK,
              "relative path resolved against the folder");

        const fs::path abs = fs::absolute(root / "rel" / ".directory-icon.png", ec);
        write_text(root / "rel" / ".directory", "[Desktop Entry]\nIcon=file://" + abs.string() + "\n");
        check(store.getIcon((root / "rel").string(), icon) == platform::StoreStatus::OK, "file:// prefix accepted");
    }

    fs::remove_all(root, ec);

    if (g_failures) {
        std::cerr << "[TEST] " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "[TEST] All checks passed\n";
    return 0;
}
