#pragma once
#include <string>
#include <vector>

#include "platform/IIconStore.hpp"

namespace platform {

// ---------------------------------------------------------------------------
// DesktopEntryIconStore: custom folder icons through the freedesktop
// ".directory" file honoured by Dolphin, Nautilus extensions, etc.
//
//   <dir>/.directory          [Desktop Entry]
//                             Icon=<dir>/.directory-icon.png
//   <dir>/.directory-icon.png the icon itself
//
// Other keys and sections of an existing .directory are preserved. Icon
// values that are theme names (no path) are reported as NO_ICON. Regular
// files cannot carry a custom icon this way and are UNSUPPORTED.
// ---------------------------------------------------------------------------
class DesktopEntryIconStore : public IIconStore {
public:
    static constexpr const char* ENTRY_FILE = ".directory";
    static constexpr const char* ICON_FILE  = ".directory-icon.png";

    StoreStatus getIcon(const std::string& path, img::Image& icon) override;
    StoreStatus setIcon(const std::string& path, const img::Image& icon) override;
};

// Rewrite the [Desktop Entry] Icon= key of a .directory file's lines, adding
// the key or the whole section if missing.
void setDesktopEntryIcon(std::vector<std::string>& lines, const std::string& icon_value);

// Icon= value of the [Desktop Entry] section, empty if none.
std::string desktopEntryIcon(const std::vector<std::string>& lines);

// Open the directory holding 'path' in the desktop file manager (xdg-open).
// Best effort: failures are only logged.
void revealInFileManager(const std::string& path);

} // namespace platform
