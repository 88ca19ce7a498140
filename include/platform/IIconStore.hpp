#pragma once
#include <cstdint>
#include <string>

#include "img/Image.hpp"

namespace platform {

enum class StoreStatus : uint8_t {
    OK = 0,
    NOT_FOUND,     // entry does not exist
    NO_ICON,       // entry exists but carries no custom icon
    UNSUPPORTED,   // entry kind cannot carry an icon here
    READ_FAIL,
    WRITE_FAIL,
};

const char* StoreStatusStr(StoreStatus s);

class IIconStore {
public:
    virtual StoreStatus getIcon(const std::string& path, img::Image& icon) = 0;
    virtual StoreStatus setIcon(const std::string& path, const img::Image& icon) = 0;
    virtual ~IIconStore() = default;
};

} // namespace platform
