#include "cokacenc/env.hpp"

#include <cstdlib>

namespace cokacenc::env {

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

// NO_COLOR style switches count as set even when the value is empty.
bool IsSet(std::string_view name) {
    std::string key(name);
    return std::getenv(key.c_str()) != nullptr;
}

}  // namespace cokacenc::env
