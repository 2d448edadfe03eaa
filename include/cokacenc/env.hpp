#pragma once

#include <string>
#include <string_view>

namespace cokacenc::env {

std::string Get(std::string_view name);
bool IsSet(std::string_view name);

}  // namespace cokacenc::env
