#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cokacenc::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);

}  // namespace cokacenc::base64
