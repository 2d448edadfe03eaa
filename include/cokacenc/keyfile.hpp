#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "cokacenc/constants.hpp"

namespace cokacenc::keyfile {

// Whole file contents with leading/trailing whitespace removed, used as the
// PBKDF2 password.
std::string LoadKeyFile(const std::filesystem::path& path);

std::string TrimWhitespace(const std::string& text);

// Writes `length` CSPRNG bytes as one line of Base64. Returns the encoded key.
std::string GenerateKeyFile(const std::filesystem::path& path,
                            std::size_t length = constants::kDefaultKeyLength,
                            bool force = false);

}  // namespace cokacenc::keyfile
