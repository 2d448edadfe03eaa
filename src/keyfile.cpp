#include "cokacenc/keyfile.hpp"

#include "cokacenc/base64.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace cokacenc::keyfile {

namespace {

bool IsSpace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

}  // namespace

std::string TrimWhitespace(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && IsSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && IsSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string LoadKeyFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Failed to open key file: " + path.string());
    }
    std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw IoError("Failed to read key file: " + path.string());
    }
    std::string password = TrimWhitespace(data);
    if (password.empty()) {
        throw ConfigError("Key file is empty: " + path.string());
    }
    return password;
}

std::string GenerateKeyFile(const std::filesystem::path& path, std::size_t length, bool force) {
    if (length == 0) {
        throw ConfigError("Key length must be at least 1 byte");
    }
    std::error_code ec;
    if (!force && std::filesystem::exists(path, ec)) {
        throw ConfigError("File already exists: " + path.string() + " (use --force to overwrite)");
    }
    crypto::Bytes raw = crypto::RandomBytes(length);
    std::string encoded = base64::Encode(raw);
    crypto::detail::Cleanse(raw);

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw IoError("Failed to open key file for writing: " + path.string());
    }
    output.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
    output.close();
    if (output.fail()) {
        throw IoError("Failed to write key file: " + path.string());
    }
    return encoded;
}

}  // namespace cokacenc::keyfile
