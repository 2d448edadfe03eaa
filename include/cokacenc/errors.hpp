#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cokacenc {

// Root of every error the engine raises. Each failure is fatal to its unit of
// work (one source file when packing, one group when unpacking).
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad magic, unsupported version or truncated header.
class FormatError : public Error {
public:
    using Error::Error;
};

// Padding or cipher failure: wrong key or corrupt ciphertext.
class CryptoError : public Error {
public:
    using Error::Error;
};

class SeqOverflow : public Error {
public:
    explicit SeqOverflow(std::size_t index)
        : Error("Sequence index " + std::to_string(index) + " exceeds the 4-letter label range"),
          index_(index) {}

    std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

class MissingChunkError : public Error {
public:
    MissingChunkError(const std::string& group_id, const std::string& expected_label)
        : Error("Missing chunk " + group_id + "_" + expected_label),
          group_id_(group_id),
          expected_label_(expected_label) {}

    const std::string& group_id() const noexcept { return group_id_; }
    const std::string& expected_label() const noexcept { return expected_label_; }

private:
    std::string group_id_;
    std::string expected_label_;
};

// Merged content or a chunk's slice does not match what the metadata declares.
class IntegrityError : public Error {
public:
    using Error::Error;
};

// Malformed metadata record, or one chunk disagrees with the rest of its group.
class MetadataInconsistency : public IntegrityError {
public:
    using IntegrityError::IntegrityError;
};

class IncompleteMetadataError : public MetadataInconsistency {
public:
    using MetadataInconsistency::MetadataInconsistency;
};

class IoError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class GroupIdExhaustedError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

}  // namespace cokacenc
