#include "cokacenc/naming.hpp"

#include "cokacenc/constants.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"

#include <algorithm>
#include <system_error>

namespace cokacenc::naming {

namespace {

bool IsLowerHex(char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

}  // namespace

std::string RandomGroupId() {
    return crypto::HexEncode(crypto::RandomBytes(constants::kGroupIdBytes));
}

std::string SeqLabel(std::size_t index) {
    if (index > constants::kMaxSeqIndex) {
        throw SeqOverflow(index);
    }
    std::string label(constants::kSeqLabelLen, 'a');
    for (std::size_t i = constants::kSeqLabelLen; i-- > 0;) {
        label[i] = static_cast<char>('a' + index % constants::kSeqRadix);
        index /= constants::kSeqRadix;
    }
    return label;
}

std::optional<std::size_t> ParseSeqLabel(std::string_view label) {
    if (label.size() != constants::kSeqLabelLen) {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (char ch : label) {
        if (ch < 'a' || ch > 'z') {
            return std::nullopt;
        }
        value = value * constants::kSeqRadix + static_cast<std::size_t>(ch - 'a');
    }
    return value;
}

bool IsGroupId(std::string_view text) {
    return text.size() == constants::kGroupIdHexLen && std::all_of(text.begin(), text.end(), IsLowerHex);
}

bool HasChunkExtension(std::string_view filename) {
    const std::string_view ext = constants::kChunkExt;
    return filename.size() >= ext.size() && filename.substr(filename.size() - ext.size()) == ext;
}

std::string ChunkFileName(const std::string& group_id, std::size_t index) {
    if (!IsGroupId(group_id)) {
        throw ConfigError("Invalid group id: " + group_id);
    }
    return group_id + "_" + SeqLabel(index) + std::string(constants::kChunkExt);
}

std::filesystem::path ChunkPath(const std::filesystem::path& dir, const std::string& group_id, std::size_t index) {
    return dir / ChunkFileName(group_id, index);
}

std::optional<ChunkFileEntry> ParseChunkFileName(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    const std::size_t expected_len =
        constants::kGroupIdHexLen + 1 + constants::kSeqLabelLen + constants::kChunkExt.size();
    if (name.size() != expected_len || !HasChunkExtension(name)) {
        return std::nullopt;
    }
    std::string_view view(name);
    std::string_view group = view.substr(0, constants::kGroupIdHexLen);
    if (!IsGroupId(group) || view[constants::kGroupIdHexLen] != '_') {
        return std::nullopt;
    }
    auto seq = ParseSeqLabel(view.substr(constants::kGroupIdHexLen + 1, constants::kSeqLabelLen));
    if (!seq) {
        return std::nullopt;
    }
    ChunkFileEntry entry;
    entry.group_id = std::string(group);
    entry.seq_index = *seq;
    entry.path = path;
    return entry;
}

GroupMap GroupEncFiles(const std::filesystem::path& dir) {
    GroupMap groups;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw IoError("Failed to read directory " + dir.string() + ": " + ec.message());
    }
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        auto entry = ParseChunkFileName(it->path());
        if (entry) {
            groups[entry->group_id].push_back(std::move(*entry));
        }
    }
    if (ec) {
        throw IoError("Failed to read directory " + dir.string() + ": " + ec.message());
    }
    for (auto& [group_id, files] : groups) {
        std::sort(files.begin(), files.end(), [](const ChunkFileEntry& lhs, const ChunkFileEntry& rhs) {
            return lhs.seq_index < rhs.seq_index;
        });
    }
    return groups;
}

std::set<std::string> ExistingGroupIds(const std::filesystem::path& dir) {
    std::set<std::string> ids;
    for (const auto& [group_id, files] : GroupEncFiles(dir)) {
        ids.insert(group_id);
    }
    return ids;
}

std::string GenerateGroupId(const std::filesystem::path& dir) {
    return GenerateGroupId(dir, RandomGroupId);
}

std::string GenerateGroupId(const std::filesystem::path& dir, const CandidateSource& next_candidate) {
    const std::set<std::string> taken = ExistingGroupIds(dir);
    for (std::size_t attempt = 0; attempt < constants::kGroupIdMaxAttempts; ++attempt) {
        std::string candidate = next_candidate();
        if (!IsGroupId(candidate) || taken.count(candidate)) {
            continue;
        }
        // Catches non-regular entries squatting on the first chunk name.
        std::error_code ec;
        if (std::filesystem::exists(ChunkPath(dir, candidate, 0), ec) || ec) {
            continue;
        }
        return candidate;
    }
    throw GroupIdExhaustedError("Could not find an unused group id in " + dir.string() + " after "
                                + std::to_string(constants::kGroupIdMaxAttempts) + " attempts");
}

}  // namespace cokacenc::naming
