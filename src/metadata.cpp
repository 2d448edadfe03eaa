#include "cokacenc/metadata.hpp"

#include "cokacenc/errors.hpp"

#include <cstdio>
#include <limits>
#include <set>
#include <vector>

namespace cokacenc::metadata {

namespace {

constexpr int kMaxNesting = 32;

std::string EscapeJson(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 2);
    for (char ch : input) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

class JsonReader {
public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    [[noreturn]] void Fail(const std::string& what) const {
        throw MetadataInconsistency("Malformed chunk metadata: " + what + " at offset " + std::to_string(pos_));
    }

    void SkipWs() {
        while (pos_ < text_.size()) {
            char ch = text_[pos_];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
                break;
            }
            ++pos_;
        }
    }

    bool Consume(char expected) {
        SkipWs();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    void Expect(char expected) {
        if (!Consume(expected)) {
            Fail(std::string("expected '") + expected + "'");
        }
    }

    char Peek() {
        SkipWs();
        if (pos_ >= text_.size()) {
            Fail("unexpected end of input");
        }
        return text_[pos_];
    }

    bool AtEnd() {
        SkipWs();
        return pos_ >= text_.size();
    }

    std::string ReadString() {
        Expect('"');
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                Fail("unterminated string");
            }
            char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                Fail("unterminated escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    std::uint32_t cp = ReadHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (pos_ + 1 < text_.size() && text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            std::uint32_t low = ReadHex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                Fail("invalid surrogate pair");
                            }
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            Fail("lone surrogate");
                        }
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    Fail("invalid escape");
            }
        }
    }

    // Integer literal; fractions and exponents are rejected for known fields.
    std::uint64_t ReadUnsigned() {
        SkipWs();
        if (pos_ < text_.size() && text_[pos_] == '-') {
            Fail("negative value");
        }
        return ReadMagnitude();
    }

    std::int64_t ReadSigned() {
        SkipWs();
        bool negative = false;
        if (pos_ < text_.size() && text_[pos_] == '-') {
            negative = true;
            ++pos_;
        }
        std::uint64_t magnitude = ReadMagnitude();
        const std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (negative) {
            if (magnitude > limit + 1) {
                Fail("integer out of range");
            }
            if (magnitude == limit + 1) {
                return std::numeric_limits<std::int64_t>::min();
            }
            return -static_cast<std::int64_t>(magnitude);
        }
        if (magnitude > limit) {
            Fail("integer out of range");
        }
        return static_cast<std::int64_t>(magnitude);
    }

    void SkipValue(int depth = 0) {
        if (depth > kMaxNesting) {
            Fail("nesting too deep");
        }
        char ch = Peek();
        if (ch == '"') {
            ReadString();
        } else if (ch == '{') {
            ++pos_;
            if (Consume('}')) {
                return;
            }
            do {
                ReadString();
                Expect(':');
                SkipValue(depth + 1);
            } while (Consume(','));
            Expect('}');
        } else if (ch == '[') {
            ++pos_;
            if (Consume(']')) {
                return;
            }
            do {
                SkipValue(depth + 1);
            } while (Consume(','));
            Expect(']');
        } else if (ch == 't') {
            ExpectWord("true");
        } else if (ch == 'f') {
            ExpectWord("false");
        } else if (ch == 'n') {
            ExpectWord("null");
        } else if (ch == '-' || (ch >= '0' && ch <= '9')) {
            SkipNumber();
        } else {
            Fail("unexpected character");
        }
    }

private:
    std::uint32_t ReadHex4() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated \\u escape");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = text_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                Fail("invalid hex digit");
            }
        }
        return value;
    }

    std::uint64_t ReadMagnitude() {
        std::size_t start = pos_;
        std::uint64_t value = 0;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            std::uint64_t digit = static_cast<std::uint64_t>(text_[pos_] - '0');
            if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
                Fail("integer out of range");
            }
            value = value * 10 + digit;
            ++pos_;
        }
        if (pos_ == start) {
            Fail("expected integer");
        }
        if (pos_ < text_.size() && (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            Fail("expected integer");
        }
        return value;
    }

    void SkipNumber() {
        if (text_[pos_] == '-') {
            ++pos_;
        }
        std::size_t start = pos_;
        while (pos_ < text_.size()) {
            char ch = text_[pos_];
            if ((ch >= '0' && ch <= '9') || ch == '.' || ch == 'e' || ch == 'E' || ch == '+' || ch == '-') {
                ++pos_;
            } else {
                break;
            }
        }
        if (pos_ == start) {
            Fail("expected number");
        }
    }

    void ExpectWord(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) {
            Fail("invalid literal");
        }
        pos_ += word.size();
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

std::string Encode(const ChunkMetadata& meta) {
    std::string json;
    json.reserve(256 + meta.filename.size());
    json += "{\"version\":" + std::to_string(meta.version);
    json += ",\"group_id\":\"" + EscapeJson(meta.group_id) + "\"";
    json += ",\"filename\":\"" + EscapeJson(meta.filename) + "\"";
    json += ",\"file_size\":" + std::to_string(meta.file_size);
    json += ",\"md5\":\"" + EscapeJson(meta.md5) + "\"";
    json += ",\"modified\":" + std::to_string(meta.modified);
    json += ",\"permissions\":" + std::to_string(meta.permissions);
    json += ",\"total_chunks\":" + std::to_string(meta.total_chunks);
    json += ",\"chunk_index\":" + std::to_string(meta.chunk_index);
    json += ",\"chunk_offset\":" + std::to_string(meta.chunk_offset);
    json += ",\"chunk_data_size\":" + std::to_string(meta.chunk_data_size);
    json.push_back('}');
    return json;
}

ChunkMetadata Decode(std::string_view json) {
    static const std::vector<std::string> kRequired = {
        "group_id", "filename", "file_size", "total_chunks", "chunk_index", "chunk_offset", "chunk_data_size"
    };

    JsonReader reader(json);
    ChunkMetadata meta;
    std::set<std::string> seen;

    reader.Expect('{');
    if (!reader.Consume('}')) {
        do {
            std::string key = reader.ReadString();
            reader.Expect(':');
            if (key == "version") {
                std::uint64_t version = reader.ReadUnsigned();
                if (version > std::numeric_limits<std::uint32_t>::max()) {
                    reader.Fail("version out of range");
                }
                meta.version = static_cast<std::uint32_t>(version);
            } else if (key == "group_id") {
                meta.group_id = reader.ReadString();
            } else if (key == "filename") {
                meta.filename = reader.ReadString();
            } else if (key == "file_size") {
                meta.file_size = reader.ReadUnsigned();
            } else if (key == "md5") {
                meta.md5 = reader.ReadString();
            } else if (key == "modified") {
                meta.modified = reader.ReadSigned();
            } else if (key == "permissions") {
                std::uint64_t perms = reader.ReadUnsigned();
                if (perms > 07777) {
                    reader.Fail("permission bits out of range");
                }
                meta.permissions = static_cast<std::uint32_t>(perms);
            } else if (key == "total_chunks") {
                meta.total_chunks = reader.ReadUnsigned();
            } else if (key == "chunk_index") {
                meta.chunk_index = reader.ReadUnsigned();
            } else if (key == "chunk_offset") {
                meta.chunk_offset = reader.ReadUnsigned();
            } else if (key == "chunk_data_size") {
                meta.chunk_data_size = reader.ReadUnsigned();
            } else {
                reader.SkipValue();
            }
            seen.insert(std::move(key));
        } while (reader.Consume(','));
        reader.Expect('}');
    }
    if (!reader.AtEnd()) {
        reader.Fail("trailing data");
    }
    for (const auto& key : kRequired) {
        if (!seen.count(key)) {
            throw MetadataInconsistency("Chunk metadata is missing field '" + key + "'");
        }
    }
    return meta;
}

}  // namespace cokacenc::metadata
