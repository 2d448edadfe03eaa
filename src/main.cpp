#include "cokacenc/cli_colors.hpp"
#include "cokacenc/constants.hpp"
#include "cokacenc/crypto.hpp"
#include "cokacenc/errors.hpp"
#include "cokacenc/inspect.hpp"
#include "cokacenc/keyfile.hpp"
#include "cokacenc/pack.hpp"
#include "cokacenc/unpack.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

namespace cli = cokacenc::cli;

// Bad command line; reported with exit status 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  cokacenc pack --dir <path> --key <file> [--size <MB>] [--delete] [--md5] [--no-color]\n";
    std::cout << "  cokacenc unpack --dir <path> --key <file> [--delete] [--force] [--no-color]\n";
    std::cout << "  cokacenc generate --output <file> [--length <bytes>] [--force]\n";
    std::cout << "  cokacenc info <chunk-file> --key <file>\n";
    std::cout << "\n";
    std::cout << "  --size 0 keeps every file in a single chunk (default "
              << cokacenc::constants::kDefaultSplitSizeMb << " MB).\n";
}

std::uint64_t ParseCount(const std::string& flag, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw UsageError("Invalid value for " + flag + ": " + value);
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw UsageError("Value for " + flag + " is too large: " + value);
    }
}

std::string TakeValue(int argc, char** argv, int& idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    std::string value(argv[idx + 1]);
    idx += 2;
    return value;
}

struct PackArgs {
    std::string dir;
    std::string key_file;
    std::uint64_t size_mb = cokacenc::constants::kDefaultSplitSizeMb;
    bool delete_original = false;
    bool md5 = false;
    bool no_color = false;
};

struct UnpackArgs {
    std::string dir;
    std::string key_file;
    bool delete_chunks = false;
    bool force = false;
    bool no_color = false;
};

struct GenerateArgs {
    std::string output;
    std::size_t length = cokacenc::constants::kDefaultKeyLength;
    bool force = false;
};

struct InfoArgs {
    std::string chunk;
    std::string key_file;
};

PackArgs ParsePackArgs(int argc, char** argv, int start_index) {
    PackArgs opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--dir" || flag == "-d") {
            opts.dir = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--key" || flag == "-k") {
            opts.key_file = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--size" || flag == "-s") {
            opts.size_mb = ParseCount(flag, TakeValue(argc, argv, idx, flag));
        } else if (flag == "--delete") {
            opts.delete_original = true;
            idx += 1;
        } else if (flag == "--md5") {
            opts.md5 = true;
            idx += 1;
        } else if (flag == "--no-color") {
            opts.no_color = true;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.dir.empty() || opts.key_file.empty()) {
        throw UsageError("pack requires --dir and --key");
    }
    if (opts.size_mb > std::numeric_limits<std::uint64_t>::max() / cokacenc::constants::kBytesPerMb) {
        throw UsageError("--size is too large");
    }
    return opts;
}

UnpackArgs ParseUnpackArgs(int argc, char** argv, int start_index) {
    UnpackArgs opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--dir" || flag == "-d") {
            opts.dir = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--key" || flag == "-k") {
            opts.key_file = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--delete") {
            opts.delete_chunks = true;
            idx += 1;
        } else if (flag == "--force" || flag == "-f") {
            opts.force = true;
            idx += 1;
        } else if (flag == "--no-color") {
            opts.no_color = true;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.dir.empty() || opts.key_file.empty()) {
        throw UsageError("unpack requires --dir and --key");
    }
    return opts;
}

GenerateArgs ParseGenerateArgs(int argc, char** argv, int start_index) {
    GenerateArgs opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--output" || flag == "-o") {
            opts.output = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--length" || flag == "-l") {
            opts.length = static_cast<std::size_t>(ParseCount(flag, TakeValue(argc, argv, idx, flag)));
        } else if (flag == "--force" || flag == "-f") {
            opts.force = true;
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.output.empty()) {
        throw UsageError("generate requires --output");
    }
    return opts;
}

InfoArgs ParseInfoArgs(int argc, char** argv, int start_index) {
    InfoArgs opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--key" || flag == "-k") {
            opts.key_file = TakeValue(argc, argv, idx, flag);
        } else if (!flag.empty() && flag[0] == '-') {
            throw UsageError("Unknown flag: " + flag);
        } else if (opts.chunk.empty()) {
            opts.chunk = flag;
            idx += 1;
        } else {
            throw UsageError("Unexpected argument: " + flag);
        }
    }
    if (opts.chunk.empty() || opts.key_file.empty()) {
        throw UsageError("info requires <chunk-file> and --key");
    }
    return opts;
}

void PrintChunkInfo(const cokacenc::inspect::ChunkInfo& info) {
    const auto& meta = info.metadata;
    std::cout << "chunk: " << info.path.string() << " (" << info.file_size << " bytes)\n";
    std::cout << "format_version: " << info.header.version << "\n";
    std::cout << "salt: " << cokacenc::crypto::HexEncode(info.header.salt) << "\n";
    std::cout << "iv: " << cokacenc::crypto::HexEncode(info.header.iv) << "\n";
    std::cout << "metadata_len: " << info.metadata_len << " bytes\n";
    std::cout << "group_id: " << meta.group_id << "\n";
    std::cout << "filename: " << meta.filename << "\n";
    std::cout << "file_size: " << meta.file_size << " (" << cli::FormatSize(meta.file_size) << ")\n";
    std::cout << "md5: " << (meta.md5.empty() ? "<not computed>" : meta.md5) << "\n";
    std::cout << "modified: " << meta.modified << "\n";
    std::cout << "permissions: " << std::oct << meta.permissions << std::dec << "\n";
    std::cout << "sequence: " << (meta.chunk_index + 1) << " of " << meta.total_chunks << "\n";
    std::cout << "chunk_offset: " << meta.chunk_offset << "\n";
    std::cout << "chunk_data_size: " << meta.chunk_data_size << "\n";
}

int RunPack(int argc, char** argv) {
    PackArgs args = ParsePackArgs(argc, argv, 2);
    if (args.no_color) {
        cli::SetColorsEnabled(false);
    }
    std::string password = cokacenc::keyfile::LoadKeyFile(args.key_file);
    cokacenc::pack::Options opts;
    opts.split_size = args.size_mb * cokacenc::constants::kBytesPerMb;
    opts.delete_original = args.delete_original;
    opts.compute_hash = args.md5;
    auto results = cokacenc::pack::PackDirectory(args.dir, password, opts);
    if (!results.empty()) {
        std::cout << cli::BoldGreen("Packed " + std::to_string(results.size()) + " file(s)") << "\n";
    }
    return 0;
}

int RunUnpack(int argc, char** argv) {
    UnpackArgs args = ParseUnpackArgs(argc, argv, 2);
    if (args.no_color) {
        cli::SetColorsEnabled(false);
    }
    std::string password = cokacenc::keyfile::LoadKeyFile(args.key_file);
    cokacenc::unpack::Options opts;
    opts.delete_chunks = args.delete_chunks;
    opts.overwrite = args.force;
    auto results = cokacenc::unpack::UnpackDirectory(args.dir, password, opts);
    if (!results.empty()) {
        std::cout << cli::BoldGreen("Restored " + std::to_string(results.size()) + " file(s)") << "\n";
    }
    return 0;
}

int RunGenerate(int argc, char** argv) {
    GenerateArgs args = ParseGenerateArgs(argc, argv, 2);
    cokacenc::keyfile::GenerateKeyFile(args.output, args.length, args.force);
    std::cout << "Wrote " << args.length << "-byte key to " << args.output << "\n";
    return 0;
}

int RunInfo(int argc, char** argv) {
    InfoArgs args = ParseInfoArgs(argc, argv, 2);
    std::string password = cokacenc::keyfile::LoadKeyFile(args.key_file);
    PrintChunkInfo(cokacenc::inspect::InspectChunk(args.chunk, password));
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "pack") {
            return RunPack(argc, argv);
        }
        if (command == "unpack") {
            return RunUnpack(argc, argv);
        }
        if (command == "generate") {
            return RunGenerate(argc, argv);
        }
        if (command == "info") {
            return RunInfo(argc, argv);
        }
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        std::cerr << "Unknown command: " << command << "\n";
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << cli::BoldRed("Error:", std::cerr) << " " << exc.what() << "\n";
        return 1;
    }
}
