#include "tabula/discovery/archive_index.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

using tabula::foundation::ErrorCode;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::discovery {

namespace {

constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;

constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kCentralDirectoryHeaderSize = 46;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

using Entries = std::vector<std::string>;

std::uint16_t ReadU16(const std::vector<char>& buffer, std::size_t offset) {
    return static_cast<std::uint16_t>(static_cast<std::uint8_t>(buffer[offset]) |
                                      (static_cast<std::uint8_t>(buffer[offset + 1]) << 8));
}

std::uint32_t ReadU32(const std::vector<char>& buffer, std::size_t offset) {
    return static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset])) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset + 1])) << 8) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset + 2])) << 16) |
           (static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset + 3])) << 24);
}

TabulaResult<Entries> fail(ErrorCode code, const fs::path& path, const std::string& what) {
    return TabulaResult<Entries>::err(
        TabulaError(code, "Archive '" + path.string() + "': " + what, path));
}

bool readAt(std::ifstream& in, std::uint64_t offset, std::vector<char>& buffer) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in) {
        return false;
    }
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    return in.gcount() == static_cast<std::streamsize>(buffer.size());
}

} // namespace

TabulaResult<Entries> listArchiveEntries(const fs::path& path) {
    std::error_code ec;
    const auto fileSize = fs::file_size(path, ec);
    if (ec) {
        return fail(ErrorCode::ArtifactOpenFailed, path, ec.message());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return fail(ErrorCode::ArtifactOpenFailed, path, "cannot open for reading");
    }
    if (fileSize < kEndOfCentralDirectorySize) {
        return fail(ErrorCode::ArtifactCorrupt, path, "too small to be an archive");
    }

    // The end record sits in the last 22 bytes plus an optional comment.
    const auto tailSize = static_cast<std::size_t>(
        std::min<std::uintmax_t>(fileSize, kEndOfCentralDirectorySize + kMaxCommentSize));
    const std::uint64_t tailOffset = fileSize - tailSize;
    std::vector<char> tail(tailSize);
    if (!readAt(in, tailOffset, tail)) {
        return fail(ErrorCode::ArtifactOpenFailed, path, "cannot read end of file");
    }

    std::size_t eocd = tailSize;
    for (std::size_t pos = tailSize - kEndOfCentralDirectorySize + 1; pos-- > 0;) {
        if (ReadU32(tail, pos) != kEndOfCentralDirectorySignature) {
            continue;
        }
        const std::size_t commentLength = ReadU16(tail, pos + 20);
        if (pos + kEndOfCentralDirectorySize + commentLength <= tailSize) {
            eocd = pos;
            break;
        }
    }
    if (eocd == tailSize) {
        return fail(ErrorCode::ArtifactCorrupt, path, "end of central directory not found");
    }

    const std::uint16_t diskNumber = ReadU16(tail, eocd + 4);
    const std::uint16_t directoryDisk = ReadU16(tail, eocd + 6);
    const std::uint16_t entriesOnDisk = ReadU16(tail, eocd + 8);
    const std::uint16_t totalEntries = ReadU16(tail, eocd + 10);
    const std::uint32_t directorySize = ReadU32(tail, eocd + 12);
    const std::uint32_t directoryOffset = ReadU32(tail, eocd + 16);

    if (totalEntries == 0xFFFFU || directorySize == 0xFFFFFFFFU ||
        directoryOffset == 0xFFFFFFFFU) {
        return fail(ErrorCode::ArtifactUnsupported, path, "ZIP64 archives are not supported");
    }
    if (diskNumber != 0 || directoryDisk != 0 || entriesOnDisk != totalEntries) {
        return fail(ErrorCode::ArtifactUnsupported, path,
                    "multi-disk archives are not supported");
    }

    const std::uint64_t eocdOffset = tailOffset + eocd;
    if (static_cast<std::uint64_t>(directoryOffset) + directorySize > eocdOffset) {
        return fail(ErrorCode::ArtifactCorrupt, path,
                    "central directory lies outside the archive");
    }

    std::vector<char> directory(directorySize);
    if (directorySize > 0 && !readAt(in, directoryOffset, directory)) {
        return fail(ErrorCode::ArtifactCorrupt, path, "truncated central directory");
    }

    Entries entries;
    entries.reserve(totalEntries);
    std::size_t cursor = 0;
    for (std::uint16_t i = 0; i < totalEntries; ++i) {
        if (cursor + kCentralDirectoryHeaderSize > directory.size()) {
            return fail(ErrorCode::ArtifactCorrupt, path,
                        "truncated central directory header " + std::to_string(i));
        }
        if (ReadU32(directory, cursor) != kCentralDirectoryHeaderSignature) {
            return fail(ErrorCode::ArtifactCorrupt, path,
                        "bad central directory signature at entry " + std::to_string(i));
        }
        const std::size_t nameLength = ReadU16(directory, cursor + 28);
        const std::size_t extraLength = ReadU16(directory, cursor + 30);
        const std::size_t commentLength = ReadU16(directory, cursor + 32);
        const std::size_t next =
            cursor + kCentralDirectoryHeaderSize + nameLength + extraLength + commentLength;
        if (next > directory.size()) {
            return fail(ErrorCode::ArtifactCorrupt, path,
                        "truncated central directory entry " + std::to_string(i));
        }

        std::string name(directory.data() + cursor + kCentralDirectoryHeaderSize, nameLength);
        if (!name.empty() && name.back() != '/') {
            entries.push_back(std::move(name));
        }
        cursor = next;
    }

    return TabulaResult<Entries>::ok(std::move(entries));
}

} // namespace tabula::discovery
