#pragma once

#include "acedaw/project/Project.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::archive {

// Layout of a .acedaw archive:
//   [4 bytes]  magic "ACED"
//   [4 bytes]  manifest length L, uint32 little-endian
//   [L bytes]  manifest, UTF-8 JSON {version, project, files: [{key, offset, size}]}
//   [...]      payloads concatenated in file-table order, offsets relative to here

inline constexpr std::string_view kArchiveMagic = "ACED";
inline constexpr size_t kArchiveHeaderSize = 8;
inline constexpr int kArchiveFormatVersion = 1;
inline constexpr std::string_view kArchiveFileExtension = ".acedaw";

enum class ArchiveErrorKind : uint8_t {
    InvalidFormat,     // bad magic or manifest text that is not JSON
    InvalidManifest,   // JSON of the wrong shape or an unknown version
    TruncatedArchive,  // header or file table points past the end of the buffer
};

struct ArchiveError {
    ArchiveErrorKind kind = ArchiveErrorKind::InvalidFormat;
    std::string message;
};

std::string_view archiveErrorKindName(ArchiveErrorKind kind);

struct ArchiveEntry {
    std::string key;
    std::vector<uint8_t> payload;

    bool operator==(const ArchiveEntry&) const = default;
};

struct ArchiveFileRecord {
    std::string key;
    uint64_t offset = 0;
    uint64_t size = 0;

    bool operator==(const ArchiveFileRecord&) const = default;
};

struct ArchiveManifest {
    int version = kArchiveFormatVersion;
    project::Project project;
    std::vector<ArchiveFileRecord> files;
};

struct DecodedArchive {
    project::Project project;
    std::vector<ArchiveEntry> entries;  // file-table order
};

/// Offsets are the running sum of the preceding payload sizes, starting at 0.
std::vector<ArchiveFileRecord> buildFileTable(std::span<const ArchiveEntry> entries);

/// Entries are written in the given order without reordering or deduplication.
std::expected<std::vector<uint8_t>, std::string> encodeArchive(const project::Project& project,
                                                               std::span<const ArchiveEntry> entries);

/// Validates the header and manifest only; payload ranges are not checked.
std::expected<ArchiveManifest, ArchiveError> readArchiveManifest(std::span<const uint8_t> bytes);

/// Pure transform: nothing is written anywhere.
std::expected<DecodedArchive, ArchiveError> decodeArchive(std::span<const uint8_t> bytes);

}  // namespace acedaw::archive
