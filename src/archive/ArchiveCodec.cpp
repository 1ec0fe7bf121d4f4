#include "acedaw/archive/ArchiveCodec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <limits>
#include <optional>
#include <utility>

using json = nlohmann::ordered_json;

namespace acedaw::archive {
namespace {

struct ManifestRegion {
    ArchiveManifest manifest;
    size_t payloadStart = 0;
};

ArchiveError makeError(ArchiveErrorKind kind, std::string message) {
    return ArchiveError{kind, std::move(message)};
}

void appendU32Le(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 24u) & 0xFFu));
}

uint32_t readU32Le(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) | (static_cast<uint32_t>(bytes[offset + 1u]) << 8u) |
           (static_cast<uint32_t>(bytes[offset + 2u]) << 16u) | (static_cast<uint32_t>(bytes[offset + 3u]) << 24u);
}

std::optional<uint64_t> parseU64(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<int64_t>();
        if (raw < 0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(raw);
    }
    return std::nullopt;
}

std::optional<int> parseVersion(const json& value) {
    if (!value.is_number_integer() && !value.is_number_unsigned()) {
        return std::nullopt;
    }
    const auto raw = value.get<int64_t>();
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(raw);
}

std::expected<std::vector<ArchiveFileRecord>, ArchiveError> parseFileTable(const json& files) {
    if (!files.is_array()) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest, "Archive file table must be an array"));
    }

    std::vector<ArchiveFileRecord> records;
    records.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        const json& entry = files[i];
        if (!entry.is_object()) {
            return std::unexpected(
                makeError(ArchiveErrorKind::InvalidManifest, std::format("Archive file entry {} is not an object", i)));
        }

        const auto keyIt = entry.find("key");
        const auto offsetIt = entry.find("offset");
        const auto sizeIt = entry.find("size");
        if (keyIt == entry.end() || !keyIt->is_string()) {
            return std::unexpected(
                makeError(ArchiveErrorKind::InvalidManifest, std::format("Archive file entry {} has no key", i)));
        }
        const auto offset = offsetIt != entry.end() ? parseU64(*offsetIt) : std::nullopt;
        const auto size = sizeIt != entry.end() ? parseU64(*sizeIt) : std::nullopt;
        if (!offset.has_value() || !size.has_value()) {
            return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest,
                                             std::format("Archive file entry {} has an invalid offset or size", i)));
        }

        records.push_back(ArchiveFileRecord{keyIt->get<std::string>(), *offset, *size});
    }
    return records;
}

std::expected<ManifestRegion, ArchiveError> readManifestRegion(std::span<const uint8_t> bytes) {
    if (bytes.size() < kArchiveMagic.size() ||
        !std::equal(kArchiveMagic.begin(), kArchiveMagic.end(), bytes.begin(),
                    [](char expected, uint8_t actual) { return static_cast<uint8_t>(expected) == actual; })) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidFormat, "Not a valid .acedaw archive"));
    }
    if (bytes.size() < kArchiveHeaderSize) {
        return std::unexpected(makeError(ArchiveErrorKind::TruncatedArchive, "Archive header is truncated"));
    }

    const uint32_t manifestLength = readU32Le(bytes, kArchiveMagic.size());
    if (manifestLength > bytes.size() - kArchiveHeaderSize) {
        return std::unexpected(makeError(
            ArchiveErrorKind::TruncatedArchive,
            std::format("Archive manifest length {} exceeds the {} bytes available", manifestLength,
                        bytes.size() - kArchiveHeaderSize)));
    }

    const auto manifestBytes = bytes.subspan(kArchiveHeaderSize, manifestLength);
    json root;
    try {
        root = json::parse(manifestBytes.begin(), manifestBytes.end());
    } catch (const json::exception& ex) {
        return std::unexpected(
            makeError(ArchiveErrorKind::InvalidFormat, std::format("Archive manifest is not valid JSON: {}", ex.what())));
    }

    if (!root.is_object()) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest, "Archive manifest must be an object"));
    }

    // Version gates everything else in the manifest.
    const auto versionIt = root.find("version");
    const auto version = versionIt != root.end() ? parseVersion(*versionIt) : std::nullopt;
    if (!version.has_value()) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest, "Archive manifest has no version"));
    }
    if (*version != kArchiveFormatVersion) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest,
                                         std::format("Unsupported archive version {}", *version)));
    }

    const auto projectIt = root.find("project");
    if (projectIt == root.end()) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest, "Archive manifest has no project"));
    }
    auto project = project::projectFromJson(*projectIt);
    if (!project.has_value()) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest,
                                         std::format("Invalid archive manifest: {}", project.error())));
    }

    const auto filesIt = root.find("files");
    if (filesIt == root.end()) {
        return std::unexpected(makeError(ArchiveErrorKind::InvalidManifest, "Archive manifest has no file table"));
    }
    auto files = parseFileTable(*filesIt);
    if (!files.has_value()) {
        return std::unexpected(files.error());
    }

    ManifestRegion region;
    region.manifest.version = *version;
    region.manifest.project = std::move(*project);
    region.manifest.files = std::move(*files);
    region.payloadStart = kArchiveHeaderSize + manifestLength;
    return region;
}

}  // namespace

std::string_view archiveErrorKindName(ArchiveErrorKind kind) {
    switch (kind) {
    case ArchiveErrorKind::InvalidFormat:
        return "InvalidFormat";
    case ArchiveErrorKind::InvalidManifest:
        return "InvalidManifest";
    case ArchiveErrorKind::TruncatedArchive:
        return "TruncatedArchive";
    }
    return "Unknown";
}

std::vector<ArchiveFileRecord> buildFileTable(std::span<const ArchiveEntry> entries) {
    std::vector<ArchiveFileRecord> table;
    table.reserve(entries.size());
    uint64_t offset = 0;
    for (const auto& entry : entries) {
        table.push_back(ArchiveFileRecord{entry.key, offset, static_cast<uint64_t>(entry.payload.size())});
        offset += entry.payload.size();
    }
    return table;
}

std::expected<std::vector<uint8_t>, std::string> encodeArchive(const project::Project& project,
                                                               std::span<const ArchiveEntry> entries) {
    const auto fileTable = buildFileTable(entries);

    json files = json::array();
    for (const auto& record : fileTable) {
        files.push_back(json{
            {"key", record.key},
            {"offset", record.offset},
            {"size", record.size},
        });
    }

    json manifest = json::object();
    manifest["version"] = kArchiveFormatVersion;
    manifest["project"] = project::projectToJson(project);
    manifest["files"] = std::move(files);

    std::string manifestText;
    try {
        manifestText = manifest.dump();
    } catch (const json::exception& ex) {
        return std::unexpected(std::format("Failed to serialize archive manifest: {}", ex.what()));
    }
    if (manifestText.size() > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected("Archive manifest is larger than 4 GiB");
    }

    const uint64_t payloadBytes = fileTable.empty() ? 0 : fileTable.back().offset + fileTable.back().size;
    std::vector<uint8_t> out;
    out.reserve(kArchiveHeaderSize + manifestText.size() + static_cast<size_t>(payloadBytes));

    out.insert(out.end(), kArchiveMagic.begin(), kArchiveMagic.end());
    appendU32Le(out, static_cast<uint32_t>(manifestText.size()));
    out.insert(out.end(), manifestText.begin(), manifestText.end());
    for (const auto& entry : entries) {
        out.insert(out.end(), entry.payload.begin(), entry.payload.end());
    }
    return out;
}

std::expected<ArchiveManifest, ArchiveError> readArchiveManifest(std::span<const uint8_t> bytes) {
    auto region = readManifestRegion(bytes);
    if (!region.has_value()) {
        return std::unexpected(region.error());
    }
    return std::move(region->manifest);
}

std::expected<DecodedArchive, ArchiveError> decodeArchive(std::span<const uint8_t> bytes) {
    auto region = readManifestRegion(bytes);
    if (!region.has_value()) {
        return std::unexpected(region.error());
    }

    const auto payload = bytes.subspan(region->payloadStart);
    DecodedArchive decoded;
    decoded.entries.reserve(region->manifest.files.size());
    for (const auto& record : region->manifest.files) {
        if (record.offset > payload.size() || record.size > payload.size() - record.offset) {
            return std::unexpected(makeError(
                ArchiveErrorKind::TruncatedArchive,
                std::format("Archive entry '{}' spans bytes {}..{} but the payload region holds {}", record.key,
                            record.offset, record.offset + record.size, payload.size())));
        }

        const auto slice = payload.subspan(static_cast<size_t>(record.offset), static_cast<size_t>(record.size));
        decoded.entries.push_back(ArchiveEntry{record.key, std::vector<uint8_t>(slice.begin(), slice.end())});
    }

    decoded.project = std::move(region->manifest.project);
    return decoded;
}

}  // namespace acedaw::archive
