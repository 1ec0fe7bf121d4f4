#include "acedaw/library/ProjectLibrary.hpp"

#include "acedaw/archive/ArchiveCodec.hpp"
#include "acedaw/audio/TrackIsolator.hpp"
#include "acedaw/audio/WavCodec.hpp"
#include "acedaw/common/Logger.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace acedaw::library {
namespace {

/// Value a key held before an import overwrote it; std::nullopt if it was absent.
struct PriorValue {
    std::string key;
    std::optional<std::vector<uint8_t>> value;
};

void restorePriorValues(store::KeyValueStore& store, const std::vector<PriorValue>& priorValues) {
    for (auto it = priorValues.rbegin(); it != priorValues.rend(); ++it) {
        const auto restored = it->value.has_value() ? store.set(it->key, *it->value) : store.remove(it->key);
        if (!restored.has_value()) {
            common::Logger::logError(
                std::format("Failed to roll back '{}' after an interrupted import: {}", it->key, restored.error()));
        }
    }
}

std::string archiveFailure(const archive::ArchiveError& error) {
    return std::format("{}: {}", archive::archiveErrorKindName(error.kind), error.message);
}

bool isValidAudioComponent(std::string_view value) {
    return !value.empty() && value.find(audio::kAudioKeyDelimiter) == std::string_view::npos;
}

}  // namespace

ProjectLibrary::ProjectLibrary(store::KeyValueStore& store, common::Clock clock)
    : store_(store), clock_(std::move(clock)), projects_(store), audio_(store) {}

std::expected<project::Project, std::string> ProjectLibrary::createProject(std::string name) {
    project::Project project;
    project.id = common::generateUuid();
    project.name = std::move(name);
    project.createdAt = clock_();
    project.updatedAt = project.createdAt;

    if (auto saved = projects_.save(project); !saved.has_value()) {
        return std::unexpected(saved.error());
    }
    common::Logger::log(std::format("Created project '{}' ({})", project.name, project.id));
    return project;
}

std::expected<void, std::string> ProjectLibrary::saveProject(project::Project& project) {
    project.updatedAt = std::max(clock_(), project.createdAt);
    return projects_.save(project);
}

std::expected<void, std::string> ProjectLibrary::deleteProject(std::string_view projectId) {
    // Ids that cannot appear in an audio key have no audio to purge.
    if (isValidAudioComponent(projectId)) {
        auto removed = audio_.removeAllForProject(projectId);
        if (!removed.has_value()) {
            return std::unexpected(removed.error());
        }
        if (*removed > 0) {
            common::Logger::log(std::format("Removed {} audio blobs of project {}", *removed, projectId));
        }
    }
    return projects_.remove(projectId);
}

std::expected<std::vector<uint8_t>, std::string> ProjectLibrary::exportArchive(std::string_view projectId) const {
    auto loaded = projects_.load(projectId);
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    if (!loaded->has_value()) {
        return std::unexpected(std::format("Project '{}' does not exist", projectId));
    }
    const project::Project& project = **loaded;

    std::vector<archive::ArchiveEntry> entries;
    if (isValidAudioComponent(project.id)) {
        auto keys = audio_.keysForProject(project.id);
        if (!keys.has_value()) {
            return std::unexpected(keys.error());
        }

        entries.reserve(keys->size());
        for (auto& key : *keys) {
            auto payload = audio_.loadByKey(key);
            if (!payload.has_value()) {
                return std::unexpected(payload.error());
            }
            if (!payload->has_value()) {
                // Deleted between listing and reading.
                continue;
            }
            entries.push_back(archive::ArchiveEntry{std::move(key), std::move(**payload)});
        }
    }

    auto bytes = archive::encodeArchive(project, entries);
    if (!bytes.has_value()) {
        common::Logger::logError(std::format("Export of project {} failed: {}", project.id, bytes.error()));
        return std::unexpected(bytes.error());
    }
    common::Logger::log(std::format("Exported project {} with {} audio blobs ({} bytes)", project.id, entries.size(),
                                    bytes->size()));
    return bytes;
}

std::expected<project::Project, std::string> ProjectLibrary::importArchive(std::span<const uint8_t> archiveBytes) {
    auto decoded = archive::decodeArchive(archiveBytes);
    if (!decoded.has_value()) {
        const auto message = archiveFailure(decoded.error());
        common::Logger::logError(std::format("Archive import rejected: {}", message));
        return std::unexpected(message);
    }

    const project::Project& project = decoded->project;
    std::vector<audio::AudioBlobKey> blobKeys;
    blobKeys.reserve(decoded->entries.size());
    for (const auto& entry : decoded->entries) {
        auto blobKey = audio::parseAudioBlobKey(entry.key);
        if (!blobKey.has_value() || blobKey->projectId != project.id) {
            const auto message =
                archiveFailure(archive::ArchiveError{archive::ArchiveErrorKind::InvalidManifest,
                                                     std::format("Archive entry '{}' is not an audio key of project '{}'",
                                                                 entry.key, project.id)});
            common::Logger::logError(std::format("Archive import rejected: {}", message));
            return std::unexpected(message);
        }
        blobKeys.push_back(std::move(*blobKey));
    }

    std::vector<PriorValue> priorValues;
    priorValues.reserve(decoded->entries.size() + 1u);
    const auto snapshot = [&](const std::string& key) -> std::expected<void, std::string> {
        auto prior = store_.get(key);
        if (!prior.has_value()) {
            return std::unexpected(prior.error());
        }
        priorValues.push_back(PriorValue{key, std::move(*prior)});
        return {};
    };
    const auto fail = [&](const std::string& message) -> std::expected<project::Project, std::string> {
        restorePriorValues(store_, priorValues);
        common::Logger::logError(std::format("Archive import of project {} failed: {}", project.id, message));
        return std::unexpected(message);
    };

    for (size_t i = 0; i < decoded->entries.size(); ++i) {
        if (auto saved = snapshot(decoded->entries[i].key); !saved.has_value()) {
            return fail(saved.error());
        }
        if (auto saved = audio_.save(blobKeys[i], decoded->entries[i].payload); !saved.has_value()) {
            return fail(saved.error());
        }
    }

    if (auto saved = snapshot(project::ProjectRepository::recordKey(project.id)); !saved.has_value()) {
        return fail(saved.error());
    }
    if (auto saved = projects_.save(project); !saved.has_value()) {
        return fail(saved.error());
    }

    common::Logger::log(std::format("Imported project '{}' ({}) with {} audio blobs", project.name, project.id,
                                    decoded->entries.size()));
    return std::move(decoded->project);
}

std::expected<StoredClipMix, std::string> ProjectLibrary::storeClipMix(std::string_view projectId,
                                                                      std::string_view clipId,
                                                                      std::span<const uint8_t> cumulativeWav,
                                                                      std::optional<std::string_view> previousClipId) {
    const audio::AudioBlobKey cumulativeKey{std::string(projectId), std::string(clipId), audio::AudioVariant::Cumulative};
    const audio::AudioBlobKey isolatedKey{std::string(projectId), std::string(clipId), audio::AudioVariant::Isolated};

    auto currentMix = audio::decodeWav(cumulativeWav);
    if (!currentMix.has_value()) {
        return std::unexpected(std::format("Cumulative mix for clip '{}' is unreadable: {}", clipId, currentMix.error()));
    }

    std::optional<audio::AudioBuffer> previousMix;
    if (previousClipId.has_value()) {
        auto previousBytes = audio_.load(
            audio::AudioBlobKey{std::string(projectId), std::string(*previousClipId), audio::AudioVariant::Cumulative});
        if (!previousBytes.has_value()) {
            return std::unexpected(previousBytes.error());
        }
        if (previousBytes->has_value()) {
            auto decodedPrevious = audio::decodeWav(**previousBytes);
            if (!decodedPrevious.has_value()) {
                return std::unexpected(std::format("Cumulative mix for clip '{}' is unreadable: {}", *previousClipId,
                                                   decodedPrevious.error()));
            }
            previousMix = std::move(*decodedPrevious);
        } else {
            common::Logger::logWarning(std::format(
                "No cumulative mix stored for previous clip '{}'; treating clip '{}' as the first layer",
                *previousClipId, clipId));
        }
    }

    const auto isolated = audio::isolateTrack(*currentMix, previousMix.has_value() ? &*previousMix : nullptr);
    auto isolatedWav = audio::encodeWav(isolated);
    if (!isolatedWav.has_value()) {
        return std::unexpected(isolatedWav.error());
    }

    StoredClipMix stored;
    auto savedCumulative = audio_.save(cumulativeKey, cumulativeWav);
    if (!savedCumulative.has_value()) {
        return std::unexpected(savedCumulative.error());
    }
    stored.cumulativeKey = std::move(*savedCumulative);

    auto savedIsolated = audio_.save(isolatedKey, *isolatedWav);
    if (!savedIsolated.has_value()) {
        return std::unexpected(savedIsolated.error());
    }
    stored.isolatedKey = std::move(*savedIsolated);
    return stored;
}

std::string archiveFileName(const project::Project& project) {
    std::string stem;
    stem.reserve(project.name.size());
    for (const char c : project.name) {
        const bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == ' ' ||
                          c == '_' || c == '-';
        if (keep) {
            stem.push_back(c);
        }
    }
    if (stem.empty()) {
        stem = "untitled";
    }
    return std::format("{}{}", stem, archive::kArchiveFileExtension);
}

}  // namespace acedaw::library
