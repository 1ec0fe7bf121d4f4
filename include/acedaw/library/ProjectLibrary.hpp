#pragma once

#include "acedaw/audio/AudioBlobStore.hpp"
#include "acedaw/common/Clock.hpp"
#include "acedaw/project/ProjectRepository.hpp"
#include "acedaw/store/KeyValueStore.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::library {

struct StoredClipMix {
    std::string cumulativeKey;
    std::string isolatedKey;
};

/// Project-level operations that span the record and audio stores: creation,
/// touch-on-save, deletion with audio purge, archive export/import and
/// cumulative-mix isolation.
class ProjectLibrary {
public:
    explicit ProjectLibrary(store::KeyValueStore& store, common::Clock clock = common::currentEpochMillis);

    project::ProjectRepository& projects() { return projects_; }
    const project::ProjectRepository& projects() const { return projects_; }

    audio::AudioBlobStore& audio() { return audio_; }
    const audio::AudioBlobStore& audio() const { return audio_; }

    /// Fresh id, createdAt == updatedAt == now, no tracks. Saved before returning.
    std::expected<project::Project, std::string> createProject(std::string name);

    /// Refreshes updatedAt (never below createdAt), then overwrites the record.
    std::expected<void, std::string> saveProject(project::Project& project);

    /// Removes the record and every audio blob of the project. Idempotent.
    std::expected<void, std::string> deleteProject(std::string_view projectId);

    /// Bundles the project and all of its audio, blobs in ascending key order.
    std::expected<std::vector<uint8_t>, std::string> exportArchive(std::string_view projectId) const;

    /// Writes nothing unless the archive decodes completely and every blob key
    /// belongs to the archived project. A failed write restores what the
    /// import had already overwritten.
    std::expected<project::Project, std::string> importArchive(std::span<const uint8_t> archiveBytes);

    /// Stores a cumulative mix for clipId, then derives and stores the clip's
    /// isolated track against previousClipId's cumulative mix (if any).
    std::expected<StoredClipMix, std::string> storeClipMix(std::string_view projectId, std::string_view clipId,
                                                          std::span<const uint8_t> cumulativeWav,
                                                          std::optional<std::string_view> previousClipId = {});

private:
    store::KeyValueStore& store_;
    common::Clock clock_;
    project::ProjectRepository projects_;
    audio::AudioBlobStore audio_;
};

/// "<name>.acedaw" with everything outside [A-Za-z0-9 _-] dropped.
std::string archiveFileName(const project::Project& project);

}  // namespace acedaw::library
