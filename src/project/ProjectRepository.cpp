#include "acedaw/project/ProjectRepository.hpp"

#include "acedaw/common/Logger.hpp"

#include <algorithm>
#include <format>
#include <span>
#include <utility>

namespace acedaw::project {
namespace {

std::expected<Project, std::string> decodeRecord(std::span<const uint8_t> bytes) {
    const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return parseProject(text);
}

}  // namespace

ProjectRepository::ProjectRepository(store::KeyValueStore& store) : store_(store) {}

std::string ProjectRepository::recordKey(std::string_view projectId) {
    return std::format("{}{}", kKeyPrefix, projectId);
}

std::expected<void, std::string> ProjectRepository::save(const Project& project) {
    if (project.id.empty()) {
        return std::unexpected("Cannot save a project without an id");
    }
    if (project.updatedAt < project.createdAt) {
        return std::unexpected(std::format("Cannot save project '{}' with updatedAt before createdAt", project.id));
    }

    auto text = serializeProject(project);
    if (!text.has_value()) {
        return std::unexpected(text.error());
    }

    const std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(text->data()), text->size());
    return store_.set(recordKey(project.id), bytes);
}

std::expected<std::optional<Project>, std::string> ProjectRepository::load(std::string_view projectId) const {
    const auto key = recordKey(projectId);
    auto stored = store_.get(key);
    if (!stored.has_value()) {
        return std::unexpected(stored.error());
    }
    if (!stored->has_value()) {
        return std::optional<Project>{};
    }

    auto project = decodeRecord(**stored);
    if (!project.has_value()) {
        return std::unexpected(std::format("Project record '{}' is corrupt: {}", key, project.error()));
    }
    return std::optional<Project>{std::move(*project)};
}

std::expected<void, std::string> ProjectRepository::remove(std::string_view projectId) {
    return store_.remove(recordKey(projectId));
}

std::expected<ProjectListing, std::string> ProjectRepository::list() const {
    auto keys = store_.listKeys();
    if (!keys.has_value()) {
        return std::unexpected(keys.error());
    }

    ProjectListing listing;
    for (const auto& key : *keys) {
        if (!key.starts_with(kKeyPrefix)) {
            continue;
        }

        auto stored = store_.get(key);
        if (!stored.has_value()) {
            return std::unexpected(stored.error());
        }
        if (!stored->has_value()) {
            // Removed between listKeys() and get().
            continue;
        }

        auto project = decodeRecord(**stored);
        if (!project.has_value()) {
            common::Logger::logWarning(std::format("Skipping corrupt project record '{}': {}", key, project.error()));
            listing.skippedKeys.push_back(key);
            continue;
        }
        listing.summaries.push_back(summarizeProject(*project));
    }

    std::sort(listing.summaries.begin(), listing.summaries.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.updatedAt != rhs.updatedAt) {
            return lhs.updatedAt > rhs.updatedAt;
        }
        return lhs.id < rhs.id;
    });
    std::sort(listing.skippedKeys.begin(), listing.skippedKeys.end());
    return listing;
}

}  // namespace acedaw::project
