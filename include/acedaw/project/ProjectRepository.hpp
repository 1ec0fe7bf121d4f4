#pragma once

#include "acedaw/project/Project.hpp"
#include "acedaw/store/KeyValueStore.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::project {

struct ProjectListing {
    std::vector<ProjectSummary> summaries;  // most recently updated first
    std::vector<std::string> skippedKeys;   // records that failed to parse
};

/// Project records stored as JSON under "project:<id>".
class ProjectRepository {
public:
    static constexpr std::string_view kKeyPrefix = "project:";

    explicit ProjectRepository(store::KeyValueStore& store);

    static std::string recordKey(std::string_view projectId);

    /// Full overwrite of the stored record.
    std::expected<void, std::string> save(const Project& project);

    /// std::nullopt when no record exists; an error when the record is corrupt.
    std::expected<std::optional<Project>, std::string> load(std::string_view projectId) const;

    std::expected<void, std::string> remove(std::string_view projectId);

    /// Corrupt records are skipped and reported in ProjectListing::skippedKeys.
    std::expected<ProjectListing, std::string> list() const;

private:
    store::KeyValueStore& store_;
};

}  // namespace acedaw::project
