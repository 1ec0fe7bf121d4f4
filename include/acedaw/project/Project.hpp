#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::project {

/// A multi-track editing project. Tracks and every field other than the
/// identity/timestamps are editor state carried through unchanged.
struct Project {
    std::string id;
    std::string name;
    int64_t createdAt = 0;  // epoch ms
    int64_t updatedAt = 0;  // epoch ms, never less than createdAt
    std::vector<nlohmann::ordered_json> tracks;
    nlohmann::ordered_json extras = nlohmann::ordered_json::object();  // generationDefaults, ...

    bool operator==(const Project&) const = default;
};

/// Listing projection of a Project; computed on demand, never stored.
struct ProjectSummary {
    std::string id;
    std::string name;
    int64_t createdAt = 0;
    int64_t updatedAt = 0;
    size_t trackCount = 0;

    bool operator==(const ProjectSummary&) const = default;
};

ProjectSummary summarizeProject(const Project& project);

nlohmann::ordered_json projectToJson(const Project& project);

/// Requires a non-empty string "id" and an array "tracks". "name" and the
/// timestamps default when absent but must have the right type when present.
std::expected<Project, std::string> projectFromJson(const nlohmann::ordered_json& value);

std::expected<std::string, std::string> serializeProject(const Project& project);

std::expected<Project, std::string> parseProject(std::string_view text);

}  // namespace acedaw::project
