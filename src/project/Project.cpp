#include "acedaw/project/Project.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <utility>

using json = nlohmann::ordered_json;

namespace acedaw::project {
namespace {

constexpr const char* kIdField = "id";
constexpr const char* kNameField = "name";
constexpr const char* kCreatedAtField = "createdAt";
constexpr const char* kUpdatedAtField = "updatedAt";
constexpr const char* kTracksField = "tracks";

bool isCoreField(std::string_view key) {
    return key == kIdField || key == kNameField || key == kCreatedAtField || key == kUpdatedAtField ||
           key == kTracksField;
}

std::optional<int64_t> parseTimestamp(const json& value) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        // Some writers emit whole-millisecond timestamps as doubles.
        const double raw = value.get<double>();
        if (!std::isfinite(raw) || std::trunc(raw) != raw || std::fabs(raw) > 9.0e15) {
            return std::nullopt;
        }
        return static_cast<int64_t>(raw);
    }
    return std::nullopt;
}

std::expected<int64_t, std::string> readTimestamp(const json& root, const char* field) {
    const auto it = root.find(field);
    if (it == root.end()) {
        return int64_t{0};
    }
    const auto parsed = parseTimestamp(*it);
    if (!parsed.has_value()) {
        return std::unexpected(std::format("Project {} must be an integer timestamp", field));
    }
    return *parsed;
}

}  // namespace

ProjectSummary summarizeProject(const Project& project) {
    return ProjectSummary{
        .id = project.id,
        .name = project.name,
        .createdAt = project.createdAt,
        .updatedAt = project.updatedAt,
        .trackCount = project.tracks.size(),
    };
}

json projectToJson(const Project& project) {
    json root = json::object();
    root[kIdField] = project.id;
    root[kNameField] = project.name;
    root[kCreatedAtField] = project.createdAt;
    root[kUpdatedAtField] = project.updatedAt;

    json tracks = json::array();
    for (const auto& track : project.tracks) {
        tracks.push_back(track);
    }
    root[kTracksField] = std::move(tracks);

    if (project.extras.is_object()) {
        for (const auto& [key, value] : project.extras.items()) {
            if (!isCoreField(key)) {
                root[key] = value;
            }
        }
    }
    return root;
}

std::expected<Project, std::string> projectFromJson(const json& value) {
    if (!value.is_object()) {
        return std::unexpected("Project payload must be an object");
    }

    const auto idIt = value.find(kIdField);
    if (idIt == value.end() || !idIt->is_string() || idIt->get_ref<const std::string&>().empty()) {
        return std::unexpected("Project is missing its id");
    }

    const auto tracksIt = value.find(kTracksField);
    if (tracksIt == value.end() || !tracksIt->is_array()) {
        return std::unexpected("Project tracks must be an array");
    }

    Project project;
    project.id = idIt->get<std::string>();

    if (const auto nameIt = value.find(kNameField); nameIt != value.end()) {
        if (!nameIt->is_string()) {
            return std::unexpected("Project name must be a string");
        }
        project.name = nameIt->get<std::string>();
    }

    auto createdAt = readTimestamp(value, kCreatedAtField);
    if (!createdAt.has_value()) {
        return std::unexpected(createdAt.error());
    }
    auto updatedAt = readTimestamp(value, kUpdatedAtField);
    if (!updatedAt.has_value()) {
        return std::unexpected(updatedAt.error());
    }
    if (*updatedAt < *createdAt) {
        return std::unexpected(
            std::format("Project updatedAt {} is earlier than createdAt {}", *updatedAt, *createdAt));
    }
    project.createdAt = *createdAt;
    project.updatedAt = *updatedAt;

    project.tracks.reserve(tracksIt->size());
    for (const auto& track : *tracksIt) {
        project.tracks.push_back(track);
    }

    for (const auto& [key, field] : value.items()) {
        if (!isCoreField(key)) {
            project.extras[key] = field;
        }
    }
    return project;
}

std::expected<std::string, std::string> serializeProject(const Project& project) {
    try {
        return projectToJson(project).dump();
    } catch (const json::exception& ex) {
        return std::unexpected(std::format("Failed to serialize project '{}': {}", project.id, ex.what()));
    }
}

std::expected<Project, std::string> parseProject(std::string_view text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& ex) {
        return std::unexpected(std::format("Failed to parse project record: {}", ex.what()));
    }
    return projectFromJson(root);
}

}  // namespace acedaw::project
