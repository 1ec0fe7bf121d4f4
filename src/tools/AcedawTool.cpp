#include "acedaw/archive/ArchiveCodec.hpp"
#include "acedaw/common/Logger.hpp"
#include "acedaw/common/Paths.hpp"
#include "acedaw/library/LibraryConfig.hpp"
#include "acedaw/library/ProjectLibrary.hpp"
#include "acedaw/store/DirectoryKeyValueStore.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::tools {
namespace {

enum class Command : uint8_t {
    List,
    Create,
    Show,
    Delete,
    Export,
    Import,
    Inspect,
    StoreMix,
};

struct ToolOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> storeDirOverride;
    std::optional<std::filesystem::path> outputPath;
    std::optional<std::string> previousClipId;
    Command command = Command::List;
    std::vector<std::string> arguments;
};

struct CommandSpec {
    std::string_view name;
    Command command;
    size_t argumentCount;
};

constexpr CommandSpec kCommands[] = {
    {"list", Command::List, 0},     {"create", Command::Create, 1},   {"show", Command::Show, 1},
    {"delete", Command::Delete, 1}, {"export", Command::Export, 1},   {"import", Command::Import, 1},
    {"inspect", Command::Inspect, 1}, {"store-mix", Command::StoreMix, 3},
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [--config <file>] [--store <dir>] <command> [args]\n";
    out << "\nCommands:\n";
    out << "  list                                   List projects, most recently updated first\n";
    out << "  create <name>                          Create an empty project and print its id\n";
    out << "  show <projectId>                       Print the stored project record\n";
    out << "  delete <projectId>                     Delete a project and all of its audio\n";
    out << "  export <projectId> [--out <file>]      Write a .acedaw archive (default: <name>.acedaw)\n";
    out << "  import <file.acedaw>                   Import a .acedaw archive into the store\n";
    out << "  inspect <file.acedaw>                  Print an archive's manifest without importing it\n";
    out << "  store-mix <projectId> <clipId> <file.wav> [--previous-clip <clipId>]\n";
    out << "                                         Store a cumulative mix and its isolated track\n";
    out << "\nOptions:\n";
    out << "  --config        Config file (default: user config directory)\n";
    out << "  --store         Store directory, overrides the config file\n";
    out << "  --help, -h      Show this help\n";
}

std::expected<std::vector<uint8_t>, std::string> readBinaryFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), {});
}

std::expected<void, std::string> writeBinaryFile(const std::filesystem::path& path, std::span<const uint8_t> bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open '{}' for writing", path.string()));
    }
    if (!bytes.empty()) {
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!out.good()) {
        return std::unexpected(std::format("Failed while writing '{}'", path.string()));
    }
    return {};
}

std::expected<ToolOptions, std::string> parseArgs(int argc, char** argv) {
    ToolOptions options;
    std::optional<std::string_view> commandName;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argc > 0 ? argv[0] : "acedaw_tool");
            std::exit(0);
        }
        if (arg == "--config") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.configPath = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--store") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.storeDirOverride = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--out") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.outputPath = std::filesystem::path(*value);
            continue;
        }
        if (arg == "--previous-clip") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.previousClipId = *value;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        if (!commandName.has_value()) {
            commandName = arg;
            continue;
        }
        options.arguments.emplace_back(arg);
    }

    if (!commandName.has_value()) {
        return std::unexpected("Missing command");
    }

    const CommandSpec* spec = nullptr;
    for (const auto& candidate : kCommands) {
        if (candidate.name == *commandName) {
            spec = &candidate;
            break;
        }
    }
    if (spec == nullptr) {
        return std::unexpected(std::format("Unknown command '{}'", *commandName));
    }
    if (options.arguments.size() != spec->argumentCount) {
        return std::unexpected(std::format("'{}' expects {} argument(s), got {}", spec->name, spec->argumentCount,
                                           options.arguments.size()));
    }
    if (options.outputPath.has_value() && spec->command != Command::Export) {
        return std::unexpected("--out is only valid with 'export'");
    }
    if (options.previousClipId.has_value() && spec->command != Command::StoreMix) {
        return std::unexpected("--previous-clip is only valid with 'store-mix'");
    }

    options.command = spec->command;
    return options;
}

std::string formatTimestamp(int64_t epochMillis) {
    const std::chrono::sys_time<std::chrono::milliseconds> time{std::chrono::milliseconds(epochMillis)};
    return std::format("{:%Y-%m-%d %H:%M:%S} UTC", std::chrono::floor<std::chrono::seconds>(time));
}

std::expected<void, std::string> runList(library::ProjectLibrary& library) {
    auto listing = library.projects().list();
    if (!listing.has_value()) {
        return std::unexpected(listing.error());
    }

    if (listing->summaries.empty()) {
        std::cout << "No projects.\n";
    }
    for (const auto& summary : listing->summaries) {
        std::cout << std::format("{}  {:<32}  {} track(s)  updated {}\n", summary.id, summary.name,
                                 summary.trackCount, formatTimestamp(summary.updatedAt));
    }
    for (const auto& key : listing->skippedKeys) {
        std::cerr << std::format("Warning: skipped unreadable record '{}'\n", key);
    }
    return {};
}

std::expected<void, std::string> runShow(library::ProjectLibrary& library, const std::string& projectId) {
    auto loaded = library.projects().load(projectId);
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    if (!loaded->has_value()) {
        return std::unexpected(std::format("Project '{}' does not exist", projectId));
    }
    std::cout << project::projectToJson(**loaded).dump(2) << '\n';
    return {};
}

std::expected<void, std::string> runExport(library::ProjectLibrary& library, const std::string& projectId,
                                           const std::optional<std::filesystem::path>& outputPath) {
    auto loaded = library.projects().load(projectId);
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    if (!loaded->has_value()) {
        return std::unexpected(std::format("Project '{}' does not exist", projectId));
    }

    auto bytes = library.exportArchive(projectId);
    if (!bytes.has_value()) {
        return std::unexpected(bytes.error());
    }

    const auto path = outputPath.value_or(std::filesystem::path(library::archiveFileName(**loaded)));
    if (auto written = writeBinaryFile(path, *bytes); !written.has_value()) {
        return written;
    }
    std::cout << std::format("Wrote '{}' ({} bytes)\n", path.string(), bytes->size());
    return {};
}

std::expected<void, std::string> runImport(library::ProjectLibrary& library, const std::filesystem::path& path) {
    auto bytes = readBinaryFile(path);
    if (!bytes.has_value()) {
        return std::unexpected(bytes.error());
    }
    auto project = library.importArchive(*bytes);
    if (!project.has_value()) {
        return std::unexpected(project.error());
    }
    std::cout << project->id << '\n';
    return {};
}

std::expected<void, std::string> runInspect(const std::filesystem::path& path) {
    auto bytes = readBinaryFile(path);
    if (!bytes.has_value()) {
        return std::unexpected(bytes.error());
    }
    auto manifest = archive::readArchiveManifest(*bytes);
    if (!manifest.has_value()) {
        return std::unexpected(std::format("{}: {}", archive::archiveErrorKindName(manifest.error().kind),
                                           manifest.error().message));
    }

    std::cout << std::format("Archive version {}\n", manifest->version);
    std::cout << std::format("Project {} '{}' ({} track(s))\n", manifest->project.id, manifest->project.name,
                             manifest->project.tracks.size());
    for (const auto& record : manifest->files) {
        std::cout << std::format("  {:>10}  {:>10}  {}\n", record.offset, record.size, record.key);
    }
    return {};
}

std::expected<void, std::string> runStoreMix(library::ProjectLibrary& library, const ToolOptions& options) {
    auto wav = readBinaryFile(options.arguments[2]);
    if (!wav.has_value()) {
        return std::unexpected(wav.error());
    }

    std::optional<std::string_view> previousClipId;
    if (options.previousClipId.has_value()) {
        previousClipId = *options.previousClipId;
    }
    auto stored = library.storeClipMix(options.arguments[0], options.arguments[1], *wav, previousClipId);
    if (!stored.has_value()) {
        return std::unexpected(stored.error());
    }
    std::cout << stored->cumulativeKey << '\n' << stored->isolatedKey << '\n';
    return {};
}

std::expected<void, std::string> run(const ToolOptions& options) {
    const auto configPath = options.configPath.value_or(common::userConfigPath());
    auto config = library::loadLibraryConfig(configPath);
    if (!config.has_value()) {
        return std::unexpected(config.error());
    }
    if (options.storeDirOverride.has_value()) {
        config->storeDirectory = *options.storeDirOverride;
    }
    if (config->logFile.has_value() && !common::Logger::init(*config->logFile)) {
        std::cerr << std::format("Warning: could not open log file '{}'\n", config->logFile->string());
    }

    if (options.command == Command::Inspect) {
        return runInspect(options.arguments[0]);
    }

    auto store = store::DirectoryKeyValueStore::open(config->storeDirectory);
    if (!store.has_value()) {
        return std::unexpected(store.error());
    }
    library::ProjectLibrary library(*store);

    switch (options.command) {
    case Command::List:
        return runList(library);
    case Command::Create: {
        auto project = library.createProject(options.arguments[0]);
        if (!project.has_value()) {
            return std::unexpected(project.error());
        }
        std::cout << project->id << '\n';
        return {};
    }
    case Command::Show:
        return runShow(library, options.arguments[0]);
    case Command::Delete:
        return library.deleteProject(options.arguments[0]);
    case Command::Export:
        return runExport(library, options.arguments[0], options.outputPath);
    case Command::Import:
        return runImport(library, options.arguments[0]);
    case Command::StoreMix:
        return runStoreMix(library, options);
    case Command::Inspect:
        break;
    }
    return {};
}

}  // namespace
}  // namespace acedaw::tools

int main(int argc, char** argv) {
    auto options = acedaw::tools::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        acedaw::tools::printUsage(std::cerr, argc > 0 ? argv[0] : "acedaw_tool");
        return 1;
    }

    auto result = acedaw::tools::run(*options);
    acedaw::common::Logger::shutdown();
    if (!result.has_value()) {
        std::cerr << "Error: " << result.error() << '\n';
        return 1;
    }
    return 0;
}
