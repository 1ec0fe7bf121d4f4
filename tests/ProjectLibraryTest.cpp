#include "acedaw/library/ProjectLibrary.hpp"

#include "acedaw/archive/ArchiveCodec.hpp"
#include "acedaw/audio/WavCodec.hpp"

#include "AcedawTestHelpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace acedaw::library {
namespace {

using audio::AudioBlobKey;
using audio::AudioVariant;
using test_helpers::bytesOf;
using test_helpers::makeBuffer;
using test_helpers::makeProject;

class ProjectLibraryTest : public ::testing::Test {
protected:
    common::Clock fixedClock() {
        return [this] { return now_; };
    }

    std::vector<uint8_t> wavOf(const audio::AudioBuffer& buffer) {
        auto wav = audio::encodeWav(buffer);
        EXPECT_TRUE(wav.has_value());
        return wav.value_or(std::vector<uint8_t>{});
    }

    audio::AudioBuffer storedBuffer(ProjectLibrary& library, const std::string& key) {
        auto bytes = library.audio().loadByKey(key);
        EXPECT_TRUE(bytes.has_value() && bytes->has_value()) << key;
        if (!bytes.has_value() || !bytes->has_value()) {
            return {};
        }
        auto decoded = audio::decodeWav(**bytes);
        EXPECT_TRUE(decoded.has_value());
        return decoded.value_or(audio::AudioBuffer{});
    }

    int64_t now_ = 5'000;
    store::MemoryKeyValueStore store_;
};

TEST_F(ProjectLibraryTest, CreateProjectStampsBothTimesAndPersists) {
    ProjectLibrary library(store_, fixedClock());

    auto created = library.createProject("Night Drive");
    ASSERT_TRUE(created.has_value()) << created.error();
    EXPECT_FALSE(created->id.empty());
    EXPECT_EQ(created->name, "Night Drive");
    EXPECT_EQ(created->createdAt, 5'000);
    EXPECT_EQ(created->updatedAt, 5'000);
    EXPECT_TRUE(created->tracks.empty());

    auto loaded = library.projects().load(created->id);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded->has_value());
    EXPECT_EQ(**loaded, *created);

    auto other = library.createProject("Night Drive");
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(other->id, created->id);
}

TEST_F(ProjectLibraryTest, SaveProjectTouchesUpdatedAtButNeverBeforeCreation) {
    ProjectLibrary library(store_, fixedClock());
    auto project = library.createProject("Touch");
    ASSERT_TRUE(project.has_value());

    now_ = 9'000;
    project->name = "Touched";
    ASSERT_TRUE(library.saveProject(*project).has_value());
    EXPECT_EQ(project->updatedAt, 9'000);

    now_ = 100;
    ASSERT_TRUE(library.saveProject(*project).has_value());
    EXPECT_EQ(project->updatedAt, project->createdAt);

    auto loaded = library.projects().load(project->id);
    ASSERT_TRUE(loaded.has_value() && loaded->has_value());
    EXPECT_EQ((*loaded)->name, "Touched");
    EXPECT_EQ((*loaded)->updatedAt, 5'000);
}

TEST_F(ProjectLibraryTest, DeleteProjectPurgesItsAudioOnly) {
    ProjectLibrary library(store_, fixedClock());
    ASSERT_TRUE(library.projects().save(makeProject("p1", "Doomed", 1'000, 1)).has_value());
    ASSERT_TRUE(library.projects().save(makeProject("p2", "Kept", 1'000, 1)).has_value());
    ASSERT_TRUE(library.audio().save({"p1", "c1", AudioVariant::Cumulative}, bytesOf("a")).has_value());
    ASSERT_TRUE(library.audio().save({"p1", "c1", AudioVariant::Isolated}, bytesOf("b")).has_value());
    ASSERT_TRUE(library.audio().save({"p2", "c1", AudioVariant::Cumulative}, bytesOf("c")).has_value());

    ASSERT_TRUE(library.deleteProject("p1").has_value());

    auto gone = library.projects().load("p1");
    ASSERT_TRUE(gone.has_value());
    EXPECT_FALSE(gone->has_value());
    auto p1Keys = library.audio().keysForProject("p1");
    ASSERT_TRUE(p1Keys.has_value());
    EXPECT_TRUE(p1Keys->empty());

    auto p2Keys = library.audio().keysForProject("p2");
    ASSERT_TRUE(p2Keys.has_value());
    EXPECT_EQ(*p2Keys, (std::vector<std::string>{"audio:p2:c1:cumulative"}));

    EXPECT_TRUE(library.deleteProject("p1").has_value());
    EXPECT_TRUE(library.deleteProject("never-existed").has_value());
}

TEST_F(ProjectLibraryTest, ExportThenImportReproducesProjectAndAudio) {
    ProjectLibrary source(store_, fixedClock());
    const auto project = makeProject("p1", "Portable", 8'000, 2);
    ASSERT_TRUE(source.projects().save(project).has_value());
    ASSERT_TRUE(source.audio().save({"p1", "c2", AudioVariant::Cumulative}, bytesOf("second")).has_value());
    ASSERT_TRUE(source.audio().save({"p1", "c1", AudioVariant::Cumulative}, bytesOf("first")).has_value());
    ASSERT_TRUE(source.audio().save({"p1", "c1", AudioVariant::Isolated}, bytesOf("iso")).has_value());
    ASSERT_TRUE(source.audio().save({"p10", "c1", AudioVariant::Cumulative}, bytesOf("other")).has_value());

    auto exported = source.exportArchive("p1");
    ASSERT_TRUE(exported.has_value()) << exported.error();

    auto decoded = archive::decodeArchive(*exported);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->entries.size(), 3u);
    EXPECT_EQ(decoded->entries[0].key, "audio:p1:c1:cumulative");
    EXPECT_EQ(decoded->entries[1].key, "audio:p1:c1:isolated");
    EXPECT_EQ(decoded->entries[2].key, "audio:p1:c2:cumulative");

    store::MemoryKeyValueStore freshStore;
    ProjectLibrary target(freshStore, fixedClock());
    auto imported = target.importArchive(*exported);
    ASSERT_TRUE(imported.has_value()) << imported.error();
    EXPECT_EQ(*imported, project);

    auto loaded = target.projects().load("p1");
    ASSERT_TRUE(loaded.has_value() && loaded->has_value());
    EXPECT_EQ(**loaded, project);
    EXPECT_EQ(freshStore.size(), 4u);

    auto iso = target.audio().load({"p1", "c1", AudioVariant::Isolated});
    ASSERT_TRUE(iso.has_value() && iso->has_value());
    EXPECT_EQ(**iso, bytesOf("iso"));
}

TEST_F(ProjectLibraryTest, ExportOfMissingProjectFails) {
    ProjectLibrary library(store_, fixedClock());
    auto exported = library.exportArchive("missing");
    ASSERT_FALSE(exported.has_value());
    EXPECT_NE(exported.error().find("missing"), std::string::npos);
}

TEST_F(ProjectLibraryTest, ImportOfBrokenArchiveWritesNothing) {
    ProjectLibrary library(store_, fixedClock());

    auto imported = library.importArchive(bytesOf("PK\x03\x04 not an acedaw archive"));
    ASSERT_FALSE(imported.has_value());
    EXPECT_TRUE(imported.error().starts_with("InvalidFormat")) << imported.error();

    auto exported = archive::encodeArchive(makeProject("p1", "Cut", 1'000, 1),
                                           std::vector<archive::ArchiveEntry>{{"audio:p1:c1:cumulative", bytesOf("abc")}});
    ASSERT_TRUE(exported.has_value());
    exported->pop_back();
    auto truncated = library.importArchive(*exported);
    ASSERT_FALSE(truncated.has_value());
    EXPECT_TRUE(truncated.error().starts_with("TruncatedArchive")) << truncated.error();

    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(ProjectLibraryTest, ImportRejectsKeysOutsideTheArchivedProject) {
    ProjectLibrary library(store_, fixedClock());
    const std::vector<std::vector<archive::ArchiveEntry>> foreignSets = {
        {{"audio:p1:c1:cumulative", bytesOf("ok")}, {"audio:p2:c1:cumulative", bytesOf("foreign")}},
        {{"project:p2", bytesOf("{}")}},
        {{"audio:p1:c1:remix", bytesOf("bad variant")}},
    };

    for (const auto& entries : foreignSets) {
        auto bytes = archive::encodeArchive(makeProject("p1", "Sneaky", 1'000, 1), entries);
        ASSERT_TRUE(bytes.has_value());
        auto imported = library.importArchive(*bytes);
        ASSERT_FALSE(imported.has_value());
        EXPECT_TRUE(imported.error().starts_with("InvalidManifest")) << imported.error();
    }
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(ProjectLibraryTest, FailedImportWriteRestoresPriorValues) {
    test_helpers::FailingWriteStore failingStore;
    ASSERT_TRUE(failingStore.set("audio:p1:c1:cumulative", bytesOf("old")).has_value());
    failingStore.failWritesTo("audio:p1:c2:cumulative");

    ProjectLibrary library(failingStore, fixedClock());
    auto bytes = archive::encodeArchive(makeProject("p1", "Half", 1'000, 2),
                                        std::vector<archive::ArchiveEntry>{
                                            {"audio:p1:c1:cumulative", bytesOf("new")},
                                            {"audio:p1:c2:cumulative", bytesOf("never")},
                                        });
    ASSERT_TRUE(bytes.has_value());

    auto imported = library.importArchive(*bytes);
    ASSERT_FALSE(imported.has_value());

    auto restored = failingStore.get("audio:p1:c1:cumulative");
    ASSERT_TRUE(restored.has_value() && restored->has_value());
    EXPECT_EQ(**restored, bytesOf("old"));

    auto record = library.projects().load("p1");
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->has_value());
    EXPECT_EQ(failingStore.size(), 1u);
}

TEST_F(ProjectLibraryTest, FailedRecordWriteRollsBackImportedAudio) {
    test_helpers::FailingWriteStore failingStore;
    failingStore.failWritesTo("project:p1");

    ProjectLibrary library(failingStore, fixedClock());
    auto bytes = archive::encodeArchive(makeProject("p1", "Late", 1'000, 1),
                                        std::vector<archive::ArchiveEntry>{{"audio:p1:c1:cumulative", bytesOf("x")}});
    ASSERT_TRUE(bytes.has_value());

    EXPECT_FALSE(library.importArchive(*bytes).has_value());
    EXPECT_EQ(failingStore.size(), 0u);
}

TEST_F(ProjectLibraryTest, FirstLayerIsolatedTrackEqualsItsMix) {
    ProjectLibrary library(store_, fixedClock());
    const auto mix = makeBuffer(44100, {{0.25f, -0.5f, 0.75f}});

    auto stored = library.storeClipMix("p1", "c1", wavOf(mix));
    ASSERT_TRUE(stored.has_value()) << stored.error();
    EXPECT_EQ(stored->cumulativeKey, "audio:p1:c1:cumulative");
    EXPECT_EQ(stored->isolatedKey, "audio:p1:c1:isolated");

    EXPECT_EQ(storedBuffer(library, stored->cumulativeKey), mix);
    EXPECT_EQ(storedBuffer(library, stored->isolatedKey), mix);
}

TEST_F(ProjectLibraryTest, LaterLayerSubtractsPreviousMix) {
    ProjectLibrary library(store_, fixedClock());
    ASSERT_TRUE(library.storeClipMix("p1", "c1", wavOf(makeBuffer(44100, {{0.5f, 0.5f}}))).has_value());

    auto stored = library.storeClipMix("p1", "c2", wavOf(makeBuffer(44100, {{1.0f, 2.0f, 3.0f}})), "c1");
    ASSERT_TRUE(stored.has_value()) << stored.error();

    const auto isolated = storedBuffer(library, stored->isolatedKey);
    EXPECT_EQ(isolated.sampleRate, 44100u);
    ASSERT_EQ(isolated.channelCount(), 1u);
    EXPECT_EQ(isolated.channels[0], (std::vector<float>{0.5f, 1.5f, 3.0f}));
}

TEST_F(ProjectLibraryTest, MissingPreviousMixTreatsClipAsFirstLayer) {
    ProjectLibrary library(store_, fixedClock());
    const auto mix = makeBuffer(22050, {{0.1f, 0.2f}, {-0.1f, -0.2f}});

    auto stored = library.storeClipMix("p1", "c3", wavOf(mix), "ghost");
    ASSERT_TRUE(stored.has_value()) << stored.error();
    EXPECT_EQ(storedBuffer(library, stored->isolatedKey), mix);
}

TEST_F(ProjectLibraryTest, UnreadableMixStoresNothing) {
    ProjectLibrary library(store_, fixedClock());
    auto stored = library.storeClipMix("p1", "c1", bytesOf("not audio"));
    EXPECT_FALSE(stored.has_value());
    EXPECT_EQ(store_.size(), 0u);
}

TEST(ArchiveFileNameTest, KeepsOnlySafeCharacters) {
    auto project = makeProject("p1", "My Song: Take #2!", 1'000, 0);
    EXPECT_EQ(archiveFileName(project), "My Song Take 2.acedaw");

    project.name = "lo-fi_beat";
    EXPECT_EQ(archiveFileName(project), "lo-fi_beat.acedaw");

    project.name = "???";
    EXPECT_EQ(archiveFileName(project), "untitled.acedaw");
}

}  // namespace
}  // namespace acedaw::library
