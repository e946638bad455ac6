#include <gtest/gtest.h>
#include <zk/note_index.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <thread>

using namespace zk;
using zk::test_support::make_note;
using zk::test_support::write_text;

class NoteIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "zk_index_test";
        fs::remove_all(test_dir_);
        config_ = Config::from_root(test_dir_);
        fs::create_directories(config_.note_dir);
        index_ = std::make_unique<NoteIndex>(config_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path note_path(const std::string& id) const {
        return NoteIndex::normalize_path(config_.note_dir / (id + ".typ"));
    }

    fs::path write_note(const std::string& id, const std::string& content) {
        fs::path path = note_path(id);
        write_text(path, content);
        return path;
    }

    fs::path test_dir_;
    Config config_;
    std::unique_ptr<NoteIndex> index_;
};

// ============================================================================
// Rebuild
// ============================================================================

TEST_F(NoteIndexTest, RebuildEmptyDirectory) {
    auto result = index_->rebuild_full();
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), 0u);
}

TEST_F(NoteIndexTest, RebuildMissingDirectory) {
    fs::remove_all(config_.note_dir);
    auto result = index_->rebuild_full();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
}

TEST_F(NoteIndexTest, RebuildIndexesNotesAndSkipsOthers) {
    write_note("2401011200", make_note("2401011200", "First", "#tag.todo", "see @2402021300\n"));
    write_note("2402021300", make_note("2402021300", "Second", ""));
    write_text(config_.note_dir / "README.typ", make_note("2403031400", "Not a note file", ""));
    write_text(config_.note_dir / "2404041500.md", make_note("2404041500", "Wrong extension", ""));

    auto result = index_->rebuild_full();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 2u);

    EXPECT_TRUE(index_->get("2401011200").has_value());
    EXPECT_TRUE(index_->get("2402021300").has_value());
    EXPECT_FALSE(index_->get("2403031400").has_value());
    EXPECT_FALSE(index_->get("2404041500").has_value());

    auto links = index_->get_backlinks("2402021300");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].file, note_path("2401011200"));
    EXPECT_EQ(links[0].line, 6u);
    EXPECT_EQ(links[0].start_char, 4u);
    EXPECT_EQ(links[0].end_char, 15u);
}

TEST_F(NoteIndexTest, RebuildClearsPreviousState) {
    auto path = write_note("2401011200", make_note("2401011200", "First", "", "@2402021300\n"));
    ASSERT_TRUE(index_->rebuild_full().ok());
    EXPECT_EQ(index_->size(), 1u);

    fs::remove(path);
    auto result = index_->rebuild_full();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_EQ(index_->backlink_target_count(), 0u);
}

TEST_F(NoteIndexTest, HeaderlessFileStillContributesBacklinks) {
    write_note("2401011200", "scratch text mentioning @2402021300\n");
    ASSERT_TRUE(index_->rebuild_full().ok());

    EXPECT_FALSE(index_->get("2401011200").has_value());
    EXPECT_EQ(index_->get_backlinks("2402021300").size(), 1u);
}

TEST_F(NoteIndexTest, HeaderIdIsAuthoritative) {
    auto path = write_note("2401011200", make_note("2409091900", "Renamed", ""));
    ASSERT_TRUE(index_->update_file(path).ok());

    EXPECT_FALSE(index_->get("2401011200").has_value());
    auto info = index_->get("2409091900");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->path, path);
}

// ============================================================================
// Per-file updates
// ============================================================================

TEST_F(NoteIndexTest, UpdateReplacesPriorBacklinks) {
    auto path = write_note("2401011200", make_note("2401011200", "A", "", "@2402021300 @2402021300\n"));
    ASSERT_TRUE(index_->update_file(path).ok());
    EXPECT_EQ(index_->get_backlinks("2402021300").size(), 2u);

    write_text(path, make_note("2401011200", "A", "", "now @2403031400\n"));
    ASSERT_TRUE(index_->update_file(path).ok());

    EXPECT_TRUE(index_->get_backlinks("2402021300").empty());
    EXPECT_EQ(index_->get_backlinks("2403031400").size(), 1u);
    EXPECT_EQ(index_->backlink_target_count(), 1u);
}

TEST_F(NoteIndexTest, UpdateOverwritesMetadata) {
    auto path = write_note("2401011200", make_note("2401011200", "Before", ""));
    ASSERT_TRUE(index_->update_file(path).ok());

    write_text(path, make_note("2401011200", "After", "#tag.archived"));
    ASSERT_TRUE(index_->update_file(path).ok());

    auto info = index_->get("2401011200");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->title, "After");
    EXPECT_TRUE(info->archived);
}

TEST_F(NoteIndexTest, UpdateUnreadableFile) {
    auto path = note_path("2401011200");
    auto result = index_->update_file(path);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
    EXPECT_EQ(index_->size(), 0u);
}

TEST_F(NoteIndexTest, RelativeAndAbsolutePathsAgree) {
    auto path = write_note("2401011200", make_note("2401011200", "A", "", "@2402021300\n"));
    ASSERT_TRUE(index_->update_file(config_.note_dir / "." / "2401011200.typ").ok());
    ASSERT_TRUE(index_->update_file(path).ok());

    EXPECT_EQ(index_->get_backlinks("2402021300").size(), 1u);
}

TEST_F(NoteIndexTest, BacklinkOffsetsAreUtf16) {
    auto path = write_note("2401011200",
                           make_note("2401011200", "A", "", "caf\xC3\xA9 \xF0\x9F\x98\x80 @2402021300\n"));
    ASSERT_TRUE(index_->update_file(path).ok());

    auto links = index_->get_backlinks("2402021300");
    ASSERT_EQ(links.size(), 1u);
    // c a f é ␠ 😀(2) ␠ = 8 units, 11 bytes
    EXPECT_EQ(links[0].start_char, 8u);
    EXPECT_EQ(links[0].end_char, 19u);
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(NoteIndexTest, IndexThenRemoveLeavesNoResidue) {
    auto other = write_note("2409091900", make_note("2409091900", "Other", "", "@2401011200\n"));
    ASSERT_TRUE(index_->update_file(other).ok());

    size_t notes_before = index_->size();
    size_t targets_before = index_->backlink_target_count();
    auto links_before = index_->get_backlinks("2401011200");

    auto path = write_note("2401011200",
                           make_note("2401011200", "A", "", "@2402021300 @2409091900\n"));
    ASSERT_TRUE(index_->update_file(path).ok());
    EXPECT_EQ(index_->size(), notes_before + 1);

    index_->remove_by_path(path);

    EXPECT_EQ(index_->size(), notes_before);
    EXPECT_EQ(index_->backlink_target_count(), targets_before);
    EXPECT_EQ(index_->get_backlinks("2401011200"), links_before);
    EXPECT_TRUE(index_->get_backlinks("2402021300").empty());
}

TEST_F(NoteIndexTest, DeletedNoteKeepsIncomingLinksFromOthers) {
    auto a = write_note("2401011200", make_note("2401011200", "A", "", "@2402021300\n"));
    auto b = write_note("2402021300", make_note("2402021300", "B", "", "self @2402021300\n"));
    ASSERT_TRUE(index_->rebuild_full().ok());
    EXPECT_EQ(index_->get_backlinks("2402021300").size(), 2u);

    fs::remove(b);
    index_->remove_by_path(b);

    EXPECT_FALSE(index_->get("2402021300").has_value());
    auto links = index_->get_backlinks("2402021300");
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].file, a);
}

// ============================================================================
// Search
// ============================================================================

TEST_F(NoteIndexTest, SearchMatchesAllFields) {
    write_note("2401011200", make_note("2401011200", "Graph Theory", ""));
    write_note("2402021300",
               "/* Metadata:\nAliases: Dijkstra\nKeyword: shortest-path\nAbstract: Weighted routes\n*/\n" +
               make_note("2402021300", "Routing", ""));
    ASSERT_TRUE(index_->rebuild_full().ok());

    auto ids = [this](const std::string& q) {
        std::vector<std::string> out;
        for (const auto& n : index_->search(q)) out.push_back(n.id);
        std::sort(out.begin(), out.end());
        return out;
    };

    EXPECT_EQ(ids("graph"), (std::vector<std::string>{"2401011200"}));
    EXPECT_EQ(ids("DIJKSTRA"), (std::vector<std::string>{"2402021300"}));
    EXPECT_EQ(ids("shortest"), (std::vector<std::string>{"2402021300"}));
    EXPECT_EQ(ids("weighted"), (std::vector<std::string>{"2402021300"}));
    EXPECT_EQ(ids("24020"), (std::vector<std::string>{"2402021300"}));
    EXPECT_EQ(ids(""), (std::vector<std::string>{"2401011200", "2402021300"}));
    EXPECT_TRUE(ids("nothing like this").empty());
}

TEST_F(NoteIndexTest, SearchFoldsNonAsciiCase) {
    write_note("2401011200", make_note("2401011200", "Über Graphen", ""));
    write_note("2402021300", make_note("2402021300", "ŁÓDŹ routes", ""));
    write_note("2403031400", make_note("2403031400", "ΕΛΛΗΝΙΚΆ notes", ""));
    write_note("2404041500", make_note("2404041500", "МОСКВА metro", ""));
    ASSERT_TRUE(index_->rebuild_full().ok());

    auto ids = [this](const std::string& q) {
        std::vector<std::string> out;
        for (const auto& n : index_->search(q)) out.push_back(n.id);
        std::sort(out.begin(), out.end());
        return out;
    };

    EXPECT_EQ(ids("über"), (std::vector<std::string>{"2401011200"}));
    EXPECT_EQ(ids("ÜBER"), (std::vector<std::string>{"2401011200"}));
    EXPECT_EQ(ids("łódź"), (std::vector<std::string>{"2402021300"}));
    EXPECT_EQ(ids("ελληνικά"), (std::vector<std::string>{"2403031400"}));
    EXPECT_EQ(ids("москва"), (std::vector<std::string>{"2404041500"}));
    EXPECT_TRUE(ids("ubér").empty());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(NoteIndexTest, ConcurrentUpdatesOfDistinctFiles) {
    constexpr int kNotes = 32;
    std::vector<fs::path> paths;
    for (int i = 0; i < kNotes; ++i) {
        std::string id = "24010112" + std::string(i < 10 ? "0" : "") + std::to_string(i);
        paths.push_back(write_note(id, make_note(id, "N" + std::to_string(i), "", "@2499999999\n")));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, &paths, t] {
            for (size_t i = t; i < paths.size(); i += 4) {
                for (int round = 0; round < 5; ++round) {
                    EXPECT_TRUE(index_->update_file(paths[i]).ok());
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(index_->size(), static_cast<size_t>(kNotes));
    EXPECT_EQ(index_->get_backlinks("2499999999").size(), static_cast<size_t>(kNotes));
}
