#include <gtest/gtest.h>
#include <zk/link_registry.hpp>
#include <zk/note_ops.hpp>
#include <zk/parser.hpp>

#include "test_helpers.hpp"

#include <ctime>

using namespace zk;
using zk::test_support::read_text;
using zk::test_support::write_text;

class LinkRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "zk_registry_test";
        fs::remove_all(test_dir_);
        config_ = Config::from_root(test_dir_);
        fs::create_directories(config_.note_dir);
        registry_ = std::make_unique<LinkRegistry>(config_.link_file, config_.note_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::set<NoteId> entries() {
        auto result = registry_->entries();
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return result.value_or({});
    }

    fs::path test_dir_;
    Config config_;
    std::unique_ptr<LinkRegistry> registry_;
};

// ============================================================================
// Registry entries
// ============================================================================

TEST_F(LinkRegistryTest, MissingFileHasNoEntries) {
    EXPECT_TRUE(entries().empty());
    EXPECT_TRUE(registry_->remove_entry("2401011200").ok());
    EXPECT_FALSE(fs::exists(config_.link_file));
}

TEST_F(LinkRegistryTest, AddEntryWritesSortedFile) {
    ASSERT_TRUE(registry_->add_entry("2402021300").ok());
    ASSERT_TRUE(registry_->add_entry("2401011200").ok());
    ASSERT_TRUE(registry_->add_entry("2402021300").ok());

    EXPECT_EQ(read_text(config_.link_file),
              std::string(LinkRegistry::HEADER) + "\n"
              "#include \"note/2401011200.typ\"\n"
              "#include \"note/2402021300.typ\"\n");
    EXPECT_EQ(entries(), (std::set<NoteId>{"2401011200", "2402021300"}));
}

TEST_F(LinkRegistryTest, AddEntryRejectsBadId) {
    auto result = registry_->add_entry("../etc");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(LinkRegistryTest, RemoveEntry) {
    ASSERT_TRUE(registry_->add_entry("2401011200").ok());
    ASSERT_TRUE(registry_->add_entry("2402021300").ok());

    ASSERT_TRUE(registry_->remove_entry("2401011200").ok());
    ASSERT_TRUE(registry_->remove_entry("2401011200").ok());
    EXPECT_EQ(entries(), (std::set<NoteId>{"2402021300"}));
}

TEST_F(LinkRegistryTest, LoadIgnoresForeignLines) {
    write_text(config_.link_file,
               "// hand written\n"
               "#include \"note/2401011200.typ\"\n"
               "#include \"other/file.typ\"\n"
               "#include \"note/abc.typ\"\n");

    EXPECT_EQ(entries(), (std::set<NoteId>{"2401011200"}));
}

TEST_F(LinkRegistryTest, GenerateFromNoteDirectory) {
    write_text(config_.note_dir / "2402021300.typ", "");
    write_text(config_.note_dir / "2401011200.typ", "");
    write_text(config_.note_dir / "notes.txt", "");
    ASSERT_TRUE(registry_->add_entry("2409999999").ok());

    auto result = registry_->generate();
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), 2u);
    EXPECT_EQ(entries(), (std::set<NoteId>{"2401011200", "2402021300"}));
}

TEST_F(LinkRegistryTest, GenerateMissingDirectory) {
    fs::remove_all(config_.note_dir);
    auto result = registry_->generate();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::IO_ERROR);
}

TEST_F(LinkRegistryTest, UnstatableLinkFileIsIoError) {
    // Self-referencing symlink: stat fails with ELOOP
    fs::create_symlink(config_.link_file, config_.link_file);

    auto added = registry_->add_entry("2401011200");
    EXPECT_FALSE(added.ok());
    EXPECT_EQ(added.error_code(), ErrorCode::IO_ERROR);

    auto removed = registry_->remove_entry("2401011200");
    EXPECT_FALSE(removed.ok());
    EXPECT_EQ(removed.error_code(), ErrorCode::IO_ERROR);

    EXPECT_FALSE(registry_->entries().ok());
}

TEST_F(LinkRegistryTest, OverlongLinkPathIsIoError) {
    // A path component past NAME_MAX fails with ENAMETOOLONG
    LinkRegistry registry(test_dir_ / std::string(300, 'x') / "link.typ", config_.note_dir);

    auto added = registry.add_entry("2401011200");
    EXPECT_FALSE(added.ok());
    EXPECT_EQ(added.error_code(), ErrorCode::IO_ERROR);

    auto removed = registry.remove_entry("2401011200");
    EXPECT_FALSE(removed.ok());
    EXPECT_EQ(removed.error_code(), ErrorCode::IO_ERROR);
}

// ============================================================================
// Note operations
// ============================================================================

TEST(NoteOpsTest, NoteIdFormat) {
    std::tm local{};
    local.tm_year = 2024 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 7;
    local.tm_hour = 9;
    local.tm_min = 5;
    local.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(note_id_for(when), "2403070905");
}

TEST(NoteOpsTest, TemplateParsesAsNote) {
    auto plain = note_template("2401011200", false);
    auto header = parser::parse_header(plain);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->id, "2401011200");
    EXPECT_EQ(header->title, "");

    auto with_meta = note_template("2401011200", true);
    EXPECT_EQ(with_meta.rfind("/* Metadata:", 0), 0u);
    header = parser::parse_header(with_meta);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->title_line_idx, 9u);
}

TEST_F(LinkRegistryTest, CreateNoteWritesAndRegisters) {
    auto result = create_note(config_, *registry_, true);
    ASSERT_TRUE(result.ok()) << result.error().to_string();

    fs::path path = result.value();
    EXPECT_TRUE(fs::exists(path));
    EXPECT_TRUE(parser::is_note_filename(path));

    NoteId id = path.stem().string();
    EXPECT_EQ(entries().count(id), 1u);

    auto header = parser::parse_header(read_text(path));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->id, id);
}

TEST_F(LinkRegistryTest, CreateNoteKeepsExistingFile) {
    NoteId id = note_id_for(std::chrono::system_clock::now());
    fs::path path = config_.note_dir / (id + ".typ");
    write_text(path, "existing content\n");

    auto result = create_note(config_, *registry_, false);
    ASSERT_TRUE(result.ok());
    // Unless the minute rolled over in between, the file is untouched
    if (result.value() == path) {
        EXPECT_EQ(read_text(path), "existing content\n");
    }
}

TEST_F(LinkRegistryTest, DeleteNote) {
    write_text(config_.note_dir / "2401011200.typ", "x");
    ASSERT_TRUE(registry_->add_entry("2401011200").ok());

    ASSERT_TRUE(delete_note("2401011200", config_, *registry_).ok());
    EXPECT_FALSE(fs::exists(config_.note_dir / "2401011200.typ"));
    EXPECT_TRUE(entries().empty());

    // Already gone: still fine
    EXPECT_TRUE(delete_note("2401011200", config_, *registry_).ok());
}

TEST_F(LinkRegistryTest, DeleteNoteRejectsBadId) {
    auto result = delete_note("../link", config_, *registry_);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
}
