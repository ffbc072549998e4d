#include <gtest/gtest.h>
#include <semnote/notes.hpp>

#include <filesystem>
#include <fstream>

using namespace semnote;
namespace fs = std::filesystem;

class DirectoryNoteSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "semnote_notes_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void write(const std::string& relative, const std::string& content = "x") {
        fs::path path = test_dir_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    fs::path test_dir_;
};

TEST_F(DirectoryNoteSourceTest, ListNotesRecursively) {
    write("b.md");
    write("a.txt");
    write("projects/plan.md");
    write("image.png");
    write(".hidden.md");
    write(".obsidian/config.md");

    DirectoryNoteSource notes(test_dir_);
    auto ids = notes.list_notes();
    ASSERT_TRUE(ids.ok()) << ids.error().to_string();
    EXPECT_EQ(ids.value(), (std::vector<NoteId>{"a.txt", "b.md", "projects/plan.md"}));
}

TEST_F(DirectoryNoteSourceTest, ListNotesMissingDirectory) {
    DirectoryNoteSource notes(test_dir_ / "missing");
    auto ids = notes.list_notes();
    ASSERT_FALSE(ids.ok());
    EXPECT_EQ(ids.error().code(), ErrorCode::NOT_FOUND);
}

TEST_F(DirectoryNoteSourceTest, IsNote) {
    write("a.md");
    write("image.png");
    write(".hidden/b.md");
    fs::create_directories(test_dir_ / "dir.md");

    DirectoryNoteSource notes(test_dir_);
    EXPECT_TRUE(notes.is_note(test_dir_ / "a.md"));
    EXPECT_TRUE(notes.is_note("a.md"));
    EXPECT_FALSE(notes.is_note(test_dir_ / "image.png"));
    EXPECT_FALSE(notes.is_note(test_dir_ / "missing.md"));
    EXPECT_FALSE(notes.is_note(test_dir_ / ".hidden" / "b.md"));
    EXPECT_FALSE(notes.is_note(test_dir_ / "dir.md"));
    EXPECT_FALSE(notes.is_note(fs::temp_directory_path() / "outside.md"));
}

TEST_F(DirectoryNoteSourceTest, IdAndPathMapping) {
    write("journal/2024-01-01.md");

    DirectoryNoteSource notes(test_dir_);
    auto id = notes.id_for_path(test_dir_ / "journal" / "2024-01-01.md");
    ASSERT_TRUE(id.ok()) << id.error().to_string();
    EXPECT_EQ(id.value(), "journal/2024-01-01.md");

    auto path = notes.path_for_id("journal/2024-01-01.md");
    ASSERT_TRUE(path.ok()) << path.error().to_string();
    EXPECT_EQ(path.value().filename().string(), "2024-01-01.md");
    EXPECT_TRUE(fs::equivalent(path.value(), test_dir_ / "journal" / "2024-01-01.md"));

    auto missing = notes.path_for_id("nope.md");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::NOT_FOUND);

    auto not_note = notes.id_for_path(test_dir_ / "nope.bin");
    ASSERT_FALSE(not_note.ok());
    EXPECT_EQ(not_note.error().code(), ErrorCode::NOT_A_NOTE);
}

TEST_F(DirectoryNoteSourceTest, SameStemDifferentExtensions) {
    write("x.md", "markdown");
    write("x.txt", "plain");

    DirectoryNoteSource notes(test_dir_);
    auto md_id = notes.id_for_path(test_dir_ / "x.md");
    auto txt_id = notes.id_for_path(test_dir_ / "x.txt");
    ASSERT_TRUE(md_id.ok()) << md_id.error().to_string();
    ASSERT_TRUE(txt_id.ok()) << txt_id.error().to_string();
    EXPECT_EQ(md_id.value(), "x.md");
    EXPECT_EQ(txt_id.value(), "x.txt");

    auto ids = notes.list_notes();
    ASSERT_TRUE(ids.ok());
    EXPECT_EQ(ids.value(), (std::vector<NoteId>{"x.md", "x.txt"}));

    auto path = notes.path_for_id(txt_id.value());
    ASSERT_TRUE(path.ok()) << path.error().to_string();
    EXPECT_TRUE(fs::equivalent(path.value(), test_dir_ / "x.txt"));
    EXPECT_EQ(notes.read_note("x.txt").value(), "plain");
}

TEST_F(DirectoryNoteSourceTest, CustomExtensions) {
    write("a.org");
    write("b.md");

    DirectoryNoteSource notes(test_dir_, {".org"});
    auto ids = notes.list_notes();
    ASSERT_TRUE(ids.ok());
    EXPECT_EQ(ids.value(), (std::vector<NoteId>{"a.org"}));
}

TEST_F(DirectoryNoteSourceTest, ReadNote) {
    write("a.md", "line one\n\nline two");

    DirectoryNoteSource notes(test_dir_);
    auto content = notes.read_note("a.md");
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), "line one\n\nline two");

    auto missing = read_file(test_dir_ / "missing.md");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code(), ErrorCode::IO_ERROR);
}
