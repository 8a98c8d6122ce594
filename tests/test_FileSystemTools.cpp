#include <gtest/gtest.h>
#include <sys/stat.h>
#include "core/FsError.hpp"
#include "tools/FileSystemTools.hpp"
#include "TestSupport.hpp"

using namespace secure_fs;
using secure_fs::testing::read_text;
using secure_fs::testing::write_text;
namespace fs = std::filesystem;

namespace {

class FileSystemToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(dir_ / "root" / "docs");
        fs::create_directories(dir_ / "outside");
        write_text(dir_ / "root" / "notes.txt", "line one\nline two\n");
        write_text(dir_ / "root" / "docs" / "Report.md", "# report");
        write_text(dir_ / "outside" / "report-secret.md", "nope");
        root_ = (dir_ / "root").string();
        validator_ = std::make_shared<const PathValidator>(std::vector<std::string>{root_});
    }

    secure_fs::testing::TempDir dir_{"fstools"};
    std::string root_;
    std::shared_ptr<const PathValidator> validator_;
};

}

TEST_F(FileSystemToolsTest, ReadFileReturnsContent) {
    ReadFileTool tool(validator_);
    auto result = tool.execute({{"path", root_ + "/notes.txt"}});
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.text, "line one\nline two\n");
}

TEST_F(FileSystemToolsTest, ReadFileOutsideRootThrowsAccessDenied) {
    ReadFileTool tool(validator_);
    try {
        tool.execute({{"path", (dir_ / "outside" / "report-secret.md").string()}});
        FAIL() << "expected AccessDenied";
    } catch (const FsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AccessDenied);
    }
}

TEST_F(FileSystemToolsTest, MissingPathArgumentIsInvalidArgument) {
    ReadFileTool tool(validator_);
    try {
        tool.execute(nlohmann::json::object());
        FAIL() << "expected InvalidArgument";
    } catch (const FsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }
}

TEST_F(FileSystemToolsTest, ReadMultipleFilesReportsFailuresInline) {
    std::string good = root_ + "/notes.txt";
    std::string denied = (dir_ / "outside" / "report-secret.md").string();
    std::string text = FileSystemTools::read_multiple_files(*validator_, {good, denied});

    EXPECT_NE(text.find(good + ":\nline one"), std::string::npos);
    EXPECT_NE(text.find("\n---\n"), std::string::npos);
    EXPECT_NE(text.find(denied + ": Error - access denied"), std::string::npos);
}

TEST_F(FileSystemToolsTest, WriteFileCreatesAndOverwrites) {
    WriteFileTool tool(validator_);
    std::string target = root_ + "/fresh.txt";
    auto result = tool.execute({{"path", target}, {"content", "first"}});
    EXPECT_EQ(result.text, "Successfully wrote to " + target);
    EXPECT_EQ(read_text(target), "first");

    tool.execute({{"path", target}, {"content", "second"}});
    EXPECT_EQ(read_text(target), "second");
}

TEST_F(FileSystemToolsTest, CreateDirectoryIsIdempotent) {
    fs::path nested = fs::path(root_) / "a" / "b";
    FileSystemTools::create_directory(nested);
    FileSystemTools::create_directory(nested);
    EXPECT_TRUE(fs::is_directory(nested));
}

TEST_F(FileSystemToolsTest, CreateDirectoryOverFileFails) {
    try {
        FileSystemTools::create_directory(fs::path(root_) / "notes.txt");
        FAIL() << "expected Io";
    } catch (const FsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

TEST_F(FileSystemToolsTest, ListDirectoryMarksEntries) {
    std::string listing = FileSystemTools::list_directory(root_);
    EXPECT_EQ(listing, "[DIR] docs\n[FILE] notes.txt");
}

TEST_F(FileSystemToolsTest, MoveFileRenamesAndRefusesToClobber) {
    fs::path src = fs::path(root_) / "notes.txt";
    fs::path dst = fs::path(root_) / "docs" / "notes-moved.txt";
    FileSystemTools::move_file(src, dst);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(read_text(dst), "line one\nline two\n");

    try {
        FileSystemTools::move_file(dst, fs::path(root_) / "docs" / "Report.md");
        FAIL() << "expected Io";
    } catch (const FsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
    EXPECT_TRUE(fs::exists(dst));
}

TEST_F(FileSystemToolsTest, SearchIsCaseInsensitiveAndStaysInSandbox) {
    fs::create_directory_symlink(dir_ / "outside", fs::path(root_) / "report-escape");
    auto matches = FileSystemTools::search_files(*validator_, root_, "REPORT");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0], (fs::path(root_) / "docs" / "Report.md").string());
}

TEST_F(FileSystemToolsTest, SearchToolFormatsResults) {
    SearchFilesTool tool(validator_);
    auto hit = tool.execute({{"path", root_}, {"pattern", "notes"}});
    EXPECT_EQ(hit.text, "1 matches found:\n" + root_ + "/notes.txt");

    auto miss = tool.execute({{"path", root_}, {"pattern", "zzz"}});
    EXPECT_EQ(miss.text, "No matches found");
}

TEST_F(FileSystemToolsTest, MetadataForTextFile) {
    fs::path p = fs::path(root_) / "notes.txt";
    ::chmod(p.c_str(), 0640);
    FileMetadata meta = FileSystemTools::read_metadata(p);
    EXPECT_TRUE(meta.exists);
    EXPECT_TRUE(meta.is_file);
    EXPECT_FALSE(meta.is_directory);
    EXPECT_EQ(meta.size, 18u);
    EXPECT_EQ(meta.permissions, 0640u);
    ASSERT_TRUE(meta.line_count.has_value());
    EXPECT_EQ(*meta.line_count, 2u);

    std::string text = FileSystemTools::format_metadata(meta);
    EXPECT_NE(text.find("size: 18"), std::string::npos);
    EXPECT_NE(text.find("permissions: 640"), std::string::npos);
    EXPECT_NE(text.find("lines: 2"), std::string::npos);
}

TEST_F(FileSystemToolsTest, MetadataSkipsLineCountForBinary) {
    fs::path p = fs::path(root_) / "blob.bin";
    write_text(p, std::string("ab\0cd\n", 6));
    FileMetadata meta = FileSystemTools::read_metadata(p);
    EXPECT_TRUE(meta.exists);
    EXPECT_FALSE(meta.line_count.has_value());
}

TEST_F(FileSystemToolsTest, MetadataForMissingPath) {
    FileMetadata meta = FileSystemTools::read_metadata(fs::path(root_) / "ghost.txt");
    EXPECT_FALSE(meta.exists);
    EXPECT_EQ(FileSystemTools::format_metadata(meta), "exists: false");
}

TEST_F(FileSystemToolsTest, MetadataForDirectory) {
    FileMetadata meta = FileSystemTools::read_metadata(fs::path(root_) / "docs");
    EXPECT_TRUE(meta.is_directory);
    EXPECT_FALSE(meta.line_count.has_value());
}
