#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/Errors.hpp"
#include "core/Extractor.hpp"

namespace fs = std::filesystem;

using namespace idemzip;
using namespace idemzip::test::utils;

class ExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

// Test: Files and directories land below the destination with their bytes
TEST_F(ExtractorTest, ExtractsTree) {
    fs::path zip = makeZip(tempDir / "a.zip", {
        dirEntry("empty"),
        fileEntry("b/file.txt", "bee"),
        fileEntry("a.txt", "ay"),
    });

    fs::path dest = tempDir / "out";
    EXPECT_EQ(Extractor::extract(zip, dest), 3u);
    EXPECT_EQ(readFile(dest / "a.txt"), "ay");
    EXPECT_EQ(readFile(dest / "b" / "file.txt"), "bee");
    EXPECT_TRUE(fs::is_directory(dest / "empty"));
}

// Test: Recorded permission bits are applied; files stay owner-readable
TEST_F(ExtractorTest, AppliesPermissions) {
    fs::path zip = makeZip(tempDir / "p.zip", {
        fileEntry("run.sh", "#!/bin/sh\n", 1700000000, 0100755),
        fileEntry("plain.txt", "p", 1700000000, 0),
        fileEntry("locked.txt", "l", 1700000000, 0100400),
        fileEntry("setuid", "s", 1700000000, 0104755),
    });

    fs::path dest = tempDir / "out";
    Extractor::extract(zip, dest);
    EXPECT_EQ(getMode(dest / "run.sh") & 0777, 0755u);
    EXPECT_EQ(getMode(dest / "plain.txt") & 0700, 0600u);
    EXPECT_EQ(getMode(dest / "plain.txt") & 0111, 0u);
    EXPECT_EQ(getMode(dest / "locked.txt") & 0777, 0600u);
    EXPECT_EQ(getMode(dest / "setuid") & 07777, 0755u);
}

// Test: Symlink entries are recreated as links
TEST_F(ExtractorTest, RecreatesSymlinks) {
    fs::path zip = makeZip(tempDir / "l.zip", {
        fileEntry("current", "lib/v1.js", 1700000000, 0120777),
        fileEntry("lib/v1.js", "v1"),
    });

    fs::path dest = tempDir / "out";
    Extractor::extract(zip, dest);
    ASSERT_TRUE(fs::is_symlink(dest / "current"));
    EXPECT_EQ(fs::read_symlink(dest / "current"), fs::path("lib/v1.js"));
    EXPECT_EQ(readFile(dest / "current"), "v1");
}

// Test: Existing destination is refused
TEST_F(ExtractorTest, DestinationMustNotExist) {
    fs::path zip = makeZip(tempDir / "a.zip", {fileEntry("a.txt", "a")});
    fs::create_directories(tempDir / "out");
    EXPECT_THROW(Extractor::extract(zip, tempDir / "out"), ExtractionError);
}

// Test: Corrupt archive fails without creating the destination
TEST_F(ExtractorTest, CorruptArchiveLeavesNoDestination) {
    createFile(tempDir, "bad.zip", "PK but not really");
    EXPECT_THROW(Extractor::extract(tempDir / "bad.zip", tempDir / "out"), ExtractionError);
    EXPECT_FALSE(fs::exists(tempDir / "out"));
}

// Test: Entries escaping the destination are rejected before anything is written
TEST_F(ExtractorTest, RejectsPathTraversal) {
    fs::path zip = makeZip(tempDir / "slip.zip", {
        fileEntry("ok.txt", "ok"),
        fileEntry("../../evil.txt", "evil"),
    });

    EXPECT_THROW(Extractor::extract(zip, tempDir / "out" / "x"), ExtractionError);
    EXPECT_FALSE(fs::exists(tempDir / "evil.txt"));
    EXPECT_FALSE(fs::exists(tempDir / "out" / "x"));
}

// Test: Absolute entry names are rejected
TEST_F(ExtractorTest, RejectsAbsolutePath) {
    fs::path zip = makeZip(tempDir / "abs.zip", {fileEntry("/etc/evil", "evil")});
    EXPECT_THROW(Extractor::extract(zip, tempDir / "out"), ExtractionError);
}

// Test: Names that normalize to the same path collide
TEST_F(ExtractorTest, RejectsNormalizedCollision) {
    fs::path zip = makeZip(tempDir / "dup.zip", {fileEntry("a/b.txt", "1"), fileEntry("a/./b.txt", "2")});
    EXPECT_THROW(Extractor::extract(zip, tempDir / "out"), ExtractionError);
}

// Test: A file entry that is also a parent of another entry is refused up front
TEST_F(ExtractorTest, RejectsFileAsParent) {
    fs::path zip = makeZip(tempDir / "fp.zip", {fileEntry("x", "file"), fileEntry("x/y", "child")});
    EXPECT_THROW(Extractor::extract(zip, tempDir / "out"), ExtractionError);
    EXPECT_FALSE(fs::exists(tempDir / "out"));

    // Order does not matter
    fs::path reversed = makeZip(tempDir / "pf.zip", {fileEntry("x/y/z", "child"), fileEntry("x/y", "file")});
    EXPECT_THROW(Extractor::extract(reversed, tempDir / "out"), ExtractionError);
    EXPECT_FALSE(fs::exists(tempDir / "out"));
}

// Test: Writing through an archived symlink is refused before anything is written
TEST_F(ExtractorTest, RejectsEntryBelowSymlink) {
    fs::path zip = makeZip(tempDir / "ls.zip", {
        fileEntry("link", tempDir.string(), 1700000000, 0120777),
        fileEntry("link/escape.txt", "x"),
    });
    EXPECT_THROW(Extractor::extract(zip, tempDir / "out"), ExtractionError);
    EXPECT_FALSE(fs::exists(tempDir / "escape.txt"));
    EXPECT_FALSE(fs::exists(tempDir / "out"));
}

// Test: Device and fifo entries are not extracted
TEST_F(ExtractorTest, RejectsSpecialFiles) {
    fs::path zip = makeZip(tempDir / "fifo.zip", {fileEntry("pipe", "", 1700000000, 010644)});
    EXPECT_THROW(Extractor::extract(zip, tempDir / "out"), ExtractionError);
    EXPECT_FALSE(fs::exists(tempDir / "out"));
}

// Test: Corrupt entry data is caught while streaming and reported as extraction failure
TEST_F(ExtractorTest, RejectsCorruptData) {
    fs::path zip = makeZip(tempDir / "crc.zip", {fileEntry("a.txt", "hello")}, 0);
    std::string bytes = readFile(zip);
    bytes[30 + 5] = 'j';
    fs::path bad = createFile(tempDir, "bad-crc.zip", bytes);
    EXPECT_THROW(Extractor::extract(bad, tempDir / "out"), ExtractionError);
}

// Test: Name validation
TEST_F(ExtractorTest, SafeRelativePath) {
    EXPECT_EQ(Extractor::safeRelativePath("a/b/../c.txt"), fs::path("a/c.txt"));
    EXPECT_EQ(Extractor::safeRelativePath("dir/"), fs::path("dir"));
    EXPECT_THROW(Extractor::safeRelativePath(".."), ExtractionError);
    EXPECT_THROW(Extractor::safeRelativePath("a/../../b"), ExtractionError);
    EXPECT_THROW(Extractor::safeRelativePath("./"), ExtractionError);
    EXPECT_THROW(Extractor::safeRelativePath("/abs"), ExtractionError);
}
