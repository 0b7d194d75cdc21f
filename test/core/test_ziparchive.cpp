#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "core/Errors.hpp"
#include "core/ZipArchive.hpp"

namespace fs = std::filesystem;

using namespace idemzip;
using namespace idemzip::test::utils;

class ZipArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

// Test: Entries come back in stored order with their content and attributes
TEST_F(ZipArchiveTest, ReadsBackWrittenEntries) {
    std::string big(4096, 'x');
    fs::path zip = makeZip(tempDir / "a.zip", {
        fileEntry("z.txt", "last"),
        dirEntry("lib"),
        fileEntry("lib/run.sh", "#!/bin/sh\n", 1700000000, 0100755),
        fileEntry("big.txt", big),
    });

    auto entries = ZipReader::readAll(zip);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "z.txt");
    EXPECT_EQ(entries[0].content, "last");
    EXPECT_EQ(entries[1].name, "lib/");
    EXPECT_TRUE(entries[1].isDirectory);
    EXPECT_EQ(entries[2].mode, 0100755u);
    EXPECT_EQ(entries[3].content, big);
    EXPECT_EQ(entries[3].method, 8);           // repetitive content deflates
    EXPECT_EQ(entries[0].method, 0);           // too small to shrink
    EXPECT_EQ(entries[3].crc32, crc32Of(big));
}

// Test: Level 0 stores everything
TEST_F(ZipArchiveTest, LevelZeroStores) {
    fs::path zip = makeZip(tempDir / "s.zip", {fileEntry("big.txt", std::string(4096, 'x'))}, 0);
    auto entries = ZipReader::readAll(zip);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].method, 0);
    EXPECT_EQ(readFile(zip).size(), 30u + 7u + 4096u + 46u + 7u + 22u);
}

// Test: Entries without Unix attributes read back as plain, non-executable files
TEST_F(ZipArchiveTest, NoUnixAttributes) {
    fs::path zip = makeZip(tempDir / "m.zip", {fileEntry("plain.txt", "p", 1700000000, 0)});
    auto entries = ZipReader::readAll(zip);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].mode & Constants::MODE_TYPE_MASK, Constants::MODE_FILE & Constants::MODE_TYPE_MASK);
    EXPECT_EQ(entries[0].mode & 0111, 0u);
    EXPECT_FALSE(entries[0].isDirectory);
}

// Test: Entries can be walked one at a time, with or without their data
TEST_F(ZipArchiveTest, StreamsEntries) {
    fs::path zip = makeZip(tempDir / "s.zip", {
        fileEntry("a.txt", std::string(10000, 'a')),
        fileEntry("current", "a.txt", 1700000000, 0120777),
    });

    ZipReader reader(zip);
    ZipEntry entry;
    ASSERT_TRUE(reader.next(entry, false));
    EXPECT_EQ(entry.name, "a.txt");
    EXPECT_TRUE(entry.content.empty());
    ASSERT_TRUE(reader.next(entry));
    EXPECT_TRUE(entry.isSymlink());
    EXPECT_EQ(entry.content, "a.txt");
    EXPECT_FALSE(reader.next(entry));
}

// Test: Identical input gives identical bytes
TEST_F(ZipArchiveTest, WriterIsDeterministic) {
    std::vector<ZipEntry> entries{fileEntry("a.txt", "alpha"), fileEntry("b/c.txt", std::string(1000, 'c'))};
    makeZip(tempDir / "1.zip", entries);
    makeZip(tempDir / "2.zip", entries);
    EXPECT_EQ(readFile(tempDir / "1.zip"), readFile(tempDir / "2.zip"));
}

// Test: Non-zip data is rejected
TEST_F(ZipArchiveTest, RejectsGarbage) {
    createFile(tempDir, "bad.zip", "this is not a zip archive at all");
    EXPECT_THROW(ZipReader::readAll(tempDir / "bad.zip"), ExtractionError);
    EXPECT_THROW(ZipReader::parse("", "empty"), ExtractionError);
}

// Test: Missing file is an extraction failure
TEST_F(ZipArchiveTest, RejectsMissingFile) {
    EXPECT_THROW(ZipReader::readAll(tempDir / "absent.zip"), ExtractionError);
}

// Test: Truncated archive is rejected
TEST_F(ZipArchiveTest, RejectsTruncated) {
    fs::path zip = makeZip(tempDir / "t.zip", {fileEntry("a.txt", std::string(2000, 'a'))});
    std::string bytes = readFile(zip);
    EXPECT_THROW(ZipReader::parse(bytes.substr(0, bytes.size() / 2), "half"), ExtractionError);
}

// Test: Flipped content byte fails the CRC check
TEST_F(ZipArchiveTest, RejectsCrcMismatch) {
    fs::path zip = makeZip(tempDir / "c.zip", {fileEntry("a.txt", "hello")}, 0);
    std::string bytes = readFile(zip);
    // Stored data follows the 30-byte local header and the 5-byte name
    bytes[30 + 5] = 'j';
    EXPECT_THROW(ZipReader::parse(bytes, "crc"), ExtractionError);
}

// Test: Duplicate names are rejected
TEST_F(ZipArchiveTest, RejectsDuplicateNames) {
    fs::path zip = makeZip(tempDir / "d.zip", {fileEntry("a.txt", "1"), fileEntry("a.txt", "2")});
    EXPECT_THROW(ZipReader::readAll(zip), ExtractionError);
}

// Test: Encrypted flag is rejected
TEST_F(ZipArchiveTest, RejectsEncryptedEntry) {
    fs::path zip = makeZip(tempDir / "e.zip", {fileEntry("a.txt", "secret")}, 0);
    std::string bytes = readFile(zip);
    size_t cd = bytes.find(std::string("PK\x01\x02", 4));
    ASSERT_NE(cd, std::string::npos);
    // General purpose flags sit at offset 6 of the local header, 8 of the directory record
    bytes[6] = static_cast<char>(bytes[6] | 0x01);
    bytes[cd + 8] = static_cast<char>(bytes[cd + 8] | 0x01);
    EXPECT_THROW(ZipReader::parse(bytes, "enc"), ExtractionError);
}

// Test: Unknown method is rejected
TEST_F(ZipArchiveTest, RejectsUnsupportedMethod) {
    fs::path zip = makeZip(tempDir / "u.zip", {fileEntry("a.txt", "data")}, 0);
    std::string bytes = readFile(zip);
    size_t cd = bytes.find(std::string("PK\x01\x02", 4));
    ASSERT_NE(cd, std::string::npos);
    bytes[8] = 77;        // method, local header
    bytes[cd + 10] = 77;  // method, directory record
    EXPECT_THROW(ZipReader::parse(bytes, "m77"), ExtractionError);
}

// Test: Raw deflate output is what the writer stores and libarchive inflates
TEST_F(ZipArchiveTest, DeflateRaw) {
    std::string data;
    for (int i = 0; i < 500; ++i) data += "line " + std::to_string(i) + "\n";
    std::string packed = deflateRaw(data, 6);
    EXPECT_LT(packed.size(), data.size());
    EXPECT_EQ(deflateRaw(data, 6), packed);

    fs::path zip = makeZip(tempDir / "d.zip", {fileEntry("lines.txt", data)});
    std::string bytes = readFile(zip);
    EXPECT_NE(bytes.find(packed), std::string::npos);
    auto entries = ZipReader::readAll(zip);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].content, data);
    EXPECT_EQ(entries[0].crc32, crc32Of(data));
}

// Test: DOS time conversion is UTC and clamps to 1980
TEST_F(ZipArchiveTest, DosDateTime) {
    uint16_t date = 0, time = 0;
    toDosDateTime(633830400, date, time);   // 1990-02-01T00:00:00Z
    EXPECT_EQ(formatDosDateTime(date, time), "1990-02-01 00:00:00");

    toDosDateTime(0, date, time);
    EXPECT_EQ(formatDosDateTime(date, time), "1980-01-01 00:00:00");

    toDosDateTime(1700000001, date, time);  // 2023-11-14T22:13:21Z, seconds round down
    EXPECT_EQ(formatDosDateTime(date, time), "2023-11-14 22:13:20");
}
