#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <sstream>

#include "test_utils.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "core/Compressor.hpp"
#include "core/ZipArchive.hpp"

namespace fs = std::filesystem;

namespace idemzip::test {

using namespace idemzip::test::utils;

/**
 * @brief End-to-end packaging scenarios
 *
 * A "build" zips a source tree the way a packager would: entries in
 * whatever order, wall-clock timestamps, directory entries included.
 * Repacking must make two builds of unchanged sources byte-identical.
 */
class RepackWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        CommandFactory::registerBuiltins();
        tempDir = createTempDir();
        service = tempDir / "svc";
        sources = tempDir / "src";
        createFiles(sources, {
            {"handler.js", "exports.handler = async () => ({ statusCode: 200 });\n"},
            {"lib/db.js", "module.exports = {};\n"},
            {"node_modules/left-pad/index.js", std::string(3000, 'p')},
        });
        ctx.out = &out;
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    /// Zip the sources with build-specific timestamps and entry order
    void build(const std::string& function, std::time_t when, bool reverse) {
        std::vector<ZipEntry> entries;
        entries.push_back(dirEntry("lib", when));
        for (const auto& name : DeflateCompressor::canonicalEntries(sources, false)) {
            entries.push_back(fileEntry(name, readFile(sources / name), when + static_cast<std::time_t>(entries.size())));
        }
        if (reverse) std::reverse(entries.begin(), entries.end());
        makeZip(service / ".serverless" / (function + ".zip"), entries, reverse ? 1 : 6);
    }

    Expected<void> run(const std::vector<std::string>& args) {
        auto cmd = CommandFactory::instance().create(args.front());
        EXPECT_NE(cmd, nullptr);
        return invoker.invoke(*cmd, ctx, std::vector<std::string>(args.begin() + 1, args.end()));
    }

    fs::path tempDir;
    fs::path service;
    fs::path sources;
    CommandInvoker invoker;
    std::ostringstream out;
    AppContext ctx;
};

// Test: Two builds of unchanged sources are identical after repacking
TEST_F(RepackWorkflowTest, RebuildsAreByteIdentical) {
    build("api", 1600000000, false);
    std::string rawFirst = readFile(service / ".serverless" / "api.zip");
    ASSERT_TRUE(run({"repack-service", service.string(), "--individually", "--function", "api"}).has_value()) << out.str();
    std::string first = readFile(service / ".serverless" / "api.zip");

    build("api", 1700000000, true);
    ASSERT_NE(readFile(service / ".serverless" / "api.zip"), rawFirst);
    ASSERT_TRUE(run({"repack-service", service.string(), "--individually", "--function", "api"}).has_value()) << out.str();

    EXPECT_EQ(readFile(service / ".serverless" / "api.zip"), first);
}

// Test: Changed sources give a different archive
TEST_F(RepackWorkflowTest, ContentChangeIsVisible) {
    build("api", 1600000000, false);
    ASSERT_TRUE(run({"repack", "--scratch", (tempDir / "scratch").string(),
                     (service / ".serverless" / "api.zip").string()}).has_value());
    std::string before = readFile(service / ".serverless" / "api.zip");

    createFile(sources, "lib/db.js", "module.exports = { pool: 1 };\n");
    build("api", 1600000000, false);
    ASSERT_TRUE(run({"repack", "--scratch", (tempDir / "scratch").string(),
                     (service / ".serverless" / "api.zip").string()}).has_value());

    EXPECT_NE(readFile(service / ".serverless" / "api.zip"), before);
}

// Test: Several functions with a corrupt artifact among them
TEST_F(RepackWorkflowTest, MixedBatch) {
    build("api", 1600000000, false);
    build("worker", 1650000000, true);
    createFile(service / ".serverless", "broken.zip", "truncated upload");

    auto res = run({"repack-service", service.string(), "--individually",
                    "--function", "api", "--function", "worker", "--jobs", "2"});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ExtractionFailed);

    // Both good archives were still rebuilt, identically since sources match
    EXPECT_EQ(readFile(service / ".serverless" / "api.zip"), readFile(service / ".serverless" / "worker.zip"));
    EXPECT_EQ(readFile(service / ".serverless" / "broken.zip"), "truncated upload");
    EXPECT_FALSE(fs::exists(service / ".repack"));
}

// Test: Inspect reports the same checksum for two equal rebuilds
TEST_F(RepackWorkflowTest, InspectAfterRepack) {
    build("api", 1600000000, false);
    build("worker", 1700000000, true);
    ASSERT_TRUE(run({"repack-service", service.string(), "--individually",
                     "--function", "api", "--function", "worker"}).has_value());

    out.str("");
    ASSERT_TRUE(run({"inspect", (service / ".serverless" / "api.zip").string()}).has_value());
    std::string api = out.str();
    out.str("");
    ASSERT_TRUE(run({"inspect", (service / ".serverless" / "worker.zip").string()}).has_value());
    EXPECT_EQ(out.str(), api);
    EXPECT_EQ(api.find("lib/\n"), std::string::npos);
}

} // namespace idemzip::test
