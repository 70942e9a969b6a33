#include "blobfetch/chunk_worker_pool.hpp"
#include "blobfetch/errors.hpp"
#include "blobfetch/options.hpp"

#include "test_utils.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using blobfetch::ConfigurationError;
using blobfetch::parseArguments;

TEST(ParseArgumentsTest, Defaults) {
    const auto cl = parseArguments({"--blob-url", "https://acct.blob.example/c/data.bin"});

    EXPECT_EQ(cl.options.url, "https://acct.blob.example/c/data.bin");
    EXPECT_TRUE(cl.options.destination.empty());
    EXPECT_FALSE(cl.options.bearer_token.has_value());
    EXPECT_EQ(cl.options.concurrency, 1);
    EXPECT_EQ(cl.options.chunk_size, blobfetch::kDefaultChunkSize);
    EXPECT_FALSE(cl.verbose);
    EXPECT_FALSE(cl.show_help);
}

TEST(ParseArgumentsTest, AllOptions) {
    const auto cl = parseArguments({"--blob-url", "https://h/c/x.iso", "--local-path", "/tmp/out.iso",
                                    "--bearer-token", "secret", "-t", "6", "-c", "8M", "-v"});

    EXPECT_EQ(cl.options.destination.string(), "/tmp/out.iso");
    EXPECT_EQ(cl.options.bearer_token.value_or(""), "secret");
    EXPECT_EQ(cl.options.concurrency, 6);
    EXPECT_EQ(cl.options.chunk_size, 8 * 1024 * 1024);
    EXPECT_TRUE(cl.verbose);
}

TEST(ParseArgumentsTest, HelpStopsParsing) {
    const auto cl = parseArguments({"-h", "--bogus"});
    EXPECT_TRUE(cl.show_help);
}

TEST(ParseArgumentsTest, Errors) {
    EXPECT_THROW((void)parseArguments({}), ConfigurationError);
    EXPECT_THROW((void)parseArguments({"--local-path", "x"}), ConfigurationError);
    EXPECT_THROW((void)parseArguments({"--blob-url"}), ConfigurationError);
    EXPECT_THROW((void)parseArguments({"--blob-url", "u", "--unknown"}), ConfigurationError);
    EXPECT_THROW((void)parseArguments({"--blob-url", "u", "-t", "0"}), ConfigurationError);
}

TEST(ParseConcurrencyTest, ExplicitAndAuto) {
    EXPECT_EQ(blobfetch::parseConcurrency("1"), 1);
    EXPECT_EQ(blobfetch::parseConcurrency("64"), 64);

    const int automatic = blobfetch::parseConcurrency("auto");
    EXPECT_GE(automatic, 1);
    EXPECT_LE(automatic, blobfetch::kMaxAutoConcurrency);
    EXPECT_EQ(automatic, blobfetch::autoConcurrency());

    EXPECT_THROW((void)blobfetch::parseConcurrency("65"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseConcurrency("-2"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseConcurrency("four"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseConcurrency("4x"), ConfigurationError);
}

TEST(ParseByteSizeTest, Suffixes) {
    EXPECT_EQ(blobfetch::parseByteSize("4096"), 4096);
    EXPECT_EQ(blobfetch::parseByteSize("64k"), 64 * 1024);
    EXPECT_EQ(blobfetch::parseByteSize("4M"), 4 * 1024 * 1024);
    EXPECT_EQ(blobfetch::parseByteSize("1G"), 1024LL * 1024 * 1024);

    EXPECT_THROW((void)blobfetch::parseByteSize(""), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseByteSize("0"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseByteSize("M"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseByteSize("1.5M"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseByteSize("99999999999999999999"), ConfigurationError);
}

TEST(ParseChunkSizeTest, CappedAtOneGigabyte) {
    EXPECT_EQ(blobfetch::parseChunkSize("1G"), blobfetch::kMaxChunkSize);
    EXPECT_EQ(blobfetch::parseChunkSize("4M"), 4 * 1024 * 1024);

    EXPECT_THROW((void)blobfetch::parseChunkSize("2G"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseChunkSize("1073741825"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseChunkSize("9223372036854775807"), ConfigurationError);
    EXPECT_THROW((void)blobfetch::parseChunkSize("8589934591G"), ConfigurationError);
    EXPECT_THROW((void)parseArguments({"--blob-url", "u", "-c", "9223372036854775807"}), ConfigurationError);
}

TEST(ResolveDestinationTest, DirectoryTakesNameFromUrl) {
    blobfetch::testing::TempDir dir;

    EXPECT_EQ(blobfetch::resolveDestination("https://acct.example/container/disk%20image.vhd?sv=1", dir.path()).string(),
              (dir.path() / "disk image.vhd").string());
}

TEST(ResolveDestinationTest, FilePathIsKept) {
    blobfetch::testing::TempDir dir;
    const auto target = dir.file("chosen.bin");

    EXPECT_EQ(blobfetch::resolveDestination("https://acct.example/container/other.bin", target).string(), target.string());
}

TEST(ResolveDestinationTest, UrlWithoutFileNameIsRejected) {
    blobfetch::testing::TempDir dir;

    EXPECT_THROW((void)blobfetch::resolveDestination("https://acct.example/container/", dir.path()),
                 ConfigurationError);
}
