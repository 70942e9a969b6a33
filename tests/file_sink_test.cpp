#include "blobfetch/errors.hpp"
#include "blobfetch/file_sink.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using blobfetch::FileSink;
using blobfetch::localFileLength;
using blobfetch::testing::TempDir;

TEST(FileSinkTest, LocalFileLength) {
    TempDir dir;
    EXPECT_FALSE(localFileLength(dir.file("missing.bin")).has_value());

    blobfetch::testing::writeFile(dir.file("present.bin"), std::string(1234, 'x'));
    EXPECT_EQ(localFileLength(dir.file("present.bin")).value_or(-1), 1234);

    EXPECT_THROW((void)localFileLength(dir.path()), blobfetch::LocalIOError);
}

TEST(FileSinkTest, OpeningKeepsExistingContents) {
    TempDir dir;
    const auto path = dir.file("keep.bin");
    blobfetch::testing::writeFile(path, "existing");

    FileSink sink{path};
    EXPECT_EQ(sink.size(), 8);
    sink.writeAt(8, "-more", 5);

    EXPECT_EQ(blobfetch::testing::readFile(path), "existing-more");
}

TEST(FileSinkTest, WritesLandAtTheirOffsetsInAnyOrder) {
    TempDir dir;
    const auto path = dir.file("order.bin");
    {
        FileSink sink{path};
        EXPECT_EQ(sink.writeAt(6, "world", 5), 5u);
        EXPECT_EQ(sink.writeAt(0, "hello ", 6), 6u);
        sink.sync();
    }
    EXPECT_EQ(blobfetch::testing::readFile(path), "hello world");
}

TEST(FileSinkTest, ConcurrentDisjointWriters) {
    TempDir dir;
    const auto path = dir.file("concurrent.bin");
    const auto data = blobfetch::testing::makeData(64 * 1024);
    constexpr std::size_t kWriters = 8;
    constexpr std::size_t kSlice = 8 * 1024;
    constexpr std::size_t kBuffer = 100;

    {
        FileSink sink{path};
        std::vector<std::thread> writers;
        for (std::size_t w = 0; w < kWriters; ++w) {
            writers.emplace_back([&, w] {
                const std::size_t begin = w * kSlice;
                for (std::size_t pos = begin; pos < begin + kSlice; pos += kBuffer) {
                    const std::size_t n = std::min(kBuffer, begin + kSlice - pos);
                    sink.writeAt(static_cast<std::int64_t>(pos), data.data() + pos, n);
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
    }
    EXPECT_EQ(blobfetch::testing::readFile(path), data);
}

TEST(FileSinkTest, TruncateShrinksTheFile) {
    TempDir dir;
    const auto path = dir.file("truncate.bin");
    FileSink sink{path};
    sink.writeAt(0, "0123456789", 10);
    sink.truncate(4);

    EXPECT_EQ(sink.size(), 4);
    EXPECT_EQ(blobfetch::testing::readFile(path), "0123");
}

TEST(FileSinkTest, OpenFailureIsLocalIOError) {
    TempDir dir;
    EXPECT_THROW(FileSink{dir.file("no-such-dir") / "file.bin"}, blobfetch::LocalIOError);
}
