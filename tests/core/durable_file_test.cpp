#include "mirror/core/durable_file.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using mirror::ErrorKind;
using mirror::sync_directory;
using mirror::sync_file;
using mirror::test_support::TempDir;
using mirror::test_support::write_file;

TEST(DurableFile, SyncsExistingFileAndDirectory) {
    TempDir dir;
    write_file(dir / "data.bin", "payload");

    auto synced = sync_file(dir / "data.bin");
    EXPECT_TRUE(synced.is_ok()) << synced.error().message;
    auto synced_dir = sync_directory(dir.path());
    EXPECT_TRUE(synced_dir.is_ok()) << synced_dir.error().message;
}

TEST(DurableFile, MissingFileIsIoError) {
    TempDir dir;

    auto result = sync_file(dir / "missing.bin");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Io);
    EXPECT_NE(result.error().message.find("missing.bin"), std::string::npos);
}

TEST(DurableFile, RegularFileIsNotADirectory) {
    TempDir dir;
    write_file(dir / "plain.txt", "x");

    auto result = sync_directory(dir / "plain.txt");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Io);
}
