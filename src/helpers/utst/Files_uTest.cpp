/**
 * @file Files_uTest.cpp
 * @brief Unit tests for wattmeter::helpers::files.
 *
 * Notes:
 *  - Uses a scratch directory under the system temp path.
 */

#include "src/helpers/inc/Files.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

using wattmeter::helpers::files::FileValue;
using wattmeter::helpers::files::isDirectory;
using wattmeter::helpers::files::pathExists;
using wattmeter::helpers::files::readFileString;
using wattmeter::helpers::files::readFileUint64;

class FilesTest : public ::testing::Test {
protected:
  fs::path dir_{};

  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("wattmeter_files_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string write(const std::string& name, const std::string& content) {
    const fs::path P = dir_ / name;
    std::ofstream(P) << content;
    return P.string();
  }
};

/** @test Integer attribute with trailing newline. */
TEST_F(FilesTest, ReadUint64) {
  const FileValue<std::uint64_t> V = readFileUint64(write("energy_uj", "123456789\n"));
  ASSERT_TRUE(V.ok());
  EXPECT_EQ(V.value, 123456789U);
}

/** @test Missing file reports ENOENT. */
TEST_F(FilesTest, MissingFileReportsErrno) {
  const FileValue<std::uint64_t> V = readFileUint64((dir_ / "nope").string());
  EXPECT_FALSE(V.ok());
  EXPECT_EQ(V.error, ENOENT);
}

/** @test Unparsable content reports EINVAL; empty content reports EIO. */
TEST_F(FilesTest, BadContent) {
  EXPECT_EQ(readFileUint64(write("junk", "abc\n")).error, EINVAL);
  EXPECT_EQ(readFileUint64(write("empty", "")).error, EIO);
}

/** @test Text attributes are trimmed; failures yield an empty string. */
TEST_F(FilesTest, ReadString) {
  EXPECT_EQ(readFileString(write("name", "package-0\n")), "package-0");
  EXPECT_EQ(readFileString((dir_ / "absent").string()), "");
}

/** @test Path predicates. */
TEST_F(FilesTest, PathPredicates) {
  const std::string FILE = write("f", "1");
  EXPECT_TRUE(pathExists(FILE));
  EXPECT_FALSE(isDirectory(FILE));
  EXPECT_TRUE(isDirectory(dir_.string()));
  EXPECT_FALSE(pathExists((dir_ / "missing").string()));
}
