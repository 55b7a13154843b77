#include "io/FileLogger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace {
  std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::filesystem::path tempFile(const char* name) {
    return std::filesystem::temp_directory_path() / name;
  }
} // namespace

TEST(file_logger, opens_writes_flushes_closes) {
  const auto path = tempFile("bangbang_file_logger.csv");

  bangbang::io::FileLogger log;
  ASSERT_TRUE(log.open(path.string()));
  EXPECT_TRUE(log.isOpen());
  EXPECT_TRUE(log.write("a,b\n"));
  EXPECT_TRUE(log.write("1,2\n"));

  // still buffered: nothing reached the file yet
  EXPECT_EQ(slurp(path), "");

  ASSERT_TRUE(log.flush());
  EXPECT_EQ(slurp(path), "a,b\n1,2\n");

  EXPECT_TRUE(log.write("3,4\n"));
  log.close();
  EXPECT_FALSE(log.isOpen());
  EXPECT_EQ(slurp(path), "a,b\n1,2\n3,4\n");

  std::filesystem::remove(path);
}

TEST(file_logger, flushes_on_full_chunk) {
  const auto path = tempFile("bangbang_file_logger_chunk.csv");

  bangbang::io::FileLogger log;
  ASSERT_TRUE(log.open(path.string()));
  const std::string big(bangbang::io::FileLogger::kChunkSize + 10, 'x');
  EXPECT_TRUE(log.write(big));
  EXPECT_EQ(slurp(path).size(), big.size());

  log.close();
  std::filesystem::remove(path);
}

TEST(file_logger, write_and_flush_fail_when_closed) {
  bangbang::io::FileLogger log;
  EXPECT_FALSE(log.write("nope\n"));
  EXPECT_FALSE(log.flush());
}

TEST(file_logger, open_fails_on_missing_directory) {
  bangbang::io::FileLogger log;
  EXPECT_FALSE(log.open("/nonexistent-dir/bangbang/run.csv"));
  EXPECT_FALSE(log.isOpen());
}

TEST(file_logger, move_transfers_ownership) {
  const auto path = tempFile("bangbang_file_logger_move.csv");

  bangbang::io::FileLogger first;
  ASSERT_TRUE(first.open(path.string()));
  EXPECT_TRUE(first.write("moved\n"));

  bangbang::io::FileLogger second(std::move(first));
  EXPECT_FALSE(first.isOpen());
  EXPECT_TRUE(second.isOpen());
  second.close();
  EXPECT_EQ(slurp(path), "moved\n");

  std::filesystem::remove(path);
}
