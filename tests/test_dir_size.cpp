#include "minitest.hpp"
#include "util/DirSize.hpp"
#include "util/HumanBytes.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path test_dir(const char* suffix) {
  return fs::temp_directory_path() /
         ("dustpan_dirsize_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static void write_bytes(const fs::path& p, size_t n) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary);
  f << std::string(n, 'x');
}

TEST(dir_size_sums_nested_files) {
  auto dir = test_dir("nested");
  fs::remove_all(dir);
  write_bytes(dir / "a.bin", 100);
  write_bytes(dir / "sub" / "b.bin", 50);
  write_bytes(dir / "sub" / "deeper" / "c.bin", 25);
  ASSERT_EQ(dustpan::util::directory_size(dir.string()), 175u);
  fs::remove_all(dir);
}

TEST(dir_size_of_file_and_missing_path) {
  auto dir = test_dir("file");
  fs::remove_all(dir);
  write_bytes(dir / "one.bin", 42);
  ASSERT_EQ(dustpan::util::directory_size((dir / "one.bin").string()), 42u);
  ASSERT_EQ(dustpan::util::directory_size((dir / "nope").string()), 0u);
  fs::remove_all(dir);
}

TEST(dir_size_does_not_follow_symlinks) {
  auto dir = test_dir("symlink");
  auto other = test_dir("symlink_target");
  fs::remove_all(dir);
  fs::remove_all(other);
  write_bytes(other / "big.bin", 4000);
  write_bytes(dir / "small.bin", 10);
  fs::create_directory_symlink(other, dir / "link");
  // The link itself has a small lstat size; the 4000 byte target must not be counted
  ASSERT_TRUE(dustpan::util::directory_size(dir.string()) < 4000u);
  fs::remove_all(dir);
  fs::remove_all(other);
}

TEST(dir_size_stop_request_returns_early) {
  auto dir = test_dir("stop");
  fs::remove_all(dir);
  write_bytes(dir / "a" / "x.bin", 10);
  std::stop_source src;
  src.request_stop();
  ASSERT_TRUE(dustpan::util::directory_size(dir.string(), src.get_token()) <= 10u);
  fs::remove_all(dir);
}

TEST(list_directory_sorted_by_size) {
  auto dir = test_dir("list");
  fs::remove_all(dir);
  write_bytes(dir / "dir" / "inner.bin", 70);
  write_bytes(dir / "file", 30);
  auto items = dustpan::util::list_directory(dir.string());
  ASSERT_TRUE(items.has_value());
  ASSERT_EQ(items->size(), 2u);
  ASSERT_EQ((*items)[0].name, std::string("dir"));
  ASSERT_EQ((*items)[0].size, 70u);
  ASSERT_TRUE((*items)[0].is_dir);
  ASSERT_EQ((*items)[1].name, std::string("file"));
  ASSERT_EQ((*items)[1].size, 30u);
  ASSERT_TRUE(!(*items)[1].is_dir);
  ASSERT_EQ((*items)[1].path, (dir / "file").string());
  fs::remove_all(dir);
}

TEST(list_directory_stop_request_skips_sizing) {
  auto dir = test_dir("list_stop");
  fs::remove_all(dir);
  write_bytes(dir / "a" / "x.bin", 10);
  write_bytes(dir / "b" / "y.bin", 10);
  std::stop_source src;
  src.request_stop();
  auto items = dustpan::util::list_directory(dir.string(), src.get_token());
  ASSERT_TRUE(items.has_value());
  ASSERT_TRUE(items->empty());
  ASSERT_EQ(dustpan::util::list_directory(dir.string())->size(), 2u);
  fs::remove_all(dir);
}

TEST(list_directory_unreadable_is_nullopt) {
  ASSERT_TRUE(!dustpan::util::list_directory("/nonexistent/dustpan/dir").has_value());
}

TEST(list_directory_empty_dir) {
  auto dir = test_dir("empty");
  fs::remove_all(dir);
  fs::create_directories(dir);
  auto items = dustpan::util::list_directory(dir.string());
  ASSERT_TRUE(items.has_value());
  ASSERT_TRUE(items->empty());
  fs::remove_all(dir);
}

TEST(join_path_single_separator) {
  ASSERT_EQ(dustpan::util::join_path("/a/b", "c"), std::string("/a/b/c"));
  ASSERT_EQ(dustpan::util::join_path("/a/b/", "c"), std::string("/a/b/c"));
}

TEST(human_bytes_si_units) {
  using dustpan::util::human_bytes;
  ASSERT_EQ(human_bytes(0), std::string("0 B"));
  ASSERT_EQ(human_bytes(5), std::string("5 B"));
  ASSERT_EQ(human_bytes(83), std::string("83 B"));
  ASSERT_EQ(human_bytes(1500), std::string("1.5 kB"));
  ASSERT_EQ(human_bytes(15000000), std::string("15 MB"));
  ASSERT_EQ(human_bytes(2300000000ull), std::string("2.3 GB"));
}

TEST(age_label_buckets) {
  using dustpan::util::age_label;
  ASSERT_EQ(age_label(3), std::string("3d"));
  ASSERT_EQ(age_label(35), std::string("5w"));
  ASSERT_EQ(age_label(800), std::string("2y"));
}
