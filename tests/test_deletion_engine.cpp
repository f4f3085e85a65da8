#include "minitest.hpp"
#include "app/DeletionEngine.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using dustpan::model::FileItem;

static fs::path test_dir(const char* suffix) {
  return fs::temp_directory_path() /
         ("dustpan_deletion_test_" + std::to_string(::getpid()) + "_" + suffix);
}

static void write_bytes(const fs::path& p, size_t n) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p, std::ios::binary);
  f << std::string(n, 'x');
}

TEST(delete_one_removes_directory_tree) {
  auto root = test_dir("tree");
  fs::remove_all(root);
  write_bytes(root / "victim" / "a.bin", 40);
  write_bytes(root / "victim" / "sub" / "b.bin", 60);
  auto out = dustpan::app::delete_one(FileItem{.path = (root / "victim").string(), .size = 1, .is_dir = true});
  ASSERT_TRUE(out.ok);
  ASSERT_EQ(out.requested, 1u);
  ASSERT_EQ(out.removed.size(), 1u);
  ASSERT_EQ(out.freed, 100u);
  ASSERT_TRUE(!fs::exists(root / "victim"));
  fs::remove_all(root);
}

TEST(delete_one_missing_path_is_idempotent) {
  auto root = test_dir("missing");
  fs::remove_all(root);
  write_bytes(root / "f", 10);
  FileItem item{.path = (root / "f").string(), .size = 10};
  auto first = dustpan::app::delete_one(item);
  ASSERT_TRUE(first.ok);
  ASSERT_EQ(first.freed, 10u);
  auto second = dustpan::app::delete_one(item);
  ASSERT_TRUE(second.ok);
  ASSERT_EQ(second.freed, 0u);
  ASSERT_EQ(second.removed.size(), 1u);
  ASSERT_EQ(second.removed.front().path, item.path);
  fs::remove_all(root);
}

TEST(delete_one_reports_failure) {
  if (::geteuid() == 0) return; // root ignores directory permissions
  auto root = test_dir("denied");
  fs::remove_all(root);
  write_bytes(root / "locked" / "f", 10);
  ::chmod((root / "locked").c_str(), 0500);
  auto out = dustpan::app::delete_one(FileItem{.path = (root / "locked" / "f").string(), .size = 10});
  ASSERT_TRUE(!out.ok);
  ASSERT_EQ(out.failed_path, (root / "locked" / "f").string());
  ASSERT_TRUE(!out.error.empty());
  ASSERT_TRUE(out.removed.empty());
  ::chmod((root / "locked").c_str(), 0700);
  fs::remove_all(root);
}

TEST(delete_marked_only_removes_marked_entries) {
  auto root = test_dir("marked");
  fs::remove_all(root);
  write_bytes(root / "p1", 10);
  write_bytes(root / "p2", 20);
  write_bytes(root / "p3", 5);
  std::vector<FileItem> listing{
    {.path = (root / "p2").string(), .size = 20},
    {.path = (root / "p1").string(), .size = 10},
    {.path = (root / "p3").string(), .size = 5},
  };
  dustpan::model::SelectionSet marks{(root / "p2").string(), (root / "p3").string(), "/not/listed"};
  auto out = dustpan::app::delete_marked(marks, listing);
  ASSERT_TRUE(out.ok);
  ASSERT_EQ(out.requested, 2u);
  ASSERT_EQ(out.removed.size(), 2u);
  ASSERT_EQ(out.removed[0].path, (root / "p2").string());
  ASSERT_EQ(out.freed, 25u);
  ASSERT_TRUE(fs::exists(root / "p1"));
  ASSERT_TRUE(!fs::exists(root / "p2"));
  fs::remove_all(root);
}

TEST(delete_marked_with_no_marks_does_nothing) {
  std::vector<FileItem> listing{{.path = "/tmp/never_touched", .size = 1}};
  auto out = dustpan::app::delete_marked({}, listing);
  ASSERT_EQ(out.requested, 0u);
  ASSERT_TRUE(out.removed.empty());
  ASSERT_EQ(out.freed, 0u);
}

TEST(delete_category_removes_every_item) {
  auto root = test_dir("category");
  fs::remove_all(root);
  write_bytes(root / "a" / "x", 3);
  write_bytes(root / "b", 4);
  dustpan::model::ScanResult r;
  r.category = "Trash";
  r.add({.path = (root / "a").string(), .size = 3, .is_dir = true});
  r.add({.path = (root / "b").string(), .size = 4});
  auto out = dustpan::app::delete_category(r);
  ASSERT_EQ(out.category, std::string("Trash"));
  ASSERT_TRUE(out.origin == dustpan::app::DeletionOrigin::Results);
  ASSERT_EQ(out.removed.size(), 2u);
  ASSERT_EQ(out.freed, 7u);
  ASSERT_TRUE(!fs::exists(root / "a"));
  ASSERT_TRUE(!fs::exists(root / "b"));
  fs::remove_all(root);
}
