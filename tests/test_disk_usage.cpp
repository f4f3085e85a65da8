#include "minitest.hpp"
#include "app/DiskUsage.hpp"
#include <string>

using dustpan::app::parse_df_output;

TEST(df_parses_gnu_layout) {
  const char* out =
    "Filesystem      Size  Used Avail Use% Mounted on\n"
    "/dev/nvme0n1p2  468G  201G  244G  46% /\n"
    "tmpfs           7.8G  1.2M  7.8G   1% /run/user/1000\n";
  auto rows = parse_df_output(out);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 2u);
  ASSERT_EQ((*rows)[0].filesystem, std::string("/dev/nvme0n1p2"));
  ASSERT_EQ((*rows)[0].size, std::string("468G"));
  ASSERT_EQ((*rows)[0].used, std::string("201G"));
  ASSERT_EQ((*rows)[0].avail, std::string("244G"));
  ASSERT_EQ((*rows)[0].capacity, std::string("46%"));
  ASSERT_EQ((*rows)[0].mounted_on, std::string("/"));
  ASSERT_EQ((*rows)[1].mounted_on, std::string("/run/user/1000"));
}

TEST(df_parses_bsd_layout_with_spaces_in_mount) {
  const char* out =
    "Filesystem       Size   Used  Avail Capacity iused      ifree %iused  Mounted on\n"
    "/dev/disk3s1s1  460Gi   10Gi  300Gi     4%  404k 3.1G    0%   /\n"
    "/dev/disk5s1    100Mi   20Mi   80Mi    20%    12  800k    0%   /Volumes/My Disk\n";
  auto rows = parse_df_output(out);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 2u);
  ASSERT_EQ((*rows)[0].capacity, std::string("4%"));
  ASSERT_EQ((*rows)[0].mounted_on, std::string("/"));
  ASSERT_EQ((*rows)[1].mounted_on, std::string("/Volumes/My Disk"));
}

TEST(df_truncates_long_filesystem_names) {
  const char* out =
    "Filesystem Size Used Avail Use% Mounted on\n"
    "server.example.com:/exports/home 1T 1G 1T 1% /mnt/home\n";
  auto rows = parse_df_output(out);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ((*rows)[0].filesystem.size(), 25u);
  ASSERT_EQ((*rows)[0].filesystem, std::string("server.example.com:/ex..."));
}

TEST(df_joins_wrapped_device_line) {
  const char* out =
    "Filesystem Size Used Avail Use% Mounted on\n"
    "/dev/mapper/very-long-volume-name\n"
    "                 20G  5G  15G  25% /data\n";
  auto rows = parse_df_output(out);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 1u);
  ASSERT_EQ((*rows)[0].mounted_on, std::string("/data"));
  ASSERT_EQ((*rows)[0].capacity, std::string("25%"));
}

TEST(df_without_rows_is_nullopt) {
  ASSERT_TRUE(!parse_df_output("").has_value());
  ASSERT_TRUE(!parse_df_output("Filesystem Size Used Avail Use% Mounted on\n").has_value());
  ASSERT_TRUE(!parse_df_output("Filesystem Size\nshort row\n").has_value());
}

TEST(clip_label_keeps_short_names) {
  ASSERT_EQ(dustpan::app::clip_label("tmpfs"), std::string("tmpfs"));
  ASSERT_EQ(dustpan::app::clip_label(std::string(25, 'a')), std::string(25, 'a'));
  ASSERT_EQ(dustpan::app::clip_label(std::string(26, 'a')), std::string(22, 'a') + "...");
}

TEST(run_disk_usage_reports_command_failure) {
  auto res = dustpan::app::run_disk_usage("exit 3");
  ASSERT_TRUE(!res.ok);
  ASSERT_TRUE(res.error.find("status 3") != std::string::npos);
  ASSERT_EQ(res.report.command, std::string("exit 3"));
}

TEST(run_disk_usage_empty_output_is_error) {
  auto res = dustpan::app::run_disk_usage("true");
  ASSERT_TRUE(!res.ok);
  ASSERT_TRUE(res.error.find("no filesystems") != std::string::npos);
}

TEST(run_disk_usage_rows_win_over_exit_status) {
  auto res = dustpan::app::run_disk_usage(
    "printf 'Filesystem Size Used Avail Use%% Mounted on\\nfs 1G 1M 1G 1%% /x\\n'; exit 1");
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.report.rows.size(), 1u);
  ASSERT_EQ(res.report.rows[0].mounted_on, std::string("/x"));
}
