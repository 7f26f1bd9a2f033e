#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "ngdef/project/server_config.hpp"

namespace fs = std::filesystem;
using ngdef::parse_server_config;

namespace
{

class TempDir
{
public:
  explicit TempDir(const std::string & name) : path_(fs::temp_directory_path() / name)
  {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() { fs::remove_all(path_); }

  [[nodiscard]] const fs::path & path() const { return path_; }

  void write(const fs::path & rel, const std::string & text) const
  {
    fs::create_directories((path_ / rel).parent_path());
    std::ofstream out(path_ / rel, std::ios::binary);
    out << text;
  }

private:
  fs::path path_;
};

}  // namespace

TEST(ProjectServerConfig, EmptyDocumentUsesDefaults)
{
  const auto r = parse_server_config("");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.log.level, "info");
  EXPECT_FALSE(r.config.log.directory.has_value());
  EXPECT_EQ(r.config.log.file_name, "ngdef.log");
}

TEST(ProjectServerConfig, ParsesLogSection)
{
  const auto r = parse_server_config(
    "log:\n"
    "  level: debug\n"
    "  directory: logs\n"
    "  file_name: server.log\n",
    "/srv/project");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.log.level, "debug");
  ASSERT_TRUE(r.config.log.directory.has_value());
  EXPECT_EQ(*r.config.log.directory, fs::path("/srv/project/logs"));
  EXPECT_EQ(r.config.log.file_name, "server.log");
}

TEST(ProjectServerConfig, AbsoluteDirectoryIsKept)
{
  const auto r = parse_server_config("log:\n  directory: /var/log/ngdef\n", "/srv/project");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(*r.config.log.directory, fs::path("/var/log/ngdef"));
}

TEST(ProjectServerConfig, RejectsBadValues)
{
  EXPECT_FALSE(parse_server_config("log:\n  level: verbose\n").success);
  EXPECT_FALSE(parse_server_config("log: 3\n").success);
  EXPECT_FALSE(parse_server_config("- a\n- b\n").success);
  EXPECT_FALSE(parse_server_config("log:\n  file_name: \"\"\n").success);
  EXPECT_FALSE(parse_server_config("log: [unterminated\n").success);
  EXPECT_FALSE(parse_server_config("log:\n  level: [a, b]\n").success);
}

TEST(ProjectServerConfig, UnknownSectionsAreIgnored)
{
  const auto r = parse_server_config("editor:\n  theme: dark\n");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.log.level, "info");
}

TEST(ProjectServerConfig, LoadsFileAndRecordsSource)
{
  const TempDir dir("ngdef_test_server_config_load");
  dir.write("ngdef.yaml", "log:\n  level: warn\n  directory: out\n");

  const auto r = ngdef::load_server_config(dir.path() / "ngdef.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.log.level, "warn");
  EXPECT_EQ(*r.config.log.directory, dir.path() / "out");
  EXPECT_EQ(r.config.source, fs::absolute(dir.path() / "ngdef.yaml"));
}

TEST(ProjectServerConfig, MissingFileFails)
{
  const auto r = ngdef::load_server_config("/nonexistent/ngdef.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST(ProjectServerConfig, FindSearchesUpward)
{
  const TempDir dir("ngdef_test_server_config_find");
  dir.write("ngdef.yaml", "");
  dir.write("src/app/x.html", "<p></p>");

  const auto found = ngdef::find_server_config(dir.path() / "src" / "app");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, fs::absolute(dir.path()) / "ngdef.yaml");

  const auto from_file = ngdef::find_server_config(dir.path() / "src" / "app" / "x.html");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(*from_file, *found);
}

TEST(ProjectServerConfig, LogLevelNames)
{
  for (const char * l : {"trace", "debug", "info", "warn", "error", "off"}) {
    EXPECT_TRUE(ngdef::is_valid_log_level(l)) << l;
  }
  EXPECT_FALSE(ngdef::is_valid_log_level("warning"));
  EXPECT_FALSE(ngdef::is_valid_log_level(""));
}
