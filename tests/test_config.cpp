#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "Config.h"

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() / "txtreader_test.conf";
    }

    void TearDown() override {
        fs::remove(path_);
    }

    void write(const std::string& body) {
        std::ofstream out(path_, std::ios::trunc);
        out << body;
    }

    fs::path path_;
};

TEST_F(ConfigTest, ReadsKnownKeys) {
    write("# txtreaderd\n"
          "host = 0.0.0.0\n"
          "port=8080   # inline comment\n"
          "dbpath = /srv/txt/app.db\n"
          "librarydir = /srv/txt/library\n"
          "uploaddir = /srv/txt/tmp\n"
          "maxfilesize = 25\n"
          "tokentimeout = 15\n"
          "maxheartbeatinterval = 45\n"
          "defaultwindow = 2000\n"
          "maxwindow = 8000\n");
    Config::get().load(path_.string());

    const Config& c = Config::get();
    EXPECT_EQ(c.host(), "0.0.0.0");
    EXPECT_EQ(c.port(), 8080);
    EXPECT_EQ(c.dbPath(), "/srv/txt/app.db");
    EXPECT_EQ(c.libraryDir(), "/srv/txt/library");
    EXPECT_EQ(c.uploadDir(), "/srv/txt/tmp");
    EXPECT_EQ(c.maxFileSizeMB(), 25);
    EXPECT_EQ(c.maxFileSize(), 25LL * 1024 * 1024);
    EXPECT_EQ(c.tokenTimeout(), 15);
    EXPECT_EQ(c.maxHeartbeatInterval(), 45);
    EXPECT_EQ(c.defaultWindow(), 2000);
    EXPECT_EQ(c.maxWindow(), 8000);
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    write("port = 99999\n"
          "maxfilesize = ten\n"
          "maxheartbeatinterval = -5\n"
          "defaultwindow = 12abc\n"
          "host =\n");
    Config::get().load(path_.string());

    const Config& c = Config::get();
    EXPECT_EQ(c.host(), "127.0.0.1");
    EXPECT_EQ(c.port(), 9000);
    EXPECT_EQ(c.maxFileSizeMB(), 10);
    EXPECT_EQ(c.maxHeartbeatInterval(), 30);
    EXPECT_EQ(c.defaultWindow(), 4000);
}

TEST_F(ConfigTest, ReloadStartsFromDefaults) {
    write("port = 7000\n");
    Config::get().load(path_.string());
    EXPECT_EQ(Config::get().port(), 7000);

    write("tokentimeout = 5\n");
    Config::get().load(path_.string());
    EXPECT_EQ(Config::get().port(), 9000);
    EXPECT_EQ(Config::get().tokenTimeout(), 5);
}

TEST_F(ConfigTest, DefaultWindowNeverExceedsMaxWindow) {
    write("defaultwindow = 5000\nmaxwindow = 1000\n");
    Config::get().load(path_.string());
    EXPECT_EQ(Config::get().maxWindow(), 1000);
    EXPECT_EQ(Config::get().defaultWindow(), 1000);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::get().load((path_.string() + ".missing")), std::runtime_error);
}
