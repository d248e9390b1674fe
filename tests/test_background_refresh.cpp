#include <gtest/gtest.h>
#include "cache/background_refresh.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

class BackgroundRefreshTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() / ("statusline-test-bg-" + std::to_string(getpid()))).string();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        if (const char* h = std::getenv("HOME")) {
            saved_home = h;
            had_home = true;
        }
        setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        if (had_home) {
            setenv("HOME", saved_home.c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        fs::remove_all(test_dir);
    }

    std::string write_script(const std::string& path, const std::string& body, bool executable) {
        fs::create_directories(fs::path(path).parent_path());
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body;
        }
        fs::permissions(path,
                        executable ? fs::perms::owner_all : (fs::perms::owner_read | fs::perms::owner_write),
                        fs::perm_options::replace);
        return path;
    }
};

TEST_F(BackgroundRefreshTest, CandidateOrder) {
    auto candidates = BackgroundRefresh::script_candidates("/opt/statusline/bin");
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0], "/opt/statusline/bin/../bash/cumulative-stats.sh");
    EXPECT_EQ(candidates[1], "/opt/statusline/bin/cumulative-stats.sh");
    EXPECT_EQ(candidates[2], test_dir + "/.claude/cumulative-stats.sh");
}

TEST_F(BackgroundRefreshTest, CandidatesWithoutSelfDir) {
    auto candidates = BackgroundRefresh::script_candidates("");
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0], test_dir + "/.claude/cumulative-stats.sh");
}

TEST_F(BackgroundRefreshTest, FindScriptPrefersFirstExecutable) {
    std::string first = test_dir + "/bash/cumulative-stats.sh";
    std::string second = test_dir + "/bin/cumulative-stats.sh";
    write_script(second, "exit 0\n", true);

    auto candidates = BackgroundRefresh::script_candidates(test_dir + "/bin");
    EXPECT_EQ(BackgroundRefresh::find_script(candidates), second);

    write_script(first, "exit 0\n", true);
    EXPECT_EQ(BackgroundRefresh::find_script(candidates), first);
}

TEST_F(BackgroundRefreshTest, FindScriptSkipsNonExecutable) {
    std::string plain = write_script(test_dir + "/a/cumulative-stats.sh", "exit 0\n", false);
    std::string exec = write_script(test_dir + "/b/cumulative-stats.sh", "exit 0\n", true);

    if (access(plain.c_str(), X_OK) == 0) {
        GTEST_SKIP() << "running with privileges that bypass the exec bit";
    }
    EXPECT_EQ(BackgroundRefresh::find_script({plain, exec}), exec);
}

TEST_F(BackgroundRefreshTest, FindScriptSkipsDirectories) {
    fs::create_directories(test_dir + "/dir/cumulative-stats.sh");
    EXPECT_EQ(BackgroundRefresh::find_script({test_dir + "/dir/cumulative-stats.sh"}), "");
    EXPECT_EQ(BackgroundRefresh::find_script({}), "");
}

TEST_F(BackgroundRefreshTest, EmptyArgumentsAreNoOps) {
    EXPECT_FALSE(BackgroundRefresh::spawn_model_refresh("", "/tmp/x.jsonl"));
    EXPECT_FALSE(BackgroundRefresh::spawn_model_refresh("sid", ""));
    EXPECT_FALSE(BackgroundRefresh::spawn_cumulative_stats(""));
}

TEST_F(BackgroundRefreshTest, SelfPathIsThisBinary) {
    std::string self = BackgroundRefresh::self_path();
    ASSERT_FALSE(self.empty());
    EXPECT_TRUE(fs::path(self).is_absolute());
    EXPECT_TRUE(fs::is_regular_file(self));
}

TEST_F(BackgroundRefreshTest, CumulativeScriptReceivesProjectDir) {
    // Only the $HOME/.claude candidate is under this test's control
    std::string self_dir = fs::path(BackgroundRefresh::self_path()).parent_path().string();
    auto candidates = BackgroundRefresh::script_candidates(self_dir);
    std::string home_script = candidates.back();
    candidates.pop_back();
    if (!BackgroundRefresh::find_script(candidates).empty()) {
        GTEST_SKIP() << "a cumulative-stats script is installed beside the test binary";
    }

    std::string marker = test_dir + "/marker";
    write_script(home_script, "printf '%s' \"$1\" > '" + marker + ".tmp' && mv '" + marker + ".tmp' '" + marker + "'\n", true);

    ASSERT_TRUE(BackgroundRefresh::spawn_cumulative_stats("/home/user/code/my-app"));

    std::string seen;
    for (int i = 0; i < 200 && seen.empty(); ++i) {
        std::ifstream in(marker);
        if (in) std::getline(in, seen);
        if (seen.empty()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(seen, "/home/user/code/my-app");
}

TEST_F(BackgroundRefreshTest, NoScriptInstalled) {
    std::string self_dir = fs::path(BackgroundRefresh::self_path()).parent_path().string();
    if (!BackgroundRefresh::find_script(BackgroundRefresh::script_candidates(self_dir)).empty()) {
        GTEST_SKIP() << "a cumulative-stats script is installed beside the test binary";
    }
    EXPECT_FALSE(BackgroundRefresh::spawn_cumulative_stats("/home/user/code/my-app"));
}
