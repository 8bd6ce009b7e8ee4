#include "cli.hpp"
#include "config.hpp"
#include "fixtures.hpp"
#include "util.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

class environment : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("V");
        ::unsetenv("MONSTER");
    }
    void TearDown() override {
        ::unsetenv("V");
        ::unsetenv("MONSTER");
        g_verbose = 0;
    }

    // exit status, stdout in out
    int jigsaw(const std::string &input, std::string &out) {
        std::string prog{ "jigsaw" }, path{ input };
        char *argv[]{ prog.data(), path.data(), nullptr };
        ::testing::internal::CaptureStdout();
        auto status = run(2, argv);
        out = ::testing::internal::GetCapturedStdout();
        return status;
    }
};

TEST_F(environment, defaults) {
    auto cfg = Config::load("tiles.txt");
    EXPECT_EQ(cfg.input, "tiles.txt");
    EXPECT_EQ(cfg.verbose, 1u);
    EXPECT_FALSE(cfg.pattern);

    ::setenv("V", "", 1);
    EXPECT_EQ(Config::load("tiles.txt").verbose, 1u);
}

TEST_F(environment, verbosity) {
    ::setenv("V", "2", 1);
    EXPECT_EQ(Config::load("tiles.txt").verbose, 2u);
    ::setenv("V", "abc", 1);
    EXPECT_THROW((void)Config::load("tiles.txt"), std::runtime_error);
    ::setenv("V", "2x", 1);
    EXPECT_THROW((void)Config::load("tiles.txt"), std::runtime_error);
    ::setenv("V", "-1", 1);
    EXPECT_THROW((void)Config::load("tiles.txt"), std::runtime_error);
}

TEST_F(environment, monsterPattern) {
    ::setenv("MONSTER", "block.txt", 1);
    auto cfg = Config::load("tiles.txt");
    ASSERT_TRUE(cfg.pattern);
    EXPECT_EQ(*cfg.pattern, "block.txt");
}

TEST_F(environment, solvesTheExample) {
    ::setenv("V", "0", 1);
    std::string out;
    EXPECT_EQ(jigsaw(data_path("example.txt"), out), 0);
    EXPECT_EQ(out, "part 1 20899048083289\npart 2 273\n");
}

TEST_F(environment, customMonster) {
    ::setenv("V", "0", 1);
    ::setenv("MONSTER", data_path("block.txt").c_str(), 1);
    std::string out;
    EXPECT_EQ(jigsaw(data_path("example.txt"), out), 0);
    EXPECT_EQ(out, "part 1 20899048083289\npart 2 195\n");
}

TEST_F(environment, exitStatus) {
    ::setenv("V", "0", 1);
    std::string out;
    EXPECT_EQ(jigsaw(data_path("corners.txt"), out), 2);
    EXPECT_EQ(out, "");
    EXPECT_EQ(jigsaw(data_path("does-not-exist.txt"), out), 1);
    EXPECT_EQ(jigsaw(data_path("block.txt"), out), 1);

    ::setenv("MONSTER", data_path("does-not-exist.txt").c_str(), 1);
    EXPECT_EQ(jigsaw(data_path("example.txt"), out), 1);

    ::unsetenv("MONSTER");
    ::setenv("V", "abc", 1);
    EXPECT_EQ(jigsaw(data_path("example.txt"), out), 1);

    char prog[] = "jigsaw";
    char *argv[]{ prog, nullptr };
    EXPECT_EQ(run(1, argv), 1);
}
