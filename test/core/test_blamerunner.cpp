#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/BlameRunner.hpp"

namespace fs = std::filesystem;

using namespace blamer;
using namespace blamer::test::utils;

class BlameRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

// Test: git is pointed at the file's directory and given the bare name
TEST_F(BlameRunnerTest, BuildArgs) {
    BlameRunner runner("/usr/bin/git");
    fs::path file = tempDir / "src" / "main.cpp";
    auto args = runner.buildArgs(file);

    ASSERT_EQ(args.size(), 7u);
    EXPECT_EQ(args[0], "/usr/bin/git");
    EXPECT_EQ(args[1], "-C");
    EXPECT_EQ(fs::path(args[2]), fs::absolute(tempDir / "src"));
    EXPECT_EQ(args[3], "blame");
    EXPECT_EQ(args[4], "--line-porcelain");
    EXPECT_EQ(args[5], "--");
    EXPECT_EQ(args[6], "main.cpp");
}

// Test: Missing file is rejected before git is run
TEST_F(BlameRunnerTest, MissingFileRejected) {
    BlameRunner runner;
    auto res = runner.run(tempDir / "nope.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
    EXPECT_NE(res.error().message.find("invalid file path"), std::string::npos);
}

// Test: Directories are not blamable
TEST_F(BlameRunnerTest, DirectoryRejected) {
    BlameRunner runner;
    auto res = runner.run(tempDir);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
}

// Test: A git executable that does not exist
TEST_F(BlameRunnerTest, MissingExecutable) {
    fs::path file = createFile(tempDir, "a.txt", "hello\n");
    BlameRunner runner("blamer-no-such-git-executable");
    auto res = runner.run(file);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SubprocessFailed);
    EXPECT_NE(res.error().message.find("blamer-no-such-git-executable"), std::string::npos);
}

// Test: Both output streams and the exit status are captured
TEST_F(BlameRunnerTest, ExecuteCapturesOutput) {
    auto res = BlameRunner::execute({"sh", "-c", "printf 'out\\n'; printf 'err\\n' >&2; exit 3"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().out, "out\n");
    EXPECT_EQ(res.value().err, "err\n");
    EXPECT_EQ(res.value().exitCode, 3);
}

// Test: Output larger than a pipe buffer is read completely
TEST_F(BlameRunnerTest, ExecuteLargeOutput) {
    auto res = BlameRunner::execute({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; i=$((i+1)); done"});
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value().exitCode, 0);
    EXPECT_NE(res.value().out.find("line19999\n"), std::string::npos);
}

// Test: Outside a repository git fails and its stderr becomes the message
TEST_F(BlameRunnerTest, NotARepository) {
    if (!gitAvailable()) GTEST_SKIP() << "git not available";
    fs::path file = createFile(tempDir, "a.txt", "hello\n");
    BlameRunner runner;
    auto res = runner.run(file);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SubprocessFailed);
    EXPECT_FALSE(res.error().message.empty());
}
