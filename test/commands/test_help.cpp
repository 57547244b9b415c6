#include <gtest/gtest.h>
#include <memory>
#include "test_utils.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/BlameCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ParseCommand.hpp"

using namespace blamer;
using namespace blamer::test::utils;

class HelpCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& f = CommandFactory::instance();
        f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
        f.registerCreator("blame", [] { return std::make_unique<BlameCommand>(); });
        f.registerCreator("parse", [] { return std::make_unique<ParseCommand>(); });
    }

    AppContext ctx;
};

// Test: Overview lists every registered command in name order
TEST_F(HelpCommandTest, ListsCommands) {
    HelpCommand cmd;
    CoutCapture capture;
    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value());

    std::string output = capture.str();
    size_t blame = output.find("  blame\t");
    size_t help = output.find("  help\t");
    size_t parse = output.find("  parse\t");
    ASSERT_NE(blame, std::string::npos);
    ASSERT_NE(help, std::string::npos);
    ASSERT_NE(parse, std::string::npos);
    EXPECT_LT(blame, help);
    EXPECT_LT(help, parse);
    EXPECT_NE(output.find("BLAMER_GIT"), std::string::npos);
}

// Test: Detailed help for one command
TEST_F(HelpCommandTest, CommandDetail) {
    HelpCommand cmd;
    CoutCapture capture;
    auto result = cmd.execute(ctx, {"blame"});
    ASSERT_TRUE(result.has_value());

    std::string output = capture.str();
    EXPECT_NE(output.find("SYNOPSIS:\nblamer blame [--oneline] <file>"), std::string::npos);
    EXPECT_NE(output.find("--oneline :  "), std::string::npos);
}

TEST_F(HelpCommandTest, FactoryLookup) {
    auto& f = CommandFactory::instance();
    EXPECT_TRUE(f.contains("parse"));
    EXPECT_FALSE(f.contains("commit"));
    EXPECT_TRUE(f.create("commit") == nullptr);
    auto cmd = f.create("parse");
    ASSERT_TRUE(cmd != nullptr);
    EXPECT_STREQ(cmd->name(), "parse");
}

// Test: Invoker passes failures through
TEST_F(HelpCommandTest, InvokerReportsFailure) {
    CommandInvoker invoker;
    BlameCommand cmd;
    auto result = invoker.invoke(cmd, ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}

TEST(AppContextTest, DefaultsToGit) {
    AppContext ctx;
    EXPECT_EQ(ctx.gitExecutable, "git");
}
