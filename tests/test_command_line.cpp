#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "CommandLine.h"
#include "Config.h"

namespace {

bool parse(std::vector<const char*> args, RunOptions& out, std::string& error) {
    args.insert(args.begin(), "tm-multiply");
    return parseCommandLine(static_cast<int>(args.size()), args.data(), out, error);
}

TEST(CommandLineTest, PositionalOperands) {
    RunOptions opts;
    std::string error;
    ASSERT_TRUE(parse({"2", "3"}, opts, error)) << error;
    EXPECT_EQ(opts.multiplier, 2u);
    EXPECT_EQ(opts.multiplicand, 3u);
    EXPECT_FALSE(opts.interactive);
    EXPECT_FALSE(opts.sleep);
    EXPECT_FALSE(opts.printSteps);
    EXPECT_FALSE(opts.clearScreen);
    EXPECT_FALSE(opts.gui);
    EXPECT_EQ(opts.variant, ProgramVariant::Base);
    EXPECT_EQ(opts.delay.count(), 0);
}

TEST(CommandLineTest, ShortAndLongFlags) {
    RunOptions opts;
    std::string error;
    ASSERT_TRUE(parse({"-i", "4", "--sleep", "5", "-p", "--clear", "-d", "--extended"}, opts, error)) << error;
    EXPECT_EQ(opts.multiplier, 4u);
    EXPECT_EQ(opts.multiplicand, 5u);
    EXPECT_TRUE(opts.interactive);
    EXPECT_TRUE(opts.sleep);
    EXPECT_EQ(opts.delay.count(), kDefaultStepDelay.count());
    EXPECT_TRUE(opts.printSteps);
    EXPECT_TRUE(opts.clearScreen);
    EXPECT_TRUE(opts.diagram);
    EXPECT_EQ(opts.variant, ProgramVariant::Extended);
}

TEST(CommandLineTest, CustomDelayAndFont) {
    RunOptions opts;
    std::string error;
    ASSERT_TRUE(parse({"1", "1", "--delay", "250", "--font", "/tmp/mono.ttf", "-g"}, opts, error)) << error;
    EXPECT_TRUE(opts.sleep);
    EXPECT_EQ(opts.delay.count(), 250);
    EXPECT_EQ(opts.fontPath, "/tmp/mono.ttf");
    EXPECT_TRUE(opts.gui);
}

TEST(CommandLineTest, ZeroOperandsAreAccepted) {
    RunOptions opts;
    std::string error;
    ASSERT_TRUE(parse({"0", "0"}, opts, error)) << error;
    EXPECT_EQ(opts.multiplier, 0u);
    EXPECT_EQ(opts.multiplicand, 0u);
}

TEST(CommandLineTest, MissingOperands) {
    RunOptions opts;
    std::string error;
    EXPECT_FALSE(parse({}, opts, error));
    EXPECT_EQ(error, "Not enough arguments");
    EXPECT_FALSE(parse({"3", "--print"}, opts, error));
    EXPECT_FALSE(parse({"1", "2", "3"}, opts, error));
    EXPECT_EQ(error, "Too many arguments");
}

TEST(CommandLineTest, MalformedOperands) {
    RunOptions opts;
    std::string error;
    EXPECT_FALSE(parse({"two", "3"}, opts, error));
    EXPECT_FALSE(parse({"2", "3x"}, opts, error));
    EXPECT_FALSE(parse({"2", ""}, opts, error));
    EXPECT_FALSE(parse({"-2", "3"}, opts, error));
    EXPECT_FALSE(parse({"99999999999999999999", "3"}, opts, error));
}

TEST(CommandLineTest, UnknownOptionAndBadValues) {
    RunOptions opts;
    std::string error;
    EXPECT_FALSE(parse({"2", "3", "--fast"}, opts, error));
    EXPECT_EQ(error, "Unknown option --fast");
    EXPECT_FALSE(parse({"2", "3", "--delay"}, opts, error));
    EXPECT_FALSE(parse({"2", "3", "--delay", "soon"}, opts, error));
    EXPECT_FALSE(parse({"2", "3", "--font"}, opts, error));
}

TEST(CommandLineTest, HelpNeedsNoOperands) {
    RunOptions opts;
    std::string error;
    ASSERT_TRUE(parse({"--help"}, opts, error));
    EXPECT_TRUE(opts.help);
    EXPECT_NE(usage("tm-multiply").find("multiplier multiplicand"), std::string::npos);
}

}  // namespace
