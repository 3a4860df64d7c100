#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "user_input.hpp"

TEST(UserInputTest, ParsesPositiveNumbers) {
    EXPECT_EQ(parseNumber("42"), 42u);
    EXPECT_THROW(parseNumber("0"), std::runtime_error);
    EXPECT_THROW(parseNumber("-1"), std::runtime_error);
    EXPECT_THROW(parseNumber("12a"), std::runtime_error);
    EXPECT_THROW(parseNumber(""), std::runtime_error);
}

TEST(UserInputTest, PromptLineTrimsInput) {
    std::istringstream in("  hello world \t\n");
    std::ostringstream out;
    EXPECT_EQ(promptLine("> ", in, out), "hello world");
    EXPECT_NE(out.str().find("> "), std::string::npos);
}

TEST(UserInputTest, PromptLineThrowsAtEndOfInput) {
    std::istringstream in("");
    std::ostringstream out;
    EXPECT_THROW(promptLine("> ", in, out), std::runtime_error);
}

TEST(UserInputTest, AskContinueAcceptsYes) {
    for (const char* answer : {"y\n", "YES\n", "да\n", " д \n"}) {
        std::istringstream in(answer);
        std::ostringstream out;
        EXPECT_TRUE(askContinue(in, out)) << answer;
    }
}

TEST(UserInputTest, AskContinueRejectsOtherwise) {
    for (const char* answer : {"n\n", "\n", "maybe\n", ""}) {
        std::istringstream in(answer);
        std::ostringstream out;
        EXPECT_FALSE(askContinue(in, out)) << answer;
    }
}

TEST(UserInputTest, DefaultOutputNameFollowsInputFile) {
    std::istringstream in("1\n");
    std::ostringstream out;
    std::filesystem::path result = selectOutputFile("data/rolls.txt", in, out);

    EXPECT_EQ(result.parent_path().string(), "data");
    EXPECT_EQ(result.extension().string(), ".csv");
    EXPECT_EQ(result.filename().string().rfind("rolls_results_", 0), 0u);
}

TEST(UserInputTest, CustomOutputNameGetsCsvExtension) {
    std::istringstream in("2\nreport\n");
    std::ostringstream out;
    EXPECT_EQ(selectOutputFile("data/rolls.txt", in, out).generic_string(), "data/report.csv");
}

TEST(UserInputTest, InvalidOutputChoiceThrows) {
    std::istringstream in("3\n");
    std::ostringstream out;
    EXPECT_THROW(selectOutputFile("rolls.txt", in, out), std::runtime_error);
}

TEST(UserInputTest, SelectInputFileAcceptsPath) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "dice_select_input.txt";
    {
        std::ofstream file(path);
        file << "1d6\n";
    }

    std::istringstream in(path.string() + "\n");
    std::ostringstream out;
    EXPECT_EQ(selectInputFile(in, out).string(), path.string());

    std::filesystem::remove(path);
}

TEST(UserInputTest, SelectInputFileRejectsMissingPath) {
    std::istringstream in("/definitely/not/here.txt\n");
    std::ostringstream out;
    EXPECT_THROW(selectInputFile(in, out), std::runtime_error);
}
