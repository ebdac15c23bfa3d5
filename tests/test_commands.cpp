#include <gtest/gtest.h>
#include "commands/DecodeCommand.hpp"
#include "commands/DecodeFileCommand.hpp"
#include "commands/EncodeCommand.hpp"
#include "manager/CommandManager.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_out = std::cout.rdbuf(captured_out.rdbuf());
        saved_err = std::cerr.rdbuf(captured_err.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(saved_out);
        std::cerr.rdbuf(saved_err);
    }

    CommandManager makeManager() {
        CommandManager manager;
        manager.registerCommand("decode", std::make_unique<DecodeCommand>());
        manager.registerCommand("decode_file", std::make_unique<DecodeFileCommand>());
        manager.registerCommand("encode", std::make_unique<EncodeCommand>());
        return manager;
    }

    std::ostringstream captured_out;
    std::ostringstream captured_err;
    std::streambuf* saved_out = nullptr;
    std::streambuf* saved_err = nullptr;
};

TEST_F(CommandTest, ParseCommandOptionsSplitsOptionsAndArgs) {
    CommandOptions options = CommandManager::parseCommandOptions({"-c", "ISO-8859-1", "-", "-s", "true"});
    EXPECT_EQ(options.options.at("-c"), "ISO-8859-1");
    EXPECT_EQ(options.options.at("-s"), "true");
    EXPECT_EQ(options.args, std::vector<std::string>{"-"});

    DecoderOptions decoder_options = options.toDecoderOptions();
    EXPECT_EQ(decoder_options.charset, "ISO-8859-1");
    EXPECT_TRUE(decoder_options.decodeAsString);
}

TEST_F(CommandTest, InvalidOptionValues) {
    EXPECT_THROW(CommandManager::parseCommandOptions({"-s", "maybe"}).toDecoderOptions(), std::invalid_argument);
    EXPECT_THROW(CommandManager::parseCommandOptions({"-d", "deep"}).toDecoderOptions(), std::invalid_argument);
}

TEST_F(CommandTest, DecodePrintsJson) {
    CommandManager manager = makeManager();
    EXPECT_TRUE(manager.executeCommand("decode", CommandManager::parseCommandOptions({"d3:keyli1ei2eee"})));
    EXPECT_EQ(captured_out.str(), "{\"key\":[1,2]}\n");
}

TEST_F(CommandTest, DecodeFailureIsReported) {
    CommandManager manager = makeManager();
    EXPECT_FALSE(manager.executeCommand("decode", CommandManager::parseCommandOptions({"5:abc"})));
    EXPECT_NE(captured_err.str().find("Error executing command: Decode failed"), std::string::npos);
}

TEST_F(CommandTest, EncodePrintsBencode) {
    CommandManager manager = makeManager();
    EXPECT_TRUE(manager.executeCommand("encode", CommandManager::parseCommandOptions({R"({"b":"x","a":[1,2]})"})));
    EXPECT_EQ(captured_out.str(), "d1:ali1ei2ee1:b1:xe\n");
}

TEST_F(CommandTest, EncodeRejectsInvalidJson) {
    CommandManager manager = makeManager();
    EXPECT_FALSE(manager.executeCommand("encode", CommandManager::parseCommandOptions({"{oops"})));
}

TEST_F(CommandTest, DecodeFilePrintsEveryValue) {
    std::string path = ::testing::TempDir() + "bdecode_values.bin";
    {
        std::ofstream file(path, std::ios::binary);
        file << "i1e3:abcd1:ai2.5ee";
    }

    CommandManager manager = makeManager();
    EXPECT_TRUE(manager.executeCommand("decode_file", CommandManager::parseCommandOptions({path})));
    EXPECT_EQ(captured_out.str(), "1\n\"abc\"\n{\"a\":2.5}\n");
    std::remove(path.c_str());
}

TEST_F(CommandTest, DecodeFileMissing) {
    CommandManager manager = makeManager();
    EXPECT_FALSE(manager.executeCommand("decode_file", CommandManager::parseCommandOptions({"/nonexistent/file"})));
    EXPECT_NE(captured_err.str().find("Cannot open file"), std::string::npos);
}

TEST_F(CommandTest, UnknownCommand) {
    CommandManager manager = makeManager();
    EXPECT_FALSE(manager.executeCommand("info", CommandOptions()));
    EXPECT_EQ(captured_err.str(), "Unknown command: info\n");
}

TEST_F(CommandTest, UsageListsCommands) {
    CommandManager manager = makeManager();
    std::ostringstream out;
    manager.printUsage(out, "bdecode");
    EXPECT_NE(out.str().find("decode_file"), std::string::npos);
    EXPECT_NE(out.str().find("encode <json>"), std::string::npos);
}
