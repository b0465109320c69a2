#include <gtest/gtest.h>
#include "zealdump/dump_config.hpp"
#include <filesystem>
#include <fstream>

using namespace zealdump;

class DumpConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "zealdump_dump_config_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    std::string writeConfig(const std::string& content) {
        auto path = tempDir / "zealdump.conf";
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path tempDir;
};

TEST_F(DumpConfigTest, RequiredOptions) {
    auto cli = parseCommandLine({"-o", "save.sav", "-d", "/dev/ttyUSB0"});

    ASSERT_EQ(cli.status, CommandLine::Status::Ok) << cli.error;
    EXPECT_EQ(cli.config.outputPath.string(), "save.sav");
    EXPECT_EQ(cli.config.devicePath, "/dev/ttyUSB0");
    EXPECT_EQ(cli.config.baudRate, 57600u);
    EXPECT_EQ(cli.config.readTimeout, std::chrono::milliseconds(1000));
    EXPECT_FALSE(cli.config.verbose);
}

TEST_F(DumpConfigTest, AllOptions) {
    auto cli = parseCommandLine({"-v", "-d", "/dev/ttyACM0", "-b", "115200",
                                 "-t", "250", "-o", "out.bin"});

    ASSERT_EQ(cli.status, CommandLine::Status::Ok) << cli.error;
    EXPECT_TRUE(cli.config.verbose);
    EXPECT_EQ(cli.config.baudRate, 115200u);
    EXPECT_EQ(cli.config.readTimeout, std::chrono::milliseconds(250));

    auto serial = cli.config.serialConfig();
    EXPECT_EQ(serial.device, "/dev/ttyACM0");
    EXPECT_EQ(serial.baudRate, 115200u);
    EXPECT_EQ(serial.readTimeout, std::chrono::milliseconds(250));
}

TEST_F(DumpConfigTest, LongVerbose) {
    auto cli = parseCommandLine({"--verbose", "-o", "a", "-d", "b"});
    ASSERT_EQ(cli.status, CommandLine::Status::Ok);
    EXPECT_TRUE(cli.config.verbose);
}

TEST_F(DumpConfigTest, Help) {
    EXPECT_EQ(parseCommandLine({"-h"}).status, CommandLine::Status::Help);
    EXPECT_EQ(parseCommandLine({"-o", "x", "--help"}).status, CommandLine::Status::Help);

    auto text = usage("zealdump");
    EXPECT_NE(text.find("usage: zealdump"), std::string::npos);
    EXPECT_NE(text.find("-d TTYNODE"), std::string::npos);
}

TEST_F(DumpConfigTest, MissingRequired) {
    auto cli = parseCommandLine({"-o", "save.sav"});
    EXPECT_EQ(cli.status, CommandLine::Status::Error);
    EXPECT_NE(cli.error.find("-d"), std::string::npos);

    cli = parseCommandLine({"-d", "/dev/ttyUSB0"});
    EXPECT_EQ(cli.status, CommandLine::Status::Error);
    EXPECT_NE(cli.error.find("-o"), std::string::npos);
}

TEST_F(DumpConfigTest, MissingValue) {
    auto cli = parseCommandLine({"-d", "/dev/ttyUSB0", "-o"});
    EXPECT_EQ(cli.status, CommandLine::Status::Error);
    EXPECT_EQ(cli.error, "option -o requires a value");
}

TEST_F(DumpConfigTest, UnknownOption) {
    auto cli = parseCommandLine({"-x", "-o", "a", "-d", "b"});
    EXPECT_EQ(cli.status, CommandLine::Status::Error);
    EXPECT_EQ(cli.error, "unknown option: -x");
}

TEST_F(DumpConfigTest, InvalidNumbers) {
    for (const char* bad : {"0", "-1", "fast", "9600baud", "99999999999", ""}) {
        auto cli = parseCommandLine({"-o", "a", "-d", "b", "-b", bad});
        EXPECT_EQ(cli.status, CommandLine::Status::Error) << bad;
    }
    for (const char* bad : {"0", "-100", "1s", "3000000000"}) {
        auto cli = parseCommandLine({"-o", "a", "-d", "b", "-t", bad});
        EXPECT_EQ(cli.status, CommandLine::Status::Error) << bad;
    }
}

TEST_F(DumpConfigTest, ConfigFileSuppliesDefaults) {
    auto path = writeConfig(
        "# bench setup\n"
        "device: /dev/ttyUSB3\n"
        "output: bench.sav\n"
        "baud: 9600\n"
        "timeout_ms: 2500\n"
        "verbose: yes\n"
    );

    auto cli = parseCommandLine({"-c", path});

    ASSERT_EQ(cli.status, CommandLine::Status::Ok) << cli.error;
    EXPECT_EQ(cli.config.devicePath, "/dev/ttyUSB3");
    EXPECT_EQ(cli.config.outputPath.string(), "bench.sav");
    EXPECT_EQ(cli.config.baudRate, 9600u);
    EXPECT_EQ(cli.config.readTimeout, std::chrono::milliseconds(2500));
    EXPECT_TRUE(cli.config.verbose);
}

TEST_F(DumpConfigTest, CommandLineOverridesConfigFile) {
    auto path = writeConfig("device: /dev/ttyUSB3\nbaud: 9600\noutput: bench.sav\n");

    auto cli = parseCommandLine({"-b", "115200", "-c", path, "-o", "today.sav"});

    ASSERT_EQ(cli.status, CommandLine::Status::Ok) << cli.error;
    EXPECT_EQ(cli.config.devicePath, "/dev/ttyUSB3");
    EXPECT_EQ(cli.config.outputPath.string(), "today.sav");
    EXPECT_EQ(cli.config.baudRate, 115200u);
}

TEST_F(DumpConfigTest, UnreadableConfigFile) {
    auto cli = parseCommandLine({"-c", (tempDir / "missing.conf").string(), "-o", "a", "-d", "b"});
    EXPECT_EQ(cli.status, CommandLine::Status::Error);
    EXPECT_NE(cli.error.find("cannot read config file"), std::string::npos);
}

TEST_F(DumpConfigTest, BadConfigValueNamesLine) {
    auto path = writeConfig("device: /dev/ttyUSB0\nbaud: quick\n");

    auto cli = parseCommandLine({"-c", path, "-o", "a"});

    EXPECT_EQ(cli.status, CommandLine::Status::Error);
    EXPECT_NE(cli.error.find("config line 2: invalid baud 'quick'"), std::string::npos);
}

TEST(DumpConfigApplyTest, IgnoresUnknownKeys) {
    ConfigParser parser;
    DumpConfig config;

    auto error = config.apply(parser.parseString("colour: blue\nbaud: 0x4B00\n"));

    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(config.baudRate, 19200u);
}

TEST(DumpConfigApplyTest, RejectsBadValues) {
    ConfigParser parser;

    for (const char* text : {"baud: 0\n", "baud: -9600\n", "timeout_ms: 0\n",
                             "timeout_ms: soon\n", "verbose: perhaps\n"}) {
        DumpConfig config;
        EXPECT_TRUE(config.apply(parser.parseString(text)).has_value()) << text;
    }
}

TEST(DumpConfigApplyTest, VerboseCanBeTurnedOff) {
    ConfigParser parser;
    DumpConfig config;
    config.verbose = true;

    EXPECT_FALSE(config.apply(parser.parseString("verbose: off\n")).has_value());
    EXPECT_FALSE(config.verbose);
}

TEST(DumpConfigApplyTest, EmptyPathsKeepEarlierValues) {
    ConfigParser parser;
    DumpConfig config;
    config.devicePath = "/dev/ttyUSB0";
    config.outputPath = "cart.sav";

    EXPECT_FALSE(config.apply(parser.parseString("device:\noutput:\n")).has_value());
    EXPECT_EQ(config.devicePath, "/dev/ttyUSB0");
    EXPECT_EQ(config.outputPath.string(), "cart.sav");

    EXPECT_FALSE(config.apply(parser.parseString("device: /dev/ttyACM0\noutput: b.sav\n")).has_value());
    EXPECT_EQ(config.devicePath, "/dev/ttyACM0");
    EXPECT_EQ(config.outputPath.string(), "b.sav");
}
