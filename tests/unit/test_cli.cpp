#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/cli.hpp"

using namespace pulseplot;
using namespace pulseplot::app;

namespace
{

CommandLine parse(std::vector<std::string> args)
{
    return parse_command_line(args, false);
}

}   // namespace

// --- Commands ---

TEST(CommandLineParse, SerialDefaults)
{
    auto cl = parse({"serial"});
    EXPECT_EQ(cl.command, Command::Run);
    EXPECT_EQ(cl.config.source, SourceKind::Serial);
    EXPECT_TRUE(cl.config.serial.port.empty());
    EXPECT_EQ(cl.config.serial.baud, 115200);
    EXPECT_EQ(cl.config.buffer.capacity, 1000u);
    EXPECT_EQ(cl.config.view.y_policy, YScalePolicy::Midpoint);
    EXPECT_FALSE(cl.config.headless);
}

TEST(CommandLineParse, SerialPortAndBaud)
{
    auto cl = parse({"serial", "--port", "/dev/ttyACM1", "--baud", "9600"});
    EXPECT_EQ(cl.config.serial.port, "/dev/ttyACM1");
    EXPECT_EQ(cl.config.serial.baud, 9600);
}

TEST(CommandLineParse, CameraUsesCameraPreset)
{
    auto cl = parse({"camera", "2"});
    EXPECT_EQ(cl.config.source, SourceKind::Camera);
    EXPECT_EQ(cl.config.camera.index, 2);
    EXPECT_EQ(cl.config.buffer.capacity, 500u);
    EXPECT_EQ(cl.config.view.y_policy, YScalePolicy::Padded);
    EXPECT_EQ(cl.config.view.x_anchor, XAnchor::LatestSample);
}

TEST(CommandLineParse, ListingCommands)
{
    EXPECT_EQ(parse({"list-ports"}).command, Command::ListPorts);
    EXPECT_EQ(parse({"list-cameras"}).command, Command::ListCameras);
    EXPECT_EQ(parse({"--help"}).command, Command::Help);
    EXPECT_EQ(parse({"stdin", "-h"}).command, Command::Help);
}

TEST(CommandLineParse, CommonOptions)
{
    auto cl = parse({"stdin",
                     "--headless",
                     "--window",
                     "5",
                     "--capacity",
                     "250",
                     "--duration",
                     "2.5",
                     "--log-level",
                     "debug",
                     "--log-file",
                     "/tmp/pulseplot.log"});
    EXPECT_EQ(cl.config.source, SourceKind::Stdin);
    EXPECT_TRUE(cl.config.headless);
    EXPECT_DOUBLE_EQ(cl.config.view.window_seconds, 5.0);
    EXPECT_EQ(cl.config.buffer.capacity, 250u);
    EXPECT_DOUBLE_EQ(cl.config.max_run_seconds, 2.5);
    EXPECT_EQ(cl.config.log_level, LogLevel::Debug);
    EXPECT_EQ(cl.config.log_file, "/tmp/pulseplot.log");
}

// --- Usage errors ---

TEST(CommandLineParse, AcceptsLargestCapacity)
{
    auto cl = parse({"serial", "--capacity", "10000000"});
    EXPECT_EQ(cl.config.buffer.capacity, BufferConfig::MAX_CAPACITY);
}

TEST(CommandLineParse, RejectsBadInput)
{
    EXPECT_THROW(parse({}), UsageError);
    EXPECT_THROW(parse({"bluetooth"}), UsageError);
    EXPECT_THROW(parse({"serial", "--baud"}), UsageError);
    EXPECT_THROW(parse({"serial", "--baud", "fast"}), UsageError);
    EXPECT_THROW(parse({"serial", "--capacity", "0"}), UsageError);
    EXPECT_THROW(parse({"serial", "--capacity", "9000000000000000000"}), UsageError);
    EXPECT_THROW(parse({"stdin", "--capacity", "10000001"}), UsageError);
    EXPECT_THROW(parse({"serial", "--window", "-1"}), UsageError);
    EXPECT_THROW(parse({"serial", "--log-level", "loud"}), UsageError);
    EXPECT_THROW(parse({"camera", "--port", "/dev/ttyACM0"}), UsageError);
    EXPECT_THROW(parse({"camera", "front"}), UsageError);
    EXPECT_THROW(parse({"serial", "extra"}), UsageError);
}

TEST(CommandLineParse, UsageMentionsCommands)
{
    auto text = usage_text();
    EXPECT_NE(text.find("list-ports"), std::string::npos);
    EXPECT_NE(text.find("camera"), std::string::npos);
}

// --- Environment ---

TEST(CommandLineParse, EnvironmentThenFlags)
{
    ::setenv("PULSEPLOT_LOG_LEVEL", "error", 1);
    ::setenv("PULSEPLOT_HEADLESS", "1", 1);

    auto from_env = parse_command_line({"serial"}, true);
    EXPECT_EQ(from_env.config.log_level, LogLevel::Error);
    EXPECT_TRUE(from_env.config.headless);

    auto flag_wins = parse_command_line({"serial", "--log-level", "trace"}, true);
    EXPECT_EQ(flag_wins.config.log_level, LogLevel::Trace);

    ::unsetenv("PULSEPLOT_LOG_LEVEL");
    ::unsetenv("PULSEPLOT_HEADLESS");
}

TEST(RunConfig, SourceNames)
{
    EXPECT_STREQ(to_string(SourceKind::Serial), "serial");
    EXPECT_STREQ(to_string(SourceKind::Camera), "camera");
    EXPECT_STREQ(to_string(SourceKind::Stdin), "stdin");
}

TEST(RunConfig, HeadlessFalseValues)
{
    RunConfig cfg;
    cfg.headless = true;
    ::setenv("PULSEPLOT_HEADLESS", "0", 1);
    apply_environment(cfg);
    EXPECT_FALSE(cfg.headless);
    ::unsetenv("PULSEPLOT_HEADLESS");
}
