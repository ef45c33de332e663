#include "cli.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

namespace pulseplot::app
{

namespace
{

template <typename T>
T parse_number(std::string_view flag, std::string_view text)
{
    T    value{};
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size())
        throw UsageError(std::string(flag) + ": expected a number, got '" + std::string(text) + "'");
    return value;
}

double parse_seconds(std::string_view flag, std::string_view text)
{
    std::string s(text);
    size_t      used = 0;
    double      v    = 0.0;
    try
    {
        v = std::stod(s, &used);
    }
    catch (const std::exception&)
    {
        throw UsageError(std::string(flag) + ": expected seconds, got '" + s + "'");
    }
    if (used != s.size() || !std::isfinite(v) || v <= 0.0)
        throw UsageError(std::string(flag) + ": expected positive seconds, got '" + s + "'");
    return v;
}

}   // anonymous namespace

std::string usage_text()
{
    return "usage: pulseplot <command> [options]\n"
           "\n"
           "commands:\n"
           "  serial [--port PATH] [--baud N]   plot integers read from a serial device\n"
           "  camera [INDEX]                    plot mean red intensity of a camera\n"
           "  stdin                             plot integers read from standard input\n"
           "  list-ports                        list serial ports\n"
           "  list-cameras                      list cameras that deliver frames\n"
           "\n"
           "options:\n"
           "  --headless           log the view instead of opening a window\n"
           "  --window SECONDS     visible time span (default 10)\n"
           "  --capacity N         samples kept in memory\n"
           "  --duration SECONDS   stop after this long\n"
           "  --log-level LEVEL    trace|debug|info|warn|error|critical\n"
           "  --log-file PATH      also append log lines to PATH\n"
           "  -h, --help           show this text\n";
}

CommandLine parse_command_line(const std::vector<std::string>& args, bool read_environment)
{
    CommandLine cl;
    if (args.empty())
        throw UsageError("missing command");

    const std::string& cmd = args[0];
    if (cmd == "-h" || cmd == "--help" || cmd == "help")
    {
        cl.command = Command::Help;
        return cl;
    }

    if (cmd == "serial")
        cl.config = RunConfig::for_source(SourceKind::Serial);
    else if (cmd == "camera")
        cl.config = RunConfig::for_source(SourceKind::Camera);
    else if (cmd == "stdin")
        cl.config = RunConfig::for_source(SourceKind::Stdin);
    else if (cmd == "list-ports")
        cl.command = Command::ListPorts;
    else if (cmd == "list-cameras")
        cl.command = Command::ListCameras;
    else
        throw UsageError("unknown command '" + cmd + "'");

    if (cmd == "serial" || cmd == "camera" || cmd == "stdin")
        cl.command = Command::Run;

    if (read_environment)
        apply_environment(cl.config);

    RunConfig& config = cl.config;
    for (size_t i = 1; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string&
        {
            if (i + 1 >= args.size())
                throw UsageError(arg + " needs a value");
            return args[++i];
        };

        if (arg == "-h" || arg == "--help")
        {
            cl.command = Command::Help;
            return cl;
        }
        else if (arg == "--headless")
            config.headless = true;
        else if (arg == "--window")
            config.view.window_seconds = parse_seconds(arg, value());
        else if (arg == "--duration")
            config.max_run_seconds = parse_seconds(arg, value());
        else if (arg == "--capacity")
        {
            auto n = parse_number<long long>(arg, value());
            if (n <= 0)
                throw UsageError("--capacity must be positive");
            if (static_cast<unsigned long long>(n) > BufferConfig::MAX_CAPACITY)
                throw UsageError("--capacity must not exceed " + std::to_string(BufferConfig::MAX_CAPACITY));
            config.buffer.capacity = static_cast<std::size_t>(n);
        }
        else if (arg == "--log-level")
        {
            const std::string& name  = value();
            auto               level = Logger::level_from_string(name);
            if (!level)
                throw UsageError("unknown log level '" + name + "'");
            config.log_level = *level;
        }
        else if (arg == "--log-file")
            config.log_file = value();
        else if (arg == "--port" && config.source == SourceKind::Serial && cl.command == Command::Run)
            config.serial.port = value();
        else if (arg == "--baud" && config.source == SourceKind::Serial && cl.command == Command::Run)
            config.serial.baud = parse_number<int>(arg, value());
        else if (cmd == "camera" && !arg.empty() && arg[0] != '-')
        {
            config.camera.index = parse_number<int>("camera index", arg);
            if (config.camera.index < 0)
                throw UsageError("camera index must not be negative");
        }
        else
            throw UsageError("unexpected argument '" + arg + "' for " + cmd);
    }

    return cl;
}

}   // namespace pulseplot::app
