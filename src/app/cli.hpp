#pragma once

#include <pulseplot/config.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace pulseplot::app
{

enum class Command
{
    Run,
    ListPorts,
    ListCameras,
    Help,
};

struct CommandLine
{
    Command   command = Command::Help;
    RunConfig config;
};

// Malformed arguments; the executable exits with code 2.
class UsageError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// pulseplot <serial|camera|stdin|list-ports|list-cameras> [options]
// Environment overrides (when `read_environment`) apply before flags, so an
// explicit flag always wins.  Throws UsageError.
CommandLine parse_command_line(const std::vector<std::string>& args, bool read_environment = true);

std::string usage_text();

}   // namespace pulseplot::app
