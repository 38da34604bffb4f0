#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "transport.hpp"

namespace cli {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_OP = 1,  // missing host, rejected code, failed transfer
    EXIT_USAGE = 2
};

struct Invocation {
    std::string config_path;
    std::string command;
    std::vector<std::string> args;
};

// Splits "[--config PATH] command args..."; false on a malformed option
bool parse_args(const std::vector<std::string>& argv, Invocation& out);

void print_usage(std::ostream& os);

// Opens the desktop client on the given config file; returns its exit code
using GuiLauncher = std::function<int(const std::string& config_path)>;

// Activity lines go to err; command output (list, cat) goes to out
int run(const Invocation& invocation, std::istream& in, std::ostream& out, std::ostream& err,
        std::shared_ptr<transport::HttpTransport> http = nullptr);

// Entry point shared by both executables. With no command the launcher runs;
// without one (headless build) that is a usage error.
int run_main(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err,
             const GuiLauncher& launch_gui = nullptr);

} // namespace cli
