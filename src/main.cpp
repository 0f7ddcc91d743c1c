#include <iostream>
#include <string>
#include <cstdlib>
#include "cli/reclock_cli.hpp"
#include "core/constants.hpp"

static void print_usage(std::ostream& os) {
    os << "Usage: " << PROGRAM_NAME << " [--config <path>] [--pid-file <path>] [--kill]\n"
       << "\n"
       << "Take the cluster recovery lock and hold it for as long as it can be\n"
       << "proven alive. Prints one status character on stdout:\n"
       << "    0    lock acquired, now running as leader watchdog\n"
       << "    1    not leader (lock held elsewhere or helper already running)\n"
       << "    3    configuration or operational error\n"
       << "\n"
       << "    --config <path>     Configuration file (default " << DEFAULT_CONFIG_PATH << ")\n"
       << "    --pid-file <path>   Pid record (default " << DEFAULT_PID_PATH << ")\n"
       << "    --kill              Stop the running instance instead of starting one\n"
       << "                        (waits for an instance still acquiring the lock)\n"
       << "    --version           Show version\n"
       << "    --help              Show this help\n";
}

static int usage_error(const std::string& msg) {
    std::cerr << PROGRAM_NAME << ": " << msg << "\n";
    print_usage(std::cerr);
    std::cout << 3 << std::flush;
    return 3;
}

int main(int argc, char** argv) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--version") {
            std::cout << PROGRAM_NAME << " version " << PROGRAM_VERSION << "\n";
            return 0;
        } else if (arg == "--help") {
            print_usage(std::cout);
            return 0;
        } else if (arg == "--kill") {
            options.kill = true;
        } else if (arg == "--config" || arg == "--pid-file") {
            if (i + 1 >= argc) {
                return usage_error("Missing value for " + arg);
            }
            (arg == "--config" ? options.config_path : options.pid_path) = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            options.config_path = arg.substr(9);
        } else if (arg.rfind("--pid-file=", 0) == 0) {
            options.pid_path = arg.substr(11);
        } else {
            return usage_error("Unknown argument: " + arg);
        }
    }

    ReclockCLI cli(std::cout, std::cerr);
    int code = cli.run(options);

    if (cli.abandoned_work()) {
        // A storage call is still blocked on another thread; leave without
        // tearing down state it may be using.
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(code);
    }
    return code;
}
