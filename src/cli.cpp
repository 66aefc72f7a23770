#include "cli.hpp"
#include "config.hpp"
#include "privilege.hpp"
#include "runner.hpp"
#include "utils.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

namespace NetcapSetup {
namespace Cli {

Options parseArguments(const std::vector<std::string>& args)
{
    Options options;

    for (std::size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            if (i + 1 < args.size()) {
                options.configSource = args[++i];
            }
            else {
                throw std::invalid_argument("--config requires a file path or URL.");
            }
        }
        else if (arg.rfind("--config=", 0) == 0) {
            options.configSource = arg.substr(9);
            if (options.configSource.empty()) {
                throw std::invalid_argument("--config requires a file path or URL.");
            }
        }
        else if (arg == "--dry-run") {
            options.dryRun = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        }
        else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        }
        else if (arg == "--version") {
            options.showVersion = true;
        }
        else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return options;
}

void printHelp(std::ostream& out)
{
    out << "netcap-setup " << NCSETUP_VERSION << "\n"
        << "Usage: sudo netcap-setup [options]\n\n"
        << "Installs everything NetCapture Pro needs: refreshes the apt index,\n"
        << "installs the packet-capture system packages and the Python packages.\n\n"
        << "Options:\n"
        << "  --config <file|url>  Load the installation plan from a YAML file or URL\n"
        << "  --dry-run            Show the plan without running anything\n"
        << "  -v, --verbose        Log each command before it runs\n"
        << "  -h, --help           Show this help\n"
        << "  --version            Show the version\n";
}

int run(const std::vector<std::string>& args, uid_t euid,
        std::ostream& out, Executor* executor)
{
    Options options;
    try {
        options = parseArguments(args);
    }
    catch (const std::invalid_argument& e) {
        log_error(e.what());
        std::cerr << "Try 'netcap-setup --help' for more information.\n";
        return EXIT_USAGE;
    }

    if (options.showHelp) {
        printHelp(out);
        return 0;
    }
    if (options.showVersion) {
        out << "netcap-setup " << NCSETUP_VERSION << "\n";
        return 0;
    }

    // A non-root run must not fetch or read the plan
    if (!options.dryRun && !Privilege::check(out, euid)) {
        return Privilege::EXIT_NOT_ROOT;
    }

    try {
        Config config = options.configSource.empty()
            ? Config::defaults()
            : Config::loadFromSource(options.configSource);

        std::unique_ptr<Executor> processExecutor;
        if (!executor) {
            processExecutor.reset(new ProcessExecutor(options.verbose));
            executor = processExecutor.get();
        }
        Runner runner(*executor, out);

        if (options.dryRun) {
            return runner.dryRun(config);
        }
        return runner.run(config, euid);
    }
    catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
}

} // namespace Cli
} // namespace NetcapSetup
