#include "config.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace NetcapSetup {

namespace {

    const char* const DEFAULT_TITLE        = "NetCapture Pro \xE2\x80\x94 Installer";
    const char* const DEFAULT_NEXT_COMMAND = "sudo python3 netcapture.py";

    Step parseStep(const YAML::Node& node, std::size_t index, const std::string& origin)
    {
        std::string where = origin + ": steps[" + std::to_string(index) + "]";

        if (!node.IsMap()) {
            throw std::runtime_error(where + " must be a mapping");
        }

        Step step;
        if (node["description"]) {
            step.description = node["description"].as<std::string>();
        }

        const YAML::Node command = node["command"];
        if (!command) {
            throw std::runtime_error(where + " is missing 'command'");
        }
        if (command.IsSequence()) {
            for (const auto& arg : command) {
                step.command.push_back(arg.as<std::string>());
            }
        } else if (command.IsScalar()) {
            // Plain string: split on whitespace, no shell quoting rules
            std::istringstream iss(command.as<std::string>());
            std::string arg;
            while (iss >> arg) {
                step.command.push_back(arg);
            }
        } else {
            throw std::runtime_error(where + ".command must be a list or a string");
        }

        if (node["on_failure"]) {
            step.policy = parseFailurePolicy(node["on_failure"].as<std::string>());
        }

        step.suppressStderr = (step.policy == FailurePolicy::Tolerate);
        if (node["suppress_stderr"]) {
            step.suppressStderr = node["suppress_stderr"].as<bool>();
        }

        return step;
    }

} // namespace

Config Config::defaults()
{
    Config config;
    config.title       = DEFAULT_TITLE;
    config.nextCommand = DEFAULT_NEXT_COMMAND;

    Step refresh;
    refresh.description = "Updating apt...";
    refresh.command     = {"apt-get", "update", "-qq"};
    refresh.policy      = FailurePolicy::Abort;

    // Some of these are missing or already satisfied on certain distributions
    Step system;
    system.description    = "Installing system dependencies...";
    system.command        = {"apt-get", "install", "-y", "-qq",
                             "python3", "python3-pip",
                             "libpcap-dev",
                             "tshark",
                             "wireshark-common"};
    system.policy         = FailurePolicy::Tolerate;
    system.suppressStderr = true;

    Step python;
    python.description = "Installing Python packages...";
    python.command     = {"pip3", "install", "--break-system-packages", "-q",
                          "scapy", "rich", "manuf", "cryptography", "dpkt", "requests"};
    python.policy      = FailurePolicy::Abort;

    config.steps = {refresh, system, python};
    return config;
}

Config Config::loadFromString(const std::string& yaml, const std::string& origin)
{
    Config config;
    config.title       = DEFAULT_TITLE;
    config.nextCommand = DEFAULT_NEXT_COMMAND;

    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            throw std::runtime_error(origin + ": top level must be a mapping");
        }

        if (root["title"]) {
            config.title = root["title"].as<std::string>();
        }
        if (root["next_command"]) {
            config.nextCommand = root["next_command"].as<std::string>();
        }

        const YAML::Node steps = root["steps"];
        if (!steps || !steps.IsSequence()) {
            throw std::runtime_error(origin + ": 'steps' must be a list");
        }
        for (std::size_t i = 0; i < steps.size(); ++i) {
            config.steps.push_back(parseStep(steps[i], i, origin));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(origin + ": " + e.what());
    }

    config.validate();
    return config;
}

Config Config::loadFromFile(const std::string& path)
{
    if (!fs::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str(), path);
}

Config Config::loadFromSource(const std::string& source)
{
    if (isRemoteSource(source)) {
        return loadFromString(fetchRemoteText(source), source);
    }
    return loadFromFile(source);
}

void Config::validate() const
{
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const Step& step = steps[i];
        if (step.command.empty() || step.command.front().empty()) {
            std::string name = step.description.empty()
                ? "steps[" + std::to_string(i) + "]"
                : "'" + step.description + "'";
            throw std::runtime_error("Step " + name + " has an empty command");
        }
    }
}

void Config::print(std::ostream& out) const
{
    for (const auto& step : steps) {
        out << "  [*] " << step.description << "\n"
            << "      $ " << joinCommandLine(step.command);
        if (step.policy == FailurePolicy::Tolerate) {
            out << "  (on failure: " << failurePolicyName(step.policy) << ")";
        }
        out << "\n";
    }
}

} // namespace NetcapSetup
