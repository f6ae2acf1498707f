#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::app {

/**
 * @brief Parsed command line of the netsweep executable.
 */
struct CommandLineOptions {
    std::string command;                  ///< identify, vlans, macs, scan, health, config
    std::vector<std::string> arguments;   ///< Positional arguments after the command
    std::optional<std::string> community; ///< -c / --community
    std::optional<std::string> version;   ///< -v / --snmp-version, "1" or "2c"
    std::vector<int> vlanIds;             ///< --vlan, repeatable or comma separated
    std::optional<std::filesystem::path> configDir;
    std::optional<std::string> logLevel;
    bool help{false};
};

class CommandLine {
public:
    /**
     * @brief Parses argv.
     * @throws core::ValidationError for unknown options, missing values,
     *         unknown commands or missing positional arguments.
     */
    static CommandLineOptions parse(int argc, const char* const* argv);

    /** @overload */
    static CommandLineOptions parse(const std::vector<std::string>& args);

    static std::string usage();
};

} // namespace netsweep::app
