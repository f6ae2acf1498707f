#include "app/CommandLine.hpp"

#include "core/types/DiscoveryError.hpp"
#include "core/types/Validation.hpp"

#include <charconv>
#include <map>
#include <sstream>

namespace netsweep::app {

namespace {

// Positional arguments each command requires.
const std::map<std::string, size_t>& commandArity() {
    static const std::map<std::string, size_t> arity = {
        {"identify", 1}, {"vlans", 1}, {"macs", 1}, {"scan", 1}, {"health", 0}, {"config", 2},
    };
    return arity;
}

int parseVlanId(const std::string& text) {
    int id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw core::ValidationError("Invalid VLAN ID: " + text);
    }
    core::requireValidVlanId(id);
    return id;
}

void appendVlanIds(const std::string& value, std::vector<int>& out) {
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) {
        if (!part.empty()) {
            out.push_back(parseVlanId(part));
        }
    }
}

} // namespace

CommandLineOptions CommandLine::parse(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CommandLineOptions CommandLine::parse(const std::vector<std::string>& args) {
    CommandLineOptions options;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw core::ValidationError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-c" || arg == "--community") {
            options.community = value();
        } else if (arg == "-v" || arg == "--snmp-version") {
            options.version = value();
            core::requireSnmpVersion(*options.version);
        } else if (arg == "--vlan") {
            appendVlanIds(value(), options.vlanIds);
        } else if (arg == "--config") {
            options.configDir = value();
        } else if (arg == "--log-level") {
            options.logLevel = value();
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw core::ValidationError("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        if (!options.help) {
            throw core::ValidationError("No command given");
        }
        return options;
    }

    options.command = positional.front();
    options.arguments.assign(positional.begin() + 1, positional.end());

    auto it = commandArity().find(options.command);
    if (it == commandArity().end()) {
        throw core::ValidationError("Unknown command: " + options.command);
    }
    if (!options.help && options.arguments.size() != it->second) {
        throw core::ValidationError("Command '" + options.command + "' expects " +
                                    std::to_string(it->second) + " argument(s)");
    }
    if (options.command == "config" && !options.arguments.empty() &&
        options.arguments.front() != "set-community") {
        throw core::ValidationError("Unknown config action: " + options.arguments.front());
    }

    return options;
}

std::string CommandLine::usage() {
    return "Usage: netsweep [--config DIR] [--log-level LEVEL] <command> [options]\n"
           "\n"
           "Commands:\n"
           "  identify <ip>                 Identify vendor, model and type\n"
           "  vlans <ip>                    List VLANs from the VTP MIB\n"
           "  macs <ip> [--vlan N[,N...]]   Stream the MAC forwarding table per VLAN\n"
           "  scan <cidr>                   Identify every agent in a range\n"
           "  health                        Report status\n"
           "  config set-community <value>  Store the default community encrypted\n"
           "\n"
           "Options:\n"
           "  -c, --community <value>       Community string (default from config)\n"
           "  -v, --snmp-version <1|2c>     Protocol version (default from config)\n"
           "  --vlan <id>                   VLAN to sweep, repeatable\n"
           "  --config <dir>                Configuration directory\n"
           "  --log-level <level>           trace, debug, info, warn, error, off\n";
}

} // namespace netsweep::app
