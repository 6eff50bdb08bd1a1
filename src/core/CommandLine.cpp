#include "core/CommandLine.h"
#include <stdexcept>

namespace {
class ArgReader {
public:
    ArgReader(int argc, const char* const argv[]) : argc(argc), argv(argv) {}

    bool next() {
        if (++index >= argc) return false;
        std::string arg = argv[index];
        inlineValue.reset();
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }
        current = arg;
        return true;
    }

    const std::string& name() const { return current; }

    std::string value() {
        if (inlineValue) return *inlineValue;
        if (index + 1 >= argc) throw std::runtime_error("Missing value for " + current);
        return argv[++index];
    }

    int intValue(int min, int max) {
        std::string raw = value();
        int parsed = 0;
        try {
            size_t used = 0;
            parsed = std::stoi(raw, &used);
            if (used != raw.size()) throw std::invalid_argument(raw);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number for " + current + ": " + raw);
        }
        if (parsed < min || parsed > max) {
            throw std::runtime_error(current + " must be between " + std::to_string(min) + " and " +
                                     std::to_string(max));
        }
        return parsed;
    }

private:
    int argc;
    const char* const* argv;
    int index = 0;
    std::string current;
    std::optional<std::string> inlineValue;
};
} // namespace

HubOptions parseHubArgs(int argc, const char* const argv[]) {
    HubOptions options;
    ArgReader args(argc, argv);
    while (args.next()) {
        const std::string& name = args.name();
        if (name == "-h" || name == "--help") {
            options.help = true;
        } else if (name == "--config") {
            options.configPaths.push_back(args.value());
        } else if (name == "--port") {
            options.port = args.intValue(1, 65535);
        } else if (name == "--workspace") {
            options.workspaceDir = args.value();
        } else if (name == "--no-workspace") {
            options.noWorkspace = true;
        } else if (name == "--socket") {
            options.socketPath = args.value();
        } else if (name == "--log-file") {
            options.logFile = args.value();
        } else if (name == "--log-level") {
            options.logLevel = Logger::parseLevel(args.value());
        } else if (name == "--auto-approve") {
            options.autoApprove = true;
        } else {
            throw std::runtime_error("Unknown option: " + name);
        }
    }
    return options;
}

ProxyOptions parseProxyArgs(int argc, const char* const argv[]) {
    ProxyOptions options;
    ArgReader args(argc, argv);
    while (args.next()) {
        const std::string& name = args.name();
        if (name == "-h" || name == "--help") {
            options.help = true;
        } else if (name == "--socket") {
            options.socketPath = args.value();
        } else if (name == "--port") {
            options.port = args.intValue(1, 65535);
        } else if (name == "--workspace") {
            options.workspaceDir = args.value();
        } else if (name == "-t" || name == "--rpc-call-timeout") {
            options.rpcCallTimeout = std::chrono::milliseconds(args.intValue(1, 24 * 60 * 60 * 1000));
        } else if (name == "-c" || name == "--connection-timeout") {
            options.connectionTimeout = std::chrono::milliseconds(args.intValue(1, 10 * 60 * 1000));
        } else if (name == "-l" || name == "--log-file") {
            options.logFile = args.value();
        } else if (name == "-v" || name == "--log-level") {
            options.logLevel = Logger::parseLevel(args.value());
        } else {
            throw std::runtime_error("Unknown option: " + name);
        }
    }

    int targets = (options.socketPath.empty() ? 0 : 1) + (options.port ? 1 : 0) +
                  (options.workspaceDir.empty() ? 0 : 1);
    if (!options.help && targets != 1) {
        throw std::runtime_error("Exactly one of --socket, --port or --workspace is required");
    }
    return options;
}

std::string hubUsage() {
    return "Usage: mcphub [options]\n"
           "  --config FILE        servers file (repeatable; default ~/.config/mcphub/servers.json)\n"
           "  --port N             control port (default: from workspace or config)\n"
           "  --workspace DIR      start workspace discovery in DIR (default: current directory)\n"
           "  --no-workspace       ignore workspace config files\n"
           "  --socket PATH        serve the control RPC on a Unix socket\n"
           "  --log-file FILE      append logs to FILE\n"
           "  --log-level LEVEL    trace, debug, info, warn, error, off or 0-5\n"
           "  --auto-approve       approve every tool call\n";
}

std::string proxyUsage() {
    return "Usage: mcphub-proxy (--socket PATH | --port N | --workspace DIR) [options]\n"
           "  -t, --rpc-call-timeout MS    per-call timeout (default 60000)\n"
           "  -c, --connection-timeout MS  hub connection timeout (default 5000)\n"
           "  -l, --log-file FILE          append logs to FILE\n"
           "  -v, --log-level LEVEL        trace, debug, info, warn, error, off or 0-5\n";
}
