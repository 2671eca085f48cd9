#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: deskmcp <command> [options]\n\n"
              << "Commands:\n"
              << "  server [--host H] [--port P]\n"
              << "                              Run the MCP server (registry, dispatch, liveness)\n"
              << "  agent [--name N] [--host H] [--port P] [--server URL]\n"
              << "                              Run the demo echo agent and register it\n"
              << "  call TOOL [JSON]            Call a tool, e.g. call echo_agent.echo '{\"message\":\"hi\"}'\n"
              << "  tools                       List every tool the server can dispatch\n"
              << "  agents                      List registered agent instances\n"
              << "  status [INSTANCE_ID]        Show configuration and server status, or one instance\n";
}

static bool parse_port(const std::string& s, int& port) {
    try {
        port = std::stoi(s);
        return port >= 0 && port <= 65535;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "server") {
        std::string host;
        int port = -1;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                if (!parse_port(args[++i], port)) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return deskmcp::cmd_server(host, port);
    }
    else if (cmd == "agent") {
        std::string name = "echo_agent";
        std::string host = "127.0.0.1";
        std::string server_url;
        int port = 0;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--name" && i + 1 < args.size()) {
                name = args[++i];
            } else if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--server" && i + 1 < args.size()) {
                server_url = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                if (!parse_port(args[++i], port)) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return deskmcp::cmd_agent(name, host, port, server_url);
    }
    else if (cmd == "call") {
        if (args.empty()) {
            std::cerr << "Usage: deskmcp call TOOL [JSON]\n";
            return 1;
        }
        return deskmcp::cmd_call(args[0], args.size() > 1 ? args[1] : "");
    }
    else if (cmd == "tools") {
        return deskmcp::cmd_tools();
    }
    else if (cmd == "agents") {
        return deskmcp::cmd_agents();
    }
    else if (cmd == "status") {
        return deskmcp::cmd_status(args.empty() ? "" : args[0]);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
