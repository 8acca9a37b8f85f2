#include <iostream>
#include <vector>
#include <string>
#include "cli/shuttle_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;

    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    try {
        ShuttleCLI cli(config_path);

        if (args.empty() || args[0] == "--help" || args[0] == "help") {
            cli.print_help();
            return args.empty() ? 1 : 0;
        }

        std::string cmd = args[0];
        args.erase(args.begin());
        return cli.execute_command(cmd, args) ? 0 : 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
