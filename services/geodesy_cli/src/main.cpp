#include <iostream>
#include <string>
#include <vector>

#include "config.h"
#include "geodesy_cli.h"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    CliCommand cmd;
    std::string error;
    if (!ParseCommand(args, &cmd, &error)) {
        std::cerr << "[GEODESY-CLI] " << error << "\n" << UsageText();
        return 2;
    }

    std::string geodesy_addr = utils::GetEnvString("GEODESY_ADDR", "localhost:6100");
    std::cout << "Geodesy CLI connecting to " << geodesy_addr << "..." << std::endl;
    GeodesyCLI cli(geodesy_addr);
    return cli.Execute(cmd);
}
