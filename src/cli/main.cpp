#include <iostream>
#include <string>
#include <vector>
#include "commands.h"
#include "config_paths.h"

using namespace idcrop;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version") {
        std::cout << "idcrop version " << VERSION << std::endl;
        return 0;
    }

    if (command == "extract") {
        return cmd_extract(args);
    }

    if (command == "detect") {
        return cmd_detect(args);
    }

    if (command == "info") {
        return cmd_info(args);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
