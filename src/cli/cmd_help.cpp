#include <iostream>
#include "commands.h"
#include "config_paths.h"

namespace idcrop {

void print_usage() {
    std::cout << "idcrop - ID document portrait extractor" << std::endl;
    std::cout << "Version: " << VERSION << std::endl << std::endl;
    std::cout << "Usage: idcrop <command> [options]" << std::endl << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  extract <image> [options]      Crop portrait(s) and write JPEGs + ZIP" << std::endl;
    std::cout << "  detect <image> [options]       Print ranked face detections" << std::endl;
    std::cout << "  info [options]                 Show configuration and detection backend" << std::endl;
    std::cout << "  version                        Show version information" << std::endl;
    std::cout << "  help                           Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --output, -o <dir>             Output directory for extract (default: .)" << std::endl;
    std::cout << "  --confidence <0.1-0.99>        Minimum detection confidence (default: 0.6)" << std::endl;
    std::cout << "  --margin <0-40>                Crop margin in percent (default: 10)" << std::endl;
    std::cout << "  --all                          Keep all faces instead of the largest only" << std::endl;
    std::cout << "  --max-faces <1-10>             Face limit with --all (default: 5)" << std::endl;
    std::cout << "  --backend <auto|model|cascade> Detection backend (default: auto)" << std::endl;
    std::cout << "  --model <path>                 ncnn model base path" << std::endl;
    std::cout << "  --cascade <path>               Haar cascade XML" << std::endl;
    std::cout << "  --no-overlay                   Skip detections.jpg" << std::endl;
    std::cout << "  --config <file>                Config file (default: " << CONFIG_DIR << "/idcrop.conf)" << std::endl;
    std::cout << "  --verbose, -v                  Debug logging" << std::endl;
    std::cout << std::endl;
    std::cout << "Exit codes: 0 ok, 1 error, 2 no faces detected, 3 no usable crop" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  idcrop extract id-card.jpg                          # Main portrait into ./" << std::endl;
    std::cout << "  idcrop extract id-card.jpg -o out --margin 20       # Looser crop into out/" << std::endl;
    std::cout << "  idcrop extract scan.png --all --max-faces 3         # Up to 3 faces, largest first" << std::endl;
    std::cout << "  idcrop detect id-card.jpg --backend cascade         # Detections with the Haar cascade" << std::endl;
}

} // namespace idcrop
