#include "commands.h"
#include "cli_common.h"
#include "config_paths.h"
#include "../cascade_detector.h"
#include "../errors.h"
#include "../model_detector.h"
#include "../selection.h"
#include <iomanip>

namespace idcrop {

int cmd_info(const std::vector<std::string>& args) {
    cli::CliOptions options;
    if (!cli::parseOptions(args, options, false)) {
        std::cerr << "Usage: idcrop info [--config f] [--backend b] [--model p] [--cascade p]" << std::endl;
        return 1;
    }

    Settings settings;
    if (!cli::resolveSettings(options, settings)) {
        return 1;
    }

    const DetectorSettings& det = settings.detector;
    const ExtractionOptions& opt = settings.extraction;

    std::cout << "=== idcrop " << VERSION << " ===" << std::endl;
    std::cout << "Config:      " << (options.config_path.empty()
                                     ? std::string(CONFIG_DIR) + "/idcrop.conf"
                                     : options.config_path) << std::endl;
    std::cout << "Models dir:  " << MODELS_DIR << std::endl;
    std::cout << std::endl;

    std::cout << "Detection:" << std::endl;
    std::cout << "  Backend:        " << detectorBackendToString(det.backend) << std::endl;
    std::cout << "  Threads:        " << det.num_threads << std::endl;
    std::cout << "  Min confidence: " << std::fixed << std::setprecision(2) << opt.min_confidence << std::endl;

    ModelFiles files;
    if (resolveModelFiles(det.model_path, files)) {
        std::cout << "  Model:          " << files.param_path << std::endl;
        std::cout << "                  " << files.bin_path << std::endl;
        std::cout << "  Model type:     " << detectionModelTypeToString(detectModelType(files.param_path)) << std::endl;
    } else {
        std::cout << "  Model:          not found"
                  << (det.model_path.empty() ? "" : " (" + det.model_path + ")") << std::endl;
    }

    const std::string cascade = det.cascade_path.empty() ? defaultCascadePath() : det.cascade_path;
    std::cout << "  Cascade:        " << cascade << std::endl;

    std::cout << std::endl;
    std::cout << "Extraction:" << std::endl;
    std::cout << "  Selection:      " << selectionModeToString(opt.mode);
    if (opt.mode == SelectionMode::ALL_FACES) {
        std::cout << " (max " << opt.max_faces << ")";
    }
    std::cout << std::endl;
    std::cout << "  Margin:         " << opt.margin_percent << "%" << std::endl;
    std::cout << "  JPEG quality:   " << opt.jpeg_quality << std::endl;
    std::cout << "  Overlay:        " << (opt.draw_overlay ? "yes" : "no") << std::endl;

    std::cout << std::endl;
    try {
        auto detector = createFaceDetector(det);
        std::cout << "Active backend: " << detector->name() << std::endl;
    } catch (const BackendUnavailable& e) {
        std::cout << "Active backend: unavailable (" << e.what() << ")" << std::endl;
        return 1;
    }
    return 0;
}

} // namespace idcrop
