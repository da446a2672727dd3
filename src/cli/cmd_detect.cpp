#include "commands.h"
#include "cli_common.h"
#include "../image_codec.h"
#include "../selection.h"
#include <chrono>
#include <iomanip>

namespace idcrop {

int cmd_detect(const std::vector<std::string>& args) {
    cli::CliOptions options;
    if (!cli::parseOptions(args, options, true)) {
        std::cerr << "Usage: idcrop detect <image> [--confidence f] [--all] [--max-faces n]"
                  << " [--backend b] [--model p] [--cascade p] [--config f] [--verbose]" << std::endl;
        return 1;
    }

    Settings settings;
    if (!cli::resolveSettings(options, settings)) {
        return 1;
    }

    return cli::runGuarded([&]() -> int {
        auto detector = createFaceDetector(settings.detector);
        Image image = loadImageFile(options.image_path);

        auto start = std::chrono::steady_clock::now();
        DetectionSet detections = detector->detect(image.view(), settings.extraction.min_confidence);
        auto end = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        const size_t detected = detections.size();
        DetectionSet ranked = selectDetections(std::move(detections), settings.extraction.mode,
                                               settings.extraction.max_faces);

        std::cout << "Image: " << options.image_path << " (" << image.width() << "x"
                  << image.height() << ")" << std::endl;
        std::cout << "Backend: " << detector->name() << std::endl;
        std::cout << "Confidence: " << std::fixed << std::setprecision(2)
                  << settings.extraction.min_confidence << std::endl;
        std::cout << "Detected " << detected << " face(s) in " << std::setprecision(1) << ms
                  << " ms, selection '" << selectionModeToString(settings.extraction.mode)
                  << "' keeps " << ranked.size() << std::endl;

        for (size_t i = 0; i < ranked.size(); i++) {
            const Detection& det = ranked[i];
            std::cout << "  [" << i << "] " << det.box.toString()
                      << " area=" << det.box.area()
                      << " score=" << std::setprecision(3) << det.score << std::endl;
        }

        if (ranked.empty()) {
            std::cout << "No faces detected. Try lowering the confidence or using a clearer image." << std::endl;
        }
        return 0;
    });
}

} // namespace idcrop
