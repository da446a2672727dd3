#include "commands.h"
#include "cli_common.h"
#include "config_paths.h"
#include "../archive.h"
#include "../image_codec.h"
#include "../portrait_extractor.h"
#include <iomanip>

namespace idcrop {

namespace {

void printExtractUsage() {
    std::cerr << "Usage: idcrop extract <image> [options]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --output, -o <dir>       Output directory (default: current directory)" << std::endl;
    std::cerr << "  --confidence <0.1-0.99>  Minimum detection confidence (default: 0.6)" << std::endl;
    std::cerr << "  --margin <0-40>          Crop margin in percent of the face box (default: 10)" << std::endl;
    std::cerr << "  --all                    Keep all faces (largest first) instead of the largest only" << std::endl;
    std::cerr << "  --max-faces <1-10>       Face limit with --all (default: 5)" << std::endl;
    std::cerr << "  --backend <b>            auto, model or cascade (default: auto)" << std::endl;
    std::cerr << "  --model <path>           ncnn model base path (without .param/.bin)" << std::endl;
    std::cerr << "  --cascade <path>         Haar cascade XML for the cascade backend" << std::endl;
    std::cerr << "  --no-overlay             Don't write detections.jpg" << std::endl;
    std::cerr << "  --config <file>          Config file (default: " << CONFIG_DIR << "/idcrop.conf)" << std::endl;
    std::cerr << "  --verbose, -v            Debug logging" << std::endl;
}

bool writeOutput(const std::string& dir, const std::string& name, const Bytes& bytes) {
    const std::string path = cli::joinPath(dir, name);
    if (!writeFile(path, bytes)) {
        std::cerr << "Error: Failed to write " << path << std::endl;
        return false;
    }
    std::cout << "  " << path << " (" << bytes.size() << " bytes)" << std::endl;
    return true;
}

} // namespace

int cmd_extract(const std::vector<std::string>& args) {
    cli::CliOptions options;
    if (!cli::parseOptions(args, options, true)) {
        printExtractUsage();
        return 1;
    }

    Settings settings;
    if (!cli::resolveSettings(options, settings)) {
        return 1;
    }

    return cli::runGuarded([&]() -> int {
        std::shared_ptr<const FaceDetector> detector = createFaceDetector(settings.detector);
        PortraitExtractor extractor(detector);

        Image image = loadImageFile(options.image_path);
        if (options.verbose) {
            std::cout << "Image: " << options.image_path << " (" << image.width() << "x"
                      << image.height() << ")" << std::endl;
            std::cout << "Backend: " << detector->name() << std::endl;
        }

        ExtractionResult result = extractor.extract(image.view(), settings.extraction);

        if (result.status == ExtractionStatus::NO_FACES_FOUND) {
            std::cerr << "No faces detected. Try lowering the confidence or using a clearer image." << std::endl;
            return EXIT_NO_FACES;
        }

        if (!cli::ensureDirectory(options.output_dir)) {
            std::cerr << "Error: Cannot create output directory: " << options.output_dir << std::endl;
            return 1;
        }

        std::cout << "Detected " << result.detected << " face(s), kept "
                  << result.detections.size() << std::endl;
        for (size_t i = 0; i < result.detections.size(); i++) {
            const Detection& det = result.detections[i];
            std::cout << "  [" << i << "] " << det.box.toString() << " score="
                      << std::fixed << std::setprecision(2) << det.score
                      << (i == 0 ? " (main)" : "") << std::endl;
        }

        std::cout << "Writing:" << std::endl;
        bool ok = true;
        if (!result.overlay.empty()) {
            ok &= writeOutput(options.output_dir, kOverlayName,
                              encodeJpeg(result.overlay.view(), settings.extraction.jpeg_quality));
        }

        if (result.status == ExtractionStatus::EMPTY_CROP_SET) {
            std::cerr << "Failed to crop faces." << std::endl;
            return EXIT_EMPTY_CROPS;
        }

        for (size_t i = 0; i < result.crop_jpegs.size(); i++) {
            ok &= writeOutput(options.output_dir, portraitEntryName(i), result.crop_jpegs[i]);
        }
        ok &= writeOutput(options.output_dir, kMainPortraitName, result.main_portrait_jpeg);
        ok &= writeOutput(options.output_dir, kArchiveName, result.archive);

        std::cout << "Done in " << std::fixed << std::setprecision(1) << result.duration_ms
                  << " ms" << std::endl;
        return ok ? 0 : 1;
    });
}

} // namespace idcrop
