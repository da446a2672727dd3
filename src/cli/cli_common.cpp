#include "cli_common.h"
#include "config_paths.h"
#include "../errors.h"
#include "../logger.h"
#include <cerrno>
#include <sys/stat.h>

namespace idcrop {
namespace cli {

namespace {

// Value-taking flag: consumes args[i + 1]
bool takeValue(const std::vector<std::string>& args, size_t& i, std::string& value) {
    if (i + 1 >= args.size()) {
        std::cerr << "Error: " << args[i] << " requires a value" << std::endl;
        return false;
    }
    value = args[++i];
    return true;
}

bool parseFloat(const std::string& flag, const std::string& text, float& out) {
    size_t consumed = 0;
    try {
        out = std::stof(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        std::cerr << "Error: Invalid value for " << flag << ": " << text << std::endl;
        return false;
    }
    return true;
}

bool parseInt(const std::string& flag, const std::string& text, int& out) {
    size_t consumed = 0;
    try {
        out = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        std::cerr << "Error: Invalid value for " << flag << ": " << text << std::endl;
        return false;
    }
    return true;
}

} // namespace

bool parseOptions(const std::vector<std::string>& args, CliOptions& out, bool require_image) {
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        std::string value;

        if (arg == "--output" || arg == "-o") {
            if (!takeValue(args, i, value)) return false;
            out.output_dir = value;
        } else if (arg == "--confidence") {
            float f = 0.0f;
            if (!takeValue(args, i, value) || !parseFloat(arg, value, f)) return false;
            out.confidence = f;
        } else if (arg == "--margin") {
            int n = 0;
            if (!takeValue(args, i, value) || !parseInt(arg, value, n)) return false;
            out.margin = n;
        } else if (arg == "--max-faces") {
            int n = 0;
            if (!takeValue(args, i, value) || !parseInt(arg, value, n)) return false;
            out.max_faces = n;
        } else if (arg == "--backend") {
            if (!takeValue(args, i, value)) return false;
            out.backend = value;
        } else if (arg == "--model") {
            if (!takeValue(args, i, value)) return false;
            out.model = value;
        } else if (arg == "--cascade") {
            if (!takeValue(args, i, value)) return false;
            out.cascade = value;
        } else if (arg == "--config") {
            if (!takeValue(args, i, value)) return false;
            out.config_path = value;
        } else if (arg == "--all") {
            out.all_faces = true;
        } else if (arg == "--no-overlay") {
            out.no_overlay = true;
        } else if (arg == "--verbose" || arg == "-v") {
            out.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return false;
        } else if (out.image_path.empty()) {
            out.image_path = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << std::endl;
            return false;
        }
    }

    if (require_image && out.image_path.empty()) {
        std::cerr << "Error: image path required" << std::endl;
        return false;
    }
    return true;
}

bool resolveSettings(const CliOptions& options, Settings& out) {
    Config& config = Config::getInstance();
    const std::string config_path = options.config_path.empty()
        ? std::string(CONFIG_DIR) + "/idcrop.conf"
        : options.config_path;

    // A missing default config just means defaults
    if (!config.load(config_path) && !options.config_path.empty()) {
        if (!config.getValidationErrors().empty()) {
            std::cerr << "Warning: " << config_path << " has invalid values, using defaults for them" << std::endl;
        } else {
            std::cerr << "Error: Cannot read config file: " << config_path << std::endl;
            return false;
        }
    }

    applyLoggingConfig(config);
    if (options.verbose) {
        Logger::getInstance().setLogLevel(LogLevel::DEBUG);
    }

    out = settingsFromConfig(config);

    if (options.backend) {
        auto backend = parseDetectorBackend(*options.backend);
        if (!backend) {
            std::cerr << "Error: --backend must be auto, model or cascade" << std::endl;
            return false;
        }
        out.detector.backend = *backend;
    }
    if (options.model) out.detector.model_path = *options.model;
    if (options.cascade) out.detector.cascade_path = *options.cascade;

    if (options.confidence) {
        if (*options.confidence < 0.1f || *options.confidence > 0.99f) {
            std::cerr << "Error: --confidence must be between 0.1 and 0.99" << std::endl;
            return false;
        }
        out.extraction.min_confidence = *options.confidence;
    }
    if (options.margin) {
        if (*options.margin < 0 || *options.margin > 40) {
            std::cerr << "Error: --margin must be between 0 and 40" << std::endl;
            return false;
        }
        out.extraction.margin_percent = *options.margin;
    }
    if (options.max_faces) {
        if (*options.max_faces < 1 || *options.max_faces > 10) {
            std::cerr << "Error: --max-faces must be between 1 and 10" << std::endl;
            return false;
        }
        out.extraction.max_faces = *options.max_faces;
    }
    if (options.all_faces) out.extraction.mode = SelectionMode::ALL_FACES;
    if (options.no_overlay) out.extraction.draw_overlay = false;

    return true;
}

int runGuarded(const std::function<int()>& body) {
    try {
        return body();
    } catch (const DecodeError& e) {
        std::cerr << "Error: Cannot decode image: " << e.what() << std::endl;
    } catch (const BackendUnavailable& e) {
        std::cerr << "Error: Face detection unavailable: " << e.what() << std::endl;
    } catch (const EncodeError& e) {
        std::cerr << "Error: Cannot encode portrait: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Unexpected failure: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}

bool ensureDirectory(const std::string& path) {
    if (path.empty()) return false;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        if (!ensureDirectory(path.substr(0, slash))) {
            return false;
        }
    }

    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        Logger::getInstance().error("Cannot create directory " + path);
        return false;
    }
    return true;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace cli
} // namespace idcrop
