#ifndef IDCROP_CLI_COMMON_H
#define IDCROP_CLI_COMMON_H

/**
 * CLI Common Utilities
 *
 * Shared option parsing and settings resolution for the image commands
 */

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../config.h"
#include "../settings.h"

namespace idcrop {
namespace cli {

/**
 * Options shared by extract / detect / info.
 * Unset optionals fall back to the config file, then built-in defaults.
 */
struct CliOptions {
    std::string image_path;
    std::string output_dir = ".";
    std::string config_path;
    bool verbose = false;

    std::optional<float> confidence;
    std::optional<int> margin;
    std::optional<int> max_faces;
    std::optional<std::string> backend;
    std::optional<std::string> model;
    std::optional<std::string> cascade;
    bool all_faces = false;
    bool no_overlay = false;
};

/**
 * Parse command arguments into CliOptions
 *
 * @param args Arguments after the command name
 * @param out Parsed options
 * @param require_image Whether a positional <image> argument is mandatory
 * @return false (after printing the reason to stderr) on invalid input
 */
bool parseOptions(const std::vector<std::string>& args, CliOptions& out, bool require_image);

/**
 * Load the config file (--config or CONFIG_DIR/idcrop.conf), apply its
 * [logging] section and merge command-line overrides on top.
 *
 * @return false (after printing the reason) if an override is invalid
 */
bool resolveSettings(const CliOptions& options, Settings& out);

/**
 * Run a command body and map any exception it throws to exit code 1,
 * printing the reason to stderr
 */
int runGuarded(const std::function<int()>& body);

/**
 * Create a directory and its parents (like mkdir -p)
 *
 * @return true if the directory exists afterwards
 */
bool ensureDirectory(const std::string& path);

/**
 * Join a directory and a file name
 */
std::string joinPath(const std::string& dir, const std::string& name);

} // namespace cli
} // namespace idcrop

#endif // IDCROP_CLI_COMMON_H
