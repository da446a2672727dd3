#ifndef IDCROP_CLI_COMMANDS_H
#define IDCROP_CLI_COMMANDS_H

#include <string>
#include <vector>

namespace idcrop {

/**
 * Command Functions for the idcrop CLI
 *
 * Each command receives the arguments after the command name and returns
 * the process exit code:
 *   - 0 on success
 *   - 1 on error (bad arguments, unreadable image, no backend)
 *   - 2 when no face was detected (extract only)
 *   - 3 when faces were found but every crop was empty (extract only)
 */

constexpr int EXIT_NO_FACES = 2;
constexpr int EXIT_EMPTY_CROPS = 3;

/**
 * Extract portrait crops from an ID document image
 *
 * Writes portrait_main.jpg, portraits.zip, portrait_<i>.jpg and
 * detections.jpg (unless --no-overlay) into the output directory.
 *
 * @param args <image> [--output dir] [--confidence f] [--margin n] [--all]
 *             [--max-faces n] [--backend b] [--model p] [--cascade p]
 *             [--no-overlay] [--config f] [--verbose]
 */
int cmd_extract(const std::vector<std::string>& args);

/**
 * Print ranked detections for an image without writing files
 *
 * @param args Same options as extract (output options are ignored)
 */
int cmd_detect(const std::vector<std::string>& args);

/**
 * Show the configured backend and the model/cascade it resolves to
 *
 * @param args [--config f] [--backend b] [--model p] [--cascade p]
 */
int cmd_info(const std::vector<std::string>& args);

/**
 * Print usage information and command help
 */
void print_usage();

} // namespace idcrop

#endif // IDCROP_CLI_COMMANDS_H
