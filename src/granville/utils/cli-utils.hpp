
#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup cli Command Line Utils
 * @ingroup granville-utils
 *
 * The `granville` method for parsing command-line arguments: walk `argv`,
 * and call a `safe_arg_*` function to consume the value after a flag.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * for(int i = 1; i < argc; ++i) {
 *    const std::string_view arg = argv[i];
 *    if(arg == "--retries")
 *       options.max_retry_attempts = cli::safe_arg_int(argc, argv, i, 0, 100);
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace granville::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i, int min_value, int max_value);

/// @brief True iff `arg` is one of `-h`, `--help`
bool is_help_flag(std::string_view arg);

} // namespace granville::cli
