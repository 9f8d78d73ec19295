
#include "cli-utils.hpp"

#include "base-include.hpp"

#include <cstdlib>
#include <stdexcept>

namespace granville::cli
{
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`. If `i+1 == argc`
 *        then an exception is thrown.
 *
 * Preconditions:
 * + `argc` and `argv` describe an array of `char *` "c" strings.
 * + `i >= 0` and `i < argc`
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 * + `std::bad_alloc` if allocation fails.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   const std::string_view arg = argv[i];
   ++i;
   if(i >= argc) throw std::runtime_error(fmt::format("expected string after argument '{}'", arg));
   return std::string{argv[i]};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i)
{
   return safe_arg_int(argc, argv, i, std::numeric_limits<int>::lowest(),
                       std::numeric_limits<int>::max());
}

/**
 * @ingroup cli
 * @brief As `safe_arg_int`, but the value must also lie in `[min_value..max_value]`.
 */
int safe_arg_int(int argc, char** argv, int& i, int min_value, int max_value)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   const std::string_view arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0;

   if(!badness) {
      char* end           = nullptr;
      const auto long_ret = std::strtol(argv[i], &end, 10);
      if(end == argv[i] or *end != '\0' or long_ret > max_value or long_ret < min_value)
         badness = true;
      else
         ret = static_cast<int>(long_ret);
   }

   if(badness)
      throw std::runtime_error(fmt::format(
          "expected integer in [{}..{}] after argument '{}'", min_value, max_value, arg));

   return ret;
}

bool is_help_flag(std::string_view arg) { return arg == "-h" or arg == "--help"; }

} // namespace granville::cli
