
#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string>

namespace granville::logging
{
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static constexpr const char* k_env_variable = "LOG_LEVEL_OVERRIDE";

/// @private
static bool parse_level(std::string_view name, spdlog::level::level_enum& level)
{
   level = spdlog::level::from_str(std::string{name});
   return !(level == spdlog::level::off && name != std::string_view{"off"});
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger()
{
   std::call_once(flag, []() {
      instance = spdlog::get("granville");
      if(!instance) instance = spdlog::stdout_color_mt("granville");
      instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
      instance->set_level(spdlog::level::trace);
#else
      instance->set_level(spdlog::level::warn);
#endif

      const char* log_level = std::getenv(k_env_variable);
      if(log_level) {
         auto level = spdlog::level::off;
         if(parse_level(log_level, level))
            instance->set_level(level);
         else
            instance->error("failed to set log level from environment variable {}={}",
                            k_env_variable, log_level);
      }
   });

   assert(instance);
   return *instance;
}

bool set_log_level(std::string_view name)
{
   auto level = spdlog::level::off;
   if(!parse_level(name, level)) return false;
   debug_logger().set_level(level);
   return true;
}

} // namespace granville::logging
