#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace skyalign::core
{
    /// @brief Centralized logging facility for skyalign.
    ///
    /// Provides two separate loggers:
    /// - **SKYALIGN** (core): matching, scheduling, catalogue loading
    /// - **APP**: command-line tool, user-facing summaries
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. Until then the
    /// accessors hand out a logger with a null sink, so library code can
    /// run inside tests without any setup.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// @param console_level Minimum level echoed to the console. The file
        ///        sink always records everything from debug upwards.
        static void init(spdlog::level::level_enum console_level = spdlog::level::info);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library logger ("SKYALIGN").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> make_silent(const char* name);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skyalign::core

// -----------------------------------------------------------------
// Library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKY_CORE_TRACE(...)    ::skyalign::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKY_CORE_DEBUG(...)    ::skyalign::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SKY_CORE_INFO(...)     ::skyalign::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKY_CORE_WARN(...)     ::skyalign::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKY_CORE_ERROR(...)    ::skyalign::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SKY_CORE_CRITICAL(...) ::skyalign::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKY_TRACE(...)         ::skyalign::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKY_DEBUG(...)         ::skyalign::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SKY_INFO(...)          ::skyalign::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKY_WARN(...)          ::skyalign::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKY_ERROR(...)         ::skyalign::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SKY_CRITICAL(...)      ::skyalign::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
