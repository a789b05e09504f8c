// include/Neo4jCtl/Utils/Logger.hpp
#ifndef NEO4JCTL_LOGGER_UTIL_HPP
#define NEO4JCTL_LOGGER_UTIL_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace Neo4jCtl::Utils {

    class Logger {
    public:
        // Call once at startup. An empty logDir disables the file sink.
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "neo4jctl.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Creates the logger on first use, attached to the sinks from Init()
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace Neo4jCtl::Utils

#define CORE_LOG_TRACE(...)    if(auto& logger = ::Neo4jCtl::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define CORE_LOG_INFO(...)     if(auto& logger = ::Neo4jCtl::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define CORE_LOG_WARN(...)     if(auto& logger = ::Neo4jCtl::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define CORE_LOG_ERROR(...)    if(auto& logger = ::Neo4jCtl::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define CORE_LOG_CRITICAL(...) if(auto& logger = ::Neo4jCtl::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // NEO4JCTL_LOGGER_UTIL_HPP
