#include "tribe/core/Log.hpp"

#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace tribe::logging {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum level)
{
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace

std::shared_ptr<spdlog::logger> Init(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!options.file.empty())
    {
        std::error_code ec;
        if (options.file.has_parent_path())
            fs::create_directories(options.file.parent_path(), ec);
        if (ec)
        {
            fileError = ec.message();
        }
        else
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file.string(), true));
            }
            catch (const spdlog::spdlog_ex& e)
            {
                fileError = e.what();
            }
        }
    }

    // Without a file sink the logger still needs somewhere to write.
    if (!fileError.empty() && !options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    spdlog::drop("tribe");

    std::shared_ptr<spdlog::logger> logger;
    if (options.async)
    {
        static std::once_flag s_thread_pool_once;
        std::call_once(s_thread_pool_once, [] {
            spdlog::init_thread_pool(8192, 1);
        });

        logger = std::make_shared<spdlog::async_logger>(
            "tribe",
            sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    }
    else
    {
        logger = std::make_shared<spdlog::logger>("tribe", sinks.begin(), sinks.end());
    }

    configure_default_logger(logger, options.level);
    g_logger = logger;

    if (!fileError.empty())
        logger->warn("log file {} unavailable ({}); logging to the console only", options.file.string(), fileError);
    return logger;
}

std::shared_ptr<spdlog::logger> Get()
{
    return g_logger ? g_logger : spdlog::default_logger();
}

} // namespace tribe::logging
