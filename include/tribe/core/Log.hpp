#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tribe::logging {

struct LogOptions
{
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path     file;          // empty = stderr only
    bool                      async = false;
    bool                      console = true;
};

// Installs the "tribe" logger as spdlog's default. Safe to call again; the
// previous logger is replaced. A log file that cannot be created is reported
// as a warning and the logger falls back to stderr; Init does not throw for it.
std::shared_ptr<spdlog::logger> Init(const LogOptions& options);

// The logger installed by Init(), or spdlog's default when Init() was not called.
std::shared_ptr<spdlog::logger> Get();

} // namespace tribe::logging
