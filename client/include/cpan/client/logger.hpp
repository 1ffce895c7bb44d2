#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace cpan::client
{

    class Logger
    {
    public:
        Logger();
        Logger(const std::optional<std::filesystem::path> &path, bool verbose);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args) const
        {
            if (!logger_)
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            const auto level = tag == "error" ? spdlog::level::err
                                              : (tag == "warn" ? spdlog::level::warn : spdlog::level::info);
            logger_->log(level, "[{}] {}", tag, std::string(buf.data(), buf.size()));
        }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace cpan::client
