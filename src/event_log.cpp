#include "quorumsig/event_log.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <format>

namespace quorumsig
{

    namespace
    {
        std::string now_ts()
        {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            std::tm tm_buf;
            gmtime_r(&t, &tm_buf);
            return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                               tm_buf.tm_year + 1900,
                               tm_buf.tm_mon + 1,
                               tm_buf.tm_mday,
                               tm_buf.tm_hour,
                               tm_buf.tm_min,
                               tm_buf.tm_sec,
                               static_cast<int>(ms.count()));
        }
    }

    nlohmann::json RequestEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"protocol", protocol},
                              {"session_id", session_id},
                              {"event", event},
                              {"details", details}};
    }

    EventLogger::EventLogger(std::string protocol, std::string session_id)
        : protocol_(std::move(protocol)), session_id_(std::move(session_id))
    {
    }

    void EventLogger::info(std::string_view event, nlohmann::json details) const
    {
        log(spdlog::level::info, event, std::move(details));
    }

    void EventLogger::warn(std::string_view event, nlohmann::json details) const
    {
        log(spdlog::level::warn, event, std::move(details));
    }

    void EventLogger::error(std::string_view event, nlohmann::json details) const
    {
        log(spdlog::level::err, event, std::move(details));
    }

    void EventLogger::log(spdlog::level::level_enum level, std::string_view event, nlohmann::json details) const
    {
        if (!spdlog::should_log(level))
            return;
        RequestEvent ev{now_ts(), protocol_, session_id_, std::string(event), std::move(details)};
        spdlog::log(level, "{}", ev.to_json().dump());
    }

    namespace logging
    {
        Result<spdlog::level::level_enum> parse_level(std::string_view name)
        {
            auto level = spdlog::level::from_str(std::string(name));
            // from_str maps unknown names to off, so only accept off when asked for
            if (level == spdlog::level::off && name != "off")
                return std::unexpected(QuorumSigError::config(std::format("Unknown log level: {}", name)));
            return level;
        }

        Result<void> configure(std::string_view level)
        {
            auto parsed = parse_level(level);
            if (!parsed)
                return std::unexpected(parsed.error());
            spdlog::set_level(*parsed);
            spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%t] %v");
            return {};
        }
    }

} // namespace quorumsig
