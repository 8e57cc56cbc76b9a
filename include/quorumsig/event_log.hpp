#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <string>
#include <string_view>

namespace quorumsig
{
    struct RequestEvent
    {
        std::string ts;
        std::string protocol;
        std::string session_id;
        std::string event;
        nlohmann::json details;

        nlohmann::json to_json() const;
    };

    /**
     * Structured per-request logger. Each event becomes one JSON line on the
     * default spdlog logger, tagged with the protocol and the client's session id.
     */
    class EventLogger
    {
    public:
        EventLogger(std::string protocol, std::string session_id);

        void info(std::string_view event, nlohmann::json details = nlohmann::json::object()) const;
        void warn(std::string_view event, nlohmann::json details = nlohmann::json::object()) const;
        void error(std::string_view event, nlohmann::json details = nlohmann::json::object()) const;

        const std::string &session_id() const { return session_id_; }

    private:
        void log(spdlog::level::level_enum level, std::string_view event, nlohmann::json details) const;

        std::string protocol_;
        std::string session_id_;
    };

    namespace logging
    {
        Result<spdlog::level::level_enum> parse_level(std::string_view name);

        /** Set the global level and pattern of the default logger */
        Result<void> configure(std::string_view level);
    }

} // namespace quorumsig
