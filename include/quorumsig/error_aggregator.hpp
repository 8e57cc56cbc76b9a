#pragma once

#include "response_validator.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quorumsig
{
    /** Client-facing error identifiers and their messages */
    namespace client_error
    {
        inline constexpr std::string_view INVALID_KEY_HEADER = "Invalid key version header";
        inline constexpr std::string_view INVALID_INPUT = "Invalid input parameters";
        inline constexpr std::string_view EXCEEDED_QUOTA = "Requester exceeded service query quota";
        inline constexpr std::string_view NOT_ENOUGH_PARTIAL_SIGNATURES = "Not enough partial signatures";
    }

    inline constexpr unsigned DEFAULT_ERROR_STATUS = 500;

    /** Status and message shown to the client when a request cannot be served */
    struct ClientError
    {
        unsigned status{DEFAULT_ERROR_STATUS};
        std::string message;
    };

    /**
     * Majority verdict over signer failures.
     */
    class ErrorAggregator
    {
    public:
        /**
         * Most frequent non-2xx status among the records. Equal counts resolve to
         * the lowest status code so the verdict does not depend on arrival order.
         */
        static std::optional<unsigned> majority_error_code(const std::vector<ResponseRecord> &records);

        /** 403 majority means quota exhaustion; anything else is a generic shortfall */
        static ClientError missing_signatures_error(std::optional<unsigned> majority_code);
    };
}
