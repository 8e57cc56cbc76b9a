#include "quorumsig/error_aggregator.hpp"
#include <map>

namespace quorumsig
{
    std::optional<unsigned> ErrorAggregator::majority_error_code(const std::vector<ResponseRecord> &records)
    {
        // Ordered by code, so the first maximum found is also the lowest code
        std::map<unsigned, std::size_t> counts;
        for (const auto &record : records)
        {
            if (!is_success_status(record.status))
                ++counts[record.status];
        }

        std::optional<unsigned> majority;
        std::size_t best = 0;
        for (const auto &[code, count] : counts)
        {
            if (count > best)
            {
                best = count;
                majority = code;
            }
        }
        return majority;
    }

    ClientError ErrorAggregator::missing_signatures_error(std::optional<unsigned> majority_code)
    {
        if (majority_code && *majority_code == 403)
            return ClientError{403, std::string(client_error::EXCEEDED_QUOTA)};

        return ClientError{majority_code.value_or(DEFAULT_ERROR_STATUS),
                           std::string(client_error::NOT_ENOUGH_PARTIAL_SIGNATURES)};
    }

} // namespace quorumsig
