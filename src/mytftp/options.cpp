#include <algorithm>
#include <string>
#include <vector>
#include "meta/helpers.hpp"
#include "mytftp/options.hpp"

namespace RollTftp::MyTftp {
    static std::optional<std::size_t> resolveBlockSize(std::string_view value, const NegotiationLimits& limits) noexcept {
        const auto ceiling = std::clamp(limits.max_blksize, min_block_size, max_block_size);
        const auto floor = std::clamp(limits.min_blksize, min_block_size, ceiling);
        const auto [requested, status] = Meta::parseDecimal<std::uint64_t>(value);

        if (status == Meta::NumberStatus::not_numeric) {
            return {};
        }

        if (status == Meta::NumberStatus::overflow) {
            return ceiling;
        }

        return static_cast<std::size_t>(std::clamp<std::uint64_t>(requested, floor, ceiling));
    }

    static std::optional<unsigned int> resolveTimeout(std::string_view value, const NegotiationLimits& limits) noexcept {
        const auto [requested, status] = Meta::parseDecimal<unsigned int>(value);

        if (status != Meta::NumberStatus::ok) {
            return {};
        }

        if (requested < std::max(limits.min_timeout, min_timeout_secs) or requested > std::min(limits.max_timeout, max_timeout_secs)) {
            return {};
        }

        return requested;
    }

    AcceptedOptions negotiate(const OptionList& requested, std::optional<std::uint64_t> source_length, const NegotiationLimits& limits) {
        AcceptedOptions temp;
        std::vector<std::string> seen_names;

        for (const auto& [raw_name, raw_value] : requested) {
            auto name = Meta::toLowerAscii(raw_name);

            /// NOTE: RFC-2347 forbids repeats, so only the first spelling of a name counts.
            if (std::find(seen_names.begin(), seen_names.end(), name) != seen_names.end()) {
                continue;
            }

            seen_names.push_back(name);

            if (name == option_name_blksize) {
                temp.blksize = resolveBlockSize(raw_value, limits);

                if (temp.blksize) {
                    temp.entries.emplace_back(name, std::to_string(*temp.blksize));
                }
            } else if (name == option_name_timeout) {
                temp.timeout = resolveTimeout(raw_value, limits);

                if (temp.timeout) {
                    temp.entries.emplace_back(name, std::to_string(*temp.timeout));
                }
            } else if (name == option_name_tsize) {
                temp.tsize = source_length.value_or(0ULL);
                temp.entries.emplace_back(name, std::to_string(*temp.tsize));
            }
            // Anything else, windowsize included, is ignored per RFC-2347.
        }

        return temp;
    }
}
