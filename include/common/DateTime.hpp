#pragma once

#include "common/Types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tsepush {

    // Function: parse_trade_time
    // Description: Parses an ISO-8601 like timestamp.
    //              Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff]" with '-' or '/' as the
    //              date separator and 'T' or ' ' between date and time.
    //              A trailing "Z" or "+HH:MM" offset is accepted and ignored.
    // Outputs: The parsed time, or std::nullopt when the text is malformed.
    std::optional<TradeTime> parse_trade_time(std::string_view text);

    // Function: format_trade_time
    // Description: Writes "YYYY-MM-DDTHH:MM:SS", plus ".ffffff" when microseconds are set.
    std::string format_trade_time(const TradeTime& time);

}
