#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace tsepush {

    // Function: ReconnectBackoff
    // Description: Exponential delay between upstream connection attempts.
    //              Doubles after every failure up to max_ms, back to min_ms after a success.
    class ReconnectBackoff {
    public:
        explicit ReconnectBackoff(int min_ms = 500, int max_ms = 30000)
            : min_ms_(std::max(1, min_ms)),
              max_ms_(std::max(std::max(1, min_ms), max_ms)),
              current_ms_(min_ms_) {}

        // Returns the delay to wait before the next attempt and grows the following one.
        std::chrono::milliseconds next() {
            int delay = current_ms_;
            current_ms_ = static_cast<int>(std::min<int64_t>(max_ms_, static_cast<int64_t>(current_ms_) * 2));
            return std::chrono::milliseconds(delay);
        }

        void reset() { current_ms_ = min_ms_; }

        int current_ms() const { return current_ms_; }

    private:
        int min_ms_;
        int max_ms_;
        int current_ms_;
    };

}
