#pragma once

#include <cstdint>

namespace tsepush {

    // Function: WriteGuard
    // Description: Tracks the write a send deadline was armed for. A timer completion
    //              that was already queued when its write finished must not close the
    //              session, so the deadline handler only acts on the write still in flight.
    //              Not thread safe, used on the session strand.
    class WriteGuard {
    public:
        // Marks a new write in flight and returns its generation.
        uint64_t begin() {
            in_flight_ = true;
            return ++generation_;
        }

        void finish() { in_flight_ = false; }

        // Function: expired
        // Description: True if the deadline armed for `generation` belongs to the write
        //              that is still outstanding.
        bool expired(uint64_t generation) const {
            return in_flight_ && generation == generation_;
        }

        bool in_flight() const { return in_flight_; }

    private:
        uint64_t generation_ = 0;
        bool in_flight_ = false;
    };

}
