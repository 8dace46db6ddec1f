#include "tap/events/continuation_marker.hpp"

namespace tap::events {

int ContinuationMarker::decrement_processing_delay() noexcept {
    int cur = processing_delay_.load(std::memory_order_acquire);
    while (cur > 0) {
        if (processing_delay_.compare_exchange_weak(cur, cur - 1,
                                                    std::memory_order_acq_rel,
                                                    std::memory_order_acquire)) {
            return cur - 1;
        }
    }
    return 0;
}

} // namespace tap::events
