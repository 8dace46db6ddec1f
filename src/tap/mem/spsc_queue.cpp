/**
 * @file spsc_queue.cpp
 * @brief Explicit template instantiations for SpscQueue to reduce code bloat.
*/

#include "tap/mem/spsc_queue.hpp"
#include "tap/events/packet_event.hpp"

namespace tap::mem {

    template class SpscQueue<int>;                 // unit tests and benchmarks
    template class SpscQueue<events::PacketEvent>; // deferred handoff ring

} // namespace tap::mem
