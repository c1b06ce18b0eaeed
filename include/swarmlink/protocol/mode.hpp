#pragma once
#include <cstdint>

namespace swarmlink::protocol {

    /*
        Mode

        Active behavior of a robot, as carried in byte 3 of the frame body.
        Every byte value is representable; values without a name below are
        modes this build does not know about and are passed through as-is.
    */
    enum class Mode : uint8_t {
        Fill          = 0,
        Oneway        = 1,
        Climb         = 2,
        Around        = 3,
        MonitorPerson = 4,
        MonitorAnimal = 5,
        RoundTrip     = 6,
        FollowPerson  = 7,
    };

    const char* ToString(Mode mode);

} // namespace swarmlink::protocol
