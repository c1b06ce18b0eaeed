#pragma once
#include <cstdint>

namespace swarmlink::protocol {

    /*
        Swarm message vocabularies (frame body byte 4).

        FromU8 is total: any code without a name decodes to Unknown, so a
        garbled message never stops the discovery stream.
        ToU8 maps Unknown, and any value without a name, to MSG_UNKNOWN.
    */
    static constexpr uint8_t MSG_UNKNOWN = 255;

    // Child -> Parent
    enum class ChildMsg : uint8_t {
        Halt             = 0,
        Bumped           = 1,
        PersonFoundPause = 2,
        ReachTarget      = 3,
        TargetLost       = 4,
        NewTargetFound   = 5,
        FromCwToCcw      = 6,
        PiTempHighHalt   = 7,
        MissionComplete  = 8,
        TargetNotFound   = 9,
        LeaderWaiting    = 10,
        TrailerPrepared  = 11,
        ClimbUp          = 12,
        ClimbDown        = 13,
        Ack              = 14,
        PersonFoundWarn  = 15,
        AnimalFound      = 16,
        Unknown          = MSG_UNKNOWN,
    };

    // Parent -> Child. Ids 8 and 9 are unassigned.
    enum class ParentMsg : uint8_t {
        Off           = 0,
        On            = 1,
        Reset         = 2,
        Stop          = 3,
        Forward       = 4,
        Backward      = 5,
        Left          = 6,
        Right         = 7,
        Fill          = 10,
        Oneway        = 11,
        Climb         = 12,
        Around        = 13,
        MonitorPerson = 14,
        MonitorAnimal = 15,
        RoundTrip     = 16,
        FollowPerson  = 17,
        Unknown       = MSG_UNKNOWN,
    };

    ChildMsg ChildMsgFromU8(uint8_t code);
    ParentMsg ParentMsgFromU8(uint8_t code);

    uint8_t ToU8(ChildMsg msg);
    uint8_t ToU8(ParentMsg msg);

    const char* ToString(ChildMsg msg);
    const char* ToString(ParentMsg msg);

} // namespace swarmlink::protocol
