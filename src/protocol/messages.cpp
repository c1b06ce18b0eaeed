#include "swarmlink/protocol/messages.hpp"
#include "swarmlink/protocol/mode.hpp"

namespace swarmlink::protocol {

ChildMsg ChildMsgFromU8(uint8_t code)
{
    if (code <= static_cast<uint8_t>(ChildMsg::AnimalFound)) {
        return static_cast<ChildMsg>(code);
    }
    return ChildMsg::Unknown;
}

ParentMsg ParentMsgFromU8(uint8_t code)
{
    switch (code) {
    case 0:  return ParentMsg::Off;
    case 1:  return ParentMsg::On;
    case 2:  return ParentMsg::Reset;
    case 3:  return ParentMsg::Stop;
    case 4:  return ParentMsg::Forward;
    case 5:  return ParentMsg::Backward;
    case 6:  return ParentMsg::Left;
    case 7:  return ParentMsg::Right;
    case 10: return ParentMsg::Fill;
    case 11: return ParentMsg::Oneway;
    case 12: return ParentMsg::Climb;
    case 13: return ParentMsg::Around;
    case 14: return ParentMsg::MonitorPerson;
    case 15: return ParentMsg::MonitorAnimal;
    case 16: return ParentMsg::RoundTrip;
    case 17: return ParentMsg::FollowPerson;
    default: return ParentMsg::Unknown;
    }
}

uint8_t ToU8(ChildMsg msg)
{
    switch (msg) {
    case ChildMsg::Halt:
    case ChildMsg::Bumped:
    case ChildMsg::PersonFoundPause:
    case ChildMsg::ReachTarget:
    case ChildMsg::TargetLost:
    case ChildMsg::NewTargetFound:
    case ChildMsg::FromCwToCcw:
    case ChildMsg::PiTempHighHalt:
    case ChildMsg::MissionComplete:
    case ChildMsg::TargetNotFound:
    case ChildMsg::LeaderWaiting:
    case ChildMsg::TrailerPrepared:
    case ChildMsg::ClimbUp:
    case ChildMsg::ClimbDown:
    case ChildMsg::Ack:
    case ChildMsg::PersonFoundWarn:
    case ChildMsg::AnimalFound:
        return static_cast<uint8_t>(msg);
    default:
        return MSG_UNKNOWN;
    }
}

uint8_t ToU8(ParentMsg msg)
{
    switch (msg) {
    case ParentMsg::Off:
    case ParentMsg::On:
    case ParentMsg::Reset:
    case ParentMsg::Stop:
    case ParentMsg::Forward:
    case ParentMsg::Backward:
    case ParentMsg::Left:
    case ParentMsg::Right:
    case ParentMsg::Fill:
    case ParentMsg::Oneway:
    case ParentMsg::Climb:
    case ParentMsg::Around:
    case ParentMsg::MonitorPerson:
    case ParentMsg::MonitorAnimal:
    case ParentMsg::RoundTrip:
    case ParentMsg::FollowPerson:
        return static_cast<uint8_t>(msg);
    default:
        return MSG_UNKNOWN;
    }
}

const char* ToString(ChildMsg msg)
{
    switch (msg) {
    case ChildMsg::Halt:             return "Halt";
    case ChildMsg::Bumped:           return "Bumped";
    case ChildMsg::PersonFoundPause: return "PersonFoundPause";
    case ChildMsg::ReachTarget:      return "ReachTarget";
    case ChildMsg::TargetLost:       return "TargetLost";
    case ChildMsg::NewTargetFound:   return "NewTargetFound";
    case ChildMsg::FromCwToCcw:      return "FromCwToCcw";
    case ChildMsg::PiTempHighHalt:   return "PiTempHighHalt";
    case ChildMsg::MissionComplete:  return "MissionComplete";
    case ChildMsg::TargetNotFound:   return "TargetNotFound";
    case ChildMsg::LeaderWaiting:    return "LeaderWaiting";
    case ChildMsg::TrailerPrepared:  return "TrailerPrepared";
    case ChildMsg::ClimbUp:          return "ClimbUp";
    case ChildMsg::ClimbDown:        return "ClimbDown";
    case ChildMsg::Ack:              return "Ack";
    case ChildMsg::PersonFoundWarn:  return "PersonFoundWarn";
    case ChildMsg::AnimalFound:      return "AnimalFound";
    default:                         return "Unknown";
    }
}

const char* ToString(ParentMsg msg)
{
    switch (msg) {
    case ParentMsg::Off:           return "Off";
    case ParentMsg::On:            return "On";
    case ParentMsg::Reset:         return "Reset";
    case ParentMsg::Stop:          return "Stop";
    case ParentMsg::Forward:       return "Forward";
    case ParentMsg::Backward:      return "Backward";
    case ParentMsg::Left:          return "Left";
    case ParentMsg::Right:         return "Right";
    case ParentMsg::Fill:          return "Fill";
    case ParentMsg::Oneway:        return "Oneway";
    case ParentMsg::Climb:         return "Climb";
    case ParentMsg::Around:        return "Around";
    case ParentMsg::MonitorPerson: return "MonitorPerson";
    case ParentMsg::MonitorAnimal: return "MonitorAnimal";
    case ParentMsg::RoundTrip:     return "RoundTrip";
    case ParentMsg::FollowPerson:  return "FollowPerson";
    default:                       return "Unknown";
    }
}

const char* ToString(Mode mode)
{
    switch (mode) {
    case Mode::Fill:          return "Fill";
    case Mode::Oneway:        return "Oneway";
    case Mode::Climb:         return "Climb";
    case Mode::Around:        return "Around";
    case Mode::MonitorPerson: return "MonitorPerson";
    case Mode::MonitorAnimal: return "MonitorAnimal";
    case Mode::RoundTrip:     return "RoundTrip";
    case Mode::FollowPerson:  return "FollowPerson";
    default:                  return "Unnamed";
    }
}

} // namespace swarmlink::protocol
