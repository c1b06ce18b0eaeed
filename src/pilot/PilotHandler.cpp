#include "swarmlink/pilot/PilotHandler.h"

#include <FrameKit/Debug/Log.h>

namespace swarmlink::pilot {

bool PilotHandler::Handle(const PilotState& state,
    const device::ActuatorHandle& actuator,
    const Detections& detections,
    const VisionSender& vision_tx,
    const config::SwarmConfig& cfg)
{
    if (!actuator) {
        FK_ERROR("[Pilot] {}: no actuator handle", Name());
        return false;
    }

    if (!SafetyGate::Enforce(state, *actuator, cfg)) return false;

    OnHandle(state, *actuator, detections, vision_tx, cfg);
    return true;
}

} // namespace swarmlink::pilot
