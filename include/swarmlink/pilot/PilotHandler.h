#pragma once
#include <swarmlink/pilot/PilotContext.h>
#include <swarmlink/pilot/SafetyGate.h>

/*
    PilotHandler

    Base of every behavior. One instance per behavior, built once and
    reused every control tick, so private state survives between ticks.

    Handle() is the only entry point. It runs the SafetyGate and calls
    OnHandle() only when the gate passes; a behavior cannot skip the gate.

    Rules for OnHandle():
      - return within the tick (no unbounded waits)
      - never let a notification failure escape
      - calls are serialized by the caller; no re-entrancy
*/

namespace swarmlink::pilot {

    class PilotHandler {
    public:
        virtual ~PilotHandler() = default;

        // Returns false when the SafetyGate stopped the robot this tick.
        bool Handle(const PilotState& state,
            const device::ActuatorHandle& actuator,
            const Detections& detections,
            const VisionSender& vision_tx,
            const config::SwarmConfig& cfg);

        virtual const char* Name() const = 0;

    protected:
        virtual void OnHandle(const PilotState& state,
            device::Actuator& actuator,
            const Detections& detections,
            const VisionSender& vision_tx,
            const config::SwarmConfig& cfg) = 0;
    };

} // namespace swarmlink::pilot
