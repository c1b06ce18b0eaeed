#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include <swarmlink/pilot/PilotHandler.h>

namespace swarmlink::pilot {

    /*
        PilotDispatcher

        Selects the pilot registered for state.mode and runs it, one call
        at a time. When no pilot is registered for the mode the SafetyGate
        still runs, so an unknown mode never leaves the robot unguarded.
    */
    class PilotDispatcher {
    public:
        enum class Outcome : uint8_t {
            Handled,
            Gated,       // SafetyGate stopped the robot
            NoPilot,     // mode has no registered pilot
        };

        bool Register(protocol::Mode mode, std::unique_ptr<PilotHandler> pilot);
        PilotHandler* Find(protocol::Mode mode) const;

        Outcome Dispatch(const PilotState& state,
            const device::ActuatorHandle& actuator,
            const Detections& detections,
            const VisionSender& vision_tx,
            const config::SwarmConfig& cfg);

    private:
        mutable std::mutex m_Mutex;
        std::map<protocol::Mode, std::unique_ptr<PilotHandler>> m_Pilots;
        protocol::Mode m_LastMode = protocol::Mode::Fill;
        bool m_HasLastMode = false;
    };

} // namespace swarmlink::pilot
