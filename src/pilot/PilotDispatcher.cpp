#include "swarmlink/pilot/PilotDispatcher.h"

#include <FrameKit/Debug/Log.h>

namespace swarmlink::pilot {

bool PilotDispatcher::Register(protocol::Mode mode, std::unique_ptr<PilotHandler> pilot)
{
    if (!pilot) return false;

    std::lock_guard<std::mutex> lk(m_Mutex);
    if (m_Pilots.count(mode) != 0) {
        FK_ERROR("[Pilot] Register failed: mode {} already has pilot {}",
            protocol::ToString(mode), m_Pilots[mode]->Name());
        return false;
    }

    FK_INFO("[Pilot] Registered {} for mode {}", pilot->Name(), protocol::ToString(mode));
    m_Pilots.emplace(mode, std::move(pilot));
    return true;
}

PilotHandler* PilotDispatcher::Find(protocol::Mode mode) const
{
    std::lock_guard<std::mutex> lk(m_Mutex);
    const auto it = m_Pilots.find(mode);
    return it == m_Pilots.end() ? nullptr : it->second.get();
}

PilotDispatcher::Outcome PilotDispatcher::Dispatch(const PilotState& state,
    const device::ActuatorHandle& actuator,
    const Detections& detections,
    const VisionSender& vision_tx,
    const config::SwarmConfig& cfg)
{
    std::lock_guard<std::mutex> lk(m_Mutex);

    const bool mode_changed = !m_HasLastMode || m_LastMode != state.mode;
    if (mode_changed) {
        FK_INFO("[Pilot] Mode -> {} ({})", protocol::ToString(state.mode), (unsigned)state.mode);
        m_LastMode = state.mode;
        m_HasLastMode = true;
    }

    const auto it = m_Pilots.find(state.mode);
    if (it == m_Pilots.end()) {
        if (mode_changed) FK_WARN("[Pilot] No pilot for mode {}; safety gate only", (unsigned)state.mode);
        if (actuator && !SafetyGate::Enforce(state, *actuator, cfg)) return Outcome::Gated;
        return Outcome::NoPilot;
    }

    return it->second->Handle(state, actuator, detections, vision_tx, cfg)
        ? Outcome::Handled
        : Outcome::Gated;
}

} // namespace swarmlink::pilot
