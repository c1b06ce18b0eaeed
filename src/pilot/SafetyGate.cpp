#include "swarmlink/pilot/SafetyGate.h"

#include <FrameKit/Debug/Log.h>

namespace swarmlink::pilot {

const char* ToString(SystemRisk r)
{
    switch (r) {
    case SystemRisk::None:     return "None";
    case SystemRisk::StateOff: return "StateOff";
    case SystemRisk::HighTemp: return "HighTemp";
    }
    return "Unknown";
}

SystemRisk SafetyGate::Assess(const PilotState& state, device::Actuator& actuator, double max_pi_temp)
{
    if (!state.enabled) return SystemRisk::StateOff;

    if (state.pi_temp > max_pi_temp) {
        actuator.Speak(HIGH_TEMP_TAG);
        return SystemRisk::HighTemp;
    }
    return SystemRisk::None;
}

bool SafetyGate::Enforce(const PilotState& state, device::Actuator& actuator, const config::SwarmConfig& cfg)
{
    const SystemRisk risk = Assess(state, actuator, cfg.safety.max_pi_temp);
    if (risk == SystemRisk::None) return true;

    actuator.Stop();

    static thread_local uint32_t s_Count = 0;
    if ((s_Count++ % 16) == 0) {
        FK_WARN("[Safety] risk={} enabled={} pi_temp={} -> stop", ToString(risk), (int)state.enabled, state.pi_temp);
    }
    return false;
}

} // namespace swarmlink::pilot
