#pragma once
#include <cstdint>

#include <swarmlink/pilot/PilotContext.h>

namespace swarmlink::pilot {

    enum class SystemRisk : uint8_t {
        None = 0,
        StateOff,
        HighTemp,
    };

    const char* ToString(SystemRisk r);

    /*
        SafetyGate

        Runs before any pilot logic, identical for every pilot:

          !enabled                 -> StateOff
          pi_temp > max_pi_temp    -> HighTemp (speaks "high_temp")
          otherwise                -> None

        Enforce() stops the actuator on any risk and returns false, in which
        case the pilot must not run this tick.
    */
    class SafetyGate {
    public:
        static constexpr const char* HIGH_TEMP_TAG = "high_temp";

        static SystemRisk Assess(const PilotState& state, device::Actuator& actuator, double max_pi_temp);
        static bool Enforce(const PilotState& state, device::Actuator& actuator, const config::SwarmConfig& cfg);
    };

} // namespace swarmlink::pilot
