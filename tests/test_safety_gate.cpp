#include <gtest/gtest.h>

#include <swarmlink/pilot/PilotHandler.h>
#include <swarmlink/pilot/SafetyGate.h>

#include "fakes.hpp"

using namespace swarmlink;
using namespace swarmlink::pilot;
using namespace swarmlink::testing;

namespace {

    class CountingPilot : public PilotHandler {
    public:
        const char* Name() const override { return "Counting"; }
        int runs = 0;

    protected:
        void OnHandle(const PilotState&, device::Actuator& actuator, const Detections&,
            const VisionSender&, const config::SwarmConfig&) override
        {
            ++runs;
            actuator.Speak("counting");
        }
    };

    PilotState State(bool enabled, double temp)
    {
        PilotState s{};
        s.enabled = enabled;
        s.pi_temp = temp;
        return s;
    }

} // namespace

TEST(SafetyGate, DisabledSystemIsStateOff)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);

    EXPECT_EQ(SafetyGate::Assess(State(false, 20.0), *act, 70.0), SystemRisk::StateOff);
    EXPECT_TRUE(log->empty());

    // Disabled wins over temperature; no high_temp announcement.
    EXPECT_EQ(SafetyGate::Assess(State(false, 90.0), *act, 70.0), SystemRisk::StateOff);
    EXPECT_TRUE(log->empty());
}

TEST(SafetyGate, HighTemperatureSpeaks)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);

    EXPECT_EQ(SafetyGate::Assess(State(true, 71.0), *act, 70.0), SystemRisk::HighTemp);
    EXPECT_EQ(*log, (CommandLog{ "speak:high_temp" }));
}

TEST(SafetyGate, ThresholdIsStrictlyGreater)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);

    EXPECT_EQ(SafetyGate::Assess(State(true, 70.0), *act, 70.0), SystemRisk::None);
    EXPECT_EQ(SafetyGate::Assess(State(true, 69.9), *act, 70.0), SystemRisk::None);
    EXPECT_TRUE(log->empty());
}

TEST(SafetyGate, HandleStopsAndSkipsPilotWhenDisabled)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);
    auto ch = core::MakeChannel<vision::VisionCommand>();
    CountingPilot pilot;

    EXPECT_FALSE(pilot.Handle(State(false, 40.0), act, {}, ch.first, config::SwarmConfig{}));
    EXPECT_EQ(pilot.runs, 0);
    EXPECT_EQ(*log, (CommandLog{ "stop" }));
}

TEST(SafetyGate, HandleStopsAndSkipsPilotWhenHot)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);
    auto ch = core::MakeChannel<vision::VisionCommand>();
    CountingPilot pilot;

    EXPECT_FALSE(pilot.Handle(State(true, 71.0), act, {}, ch.first, config::SwarmConfig{}));
    EXPECT_EQ(pilot.runs, 0);
    EXPECT_EQ(*log, (CommandLog{ "speak:high_temp", "stop" }));
}

TEST(SafetyGate, HandleRunsPilotWhenSafe)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);
    auto ch = core::MakeChannel<vision::VisionCommand>();
    CountingPilot pilot;

    EXPECT_TRUE(pilot.Handle(State(true, 69.9), act, {}, ch.first, config::SwarmConfig{}));
    EXPECT_EQ(pilot.runs, 1);
    EXPECT_EQ(*log, (CommandLog{ "speak:counting" }));
}

TEST(SafetyGate, ConfiguredThresholdApplies)
{
    std::shared_ptr<CommandLog> log;
    auto act = MakeActuator(log);
    auto ch = core::MakeChannel<vision::VisionCommand>();
    CountingPilot pilot;

    config::SwarmConfig cfg{};
    cfg.safety.max_pi_temp = 60.0;

    EXPECT_FALSE(pilot.Handle(State(true, 65.0), act, {}, ch.first, cfg));
    EXPECT_EQ(pilot.runs, 0);
}

TEST(SafetyGate, MissingActuatorIsRejected)
{
    auto ch = core::MakeChannel<vision::VisionCommand>();
    CountingPilot pilot;

    EXPECT_FALSE(pilot.Handle(State(true, 20.0), nullptr, {}, ch.first, config::SwarmConfig{}));
    EXPECT_EQ(pilot.runs, 0);
}
