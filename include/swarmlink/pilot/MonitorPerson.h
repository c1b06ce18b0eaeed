#pragma once
#include <cstdint>
#include <functional>
#include <memory>

#include <swarmlink/pilot/PilotHandler.h>

namespace swarmlink::pilot {

    /*
        MonitorPerson

        Stationary watch. While a person is detected the robot speaks a
        warning every tick, and sends an image notification at most once per
        monitor.notify_interval_ms: a detection at `now` notifies when no
        notification was sent yet, or when last + interval < now.
    */
    class MonitorPerson : public PilotHandler {
    public:
        using Clock = std::function<uint64_t()>;   // wall clock, ms

        static constexpr const char* WARN_TAG = "person_detecting_warn";
        static constexpr const char* NOTIFY_MESSAGE = "Person detected.";

        explicit MonitorPerson(std::shared_ptr<INotifier> notifier, Clock clock = {});

        const char* Name() const override { return "MonitorPerson"; }

        uint64_t LastDetectedTime() const { return m_LastDetectedTime; }

    protected:
        void OnHandle(const PilotState& state,
            device::Actuator& actuator,
            const Detections& detections,
            const VisionSender& vision_tx,
            const config::SwarmConfig& cfg) override;

    private:
        void Notify(const config::SwarmConfig& cfg);

    private:
        std::shared_ptr<INotifier> m_Notifier;
        Clock m_Clock;

        bool     m_HasNotified = false;
        uint64_t m_LastDetectedTime = 0;
    };

} // namespace swarmlink::pilot
