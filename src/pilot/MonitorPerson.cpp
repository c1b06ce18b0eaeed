#include "swarmlink/pilot/MonitorPerson.h"

#include <chrono>
#include <exception>

#include <FrameKit/Debug/Log.h>

namespace swarmlink::pilot {

namespace {

    static uint64_t SystemNowMs()
    {
        using namespace std::chrono;
        return (uint64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

} // namespace

MonitorPerson::MonitorPerson(std::shared_ptr<INotifier> notifier, Clock clock)
    : m_Notifier(std::move(notifier))
    , m_Clock(clock ? std::move(clock) : Clock(&SystemNowMs))
{
}

void MonitorPerson::OnHandle(const PilotState& /*state*/,
    device::Actuator& actuator,
    const Detections& detections,
    const VisionSender& /*vision_tx*/,
    const config::SwarmConfig& cfg)
{
    if (vision::FilterClass(detections, vision::DetectionClass::Person).empty()) return;

    FK_WARN("[MonitorPerson] Person detected");
    actuator.Speak(WARN_TAG);

    const uint64_t now = m_Clock();
    if (m_HasNotified && !(m_LastDetectedTime + cfg.monitor.notify_interval_ms < now)) return;

    m_HasNotified = true;
    m_LastDetectedTime = now;
    Notify(cfg);
}

void MonitorPerson::Notify(const config::SwarmConfig& cfg)
{
    if (!m_Notifier || !cfg.notify.enabled) return;

    try {
        if (!m_Notifier->Send(NOTIFY_MESSAGE, cfg.paths.last_image, cfg.notify)) {
            FK_WARN("[MonitorPerson] Notification not delivered (image='{}')", cfg.paths.last_image);
        }
    }
    catch (const std::exception& e) {
        FK_WARN("[MonitorPerson] Notification failed: {}", e.what());
    }
    catch (...) {
        FK_WARN("[MonitorPerson] Notification failed: non-standard exception");
    }
}

} // namespace swarmlink::pilot
