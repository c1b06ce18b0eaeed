#include "swarmlink/device/Actuator.h"

#include <FrameKit/Debug/Log.h>

namespace swarmlink::device {

Actuator::Actuator(std::unique_ptr<IActuatorDriver> driver)
    : m_Driver(std::move(driver))
{
    if (!m_Driver) FK_WARN("[Actuator] created without a driver; commands are dropped");
}

void Actuator::Stop()
{
    std::lock_guard<std::mutex> lk(m_Mutex);
    if (m_Driver) m_Driver->Stop();
}

void Actuator::Speak(const std::string& tag)
{
    std::lock_guard<std::mutex> lk(m_Mutex);
    if (m_Driver) m_Driver->Speak(tag);
}

} // namespace swarmlink::device
