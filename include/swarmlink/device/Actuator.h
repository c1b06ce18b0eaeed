#pragma once
#include <memory>
#include <mutex>
#include <string>

namespace swarmlink::device {

    // Motor / speaker primitives provided by the platform.
    class IActuatorDriver {
    public:
        virtual ~IActuatorDriver() = default;

        virtual void Stop() = 0;
        virtual void Speak(const std::string& tag) = 0;
    };

    /*
        Actuator

        Shared by the discovery side and every pilot invocation.
        Each command takes the lock for that command only.
    */
    class Actuator {
    public:
        explicit Actuator(std::unique_ptr<IActuatorDriver> driver);

        void Stop();
        void Speak(const std::string& tag);

    private:
        std::mutex m_Mutex;
        std::unique_ptr<IActuatorDriver> m_Driver;
    };

    using ActuatorHandle = std::shared_ptr<Actuator>;

} // namespace swarmlink::device
