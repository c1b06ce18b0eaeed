#pragma once
#include <string>
#include <vector>

#include <swarmlink/config/SwarmConfig.h>
#include <swarmlink/core/Channel.hpp>
#include <swarmlink/device/Actuator.h>
#include <swarmlink/protocol/mode.hpp>
#include <swarmlink/vision/Detection.h>

namespace swarmlink::pilot {

    // Own robot state as seen by the pilots (read-only here).
    struct PilotState {
        bool           enabled = false;
        double         pi_temp = 0.0;     // degC
        uint8_t        identifier = 0;
        protocol::Mode mode = protocol::Mode::Fill;
    };

    using Detections = std::vector<vision::Detection>;
    using VisionSender = core::Sender<vision::VisionCommand>;

    /*
        External notification delivery (message + image).
        Returns false on failure; may also throw. Pilots log either and
        carry on.
    */
    class INotifier {
    public:
        virtual ~INotifier() = default;

        virtual bool Send(const std::string& message,
            const std::string& image_path,
            const config::NotifySettings& settings) = 0;
    };

} // namespace swarmlink::pilot
