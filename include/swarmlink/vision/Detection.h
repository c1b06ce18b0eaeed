#pragma once
#include <cstdint>
#include <vector>

namespace swarmlink::vision {

    // Detector class ids. Must match the detector's label order.
    enum class DetectionClass : uint32_t {
        Person = 0,
        Animal = 1,
        Pylon  = 2,
        Robot  = 3,
    };

    struct BoundingBox {
        float x1 = 0.0f;
        float y1 = 0.0f;
        float x2 = 0.0f;
        float y2 = 0.0f;
    };

    struct Detection {
        uint32_t    class_id = 0;
        float       confidence = 0.0f;
        BoundingBox box{};
    };

    std::vector<Detection> FilterClass(const std::vector<Detection>& detections, DetectionClass cls);

    // Feedback from pilots to the perception subsystem.
    enum class VisionCommand : uint8_t {
        Off,
        On,
        SwitchSessionPylon,
        SwitchSessionPerson,
        SwitchSessionAnimal,
    };

} // namespace swarmlink::vision
