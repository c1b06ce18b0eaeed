#include "swarmlink/vision/Detection.h"

#include <algorithm>
#include <iterator>

namespace swarmlink::vision {

std::vector<Detection> FilterClass(const std::vector<Detection>& detections, DetectionClass cls)
{
    std::vector<Detection> out;
    std::copy_if(detections.begin(), detections.end(), std::back_inserter(out),
        [cls](const Detection& d) { return d.class_id == static_cast<uint32_t>(cls); });
    return out;
}

} // namespace swarmlink::vision
