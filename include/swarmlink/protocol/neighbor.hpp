#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include <swarmlink/protocol/mode.hpp>

namespace swarmlink::protocol {

    /*
        Neighbor

        Decoded state of another robot, one per received swarm frame.
        The codec fills the body fields; timestamp, rssi, mac and
        manufacturer_id are filled by the discovery worker.
    */
    struct Neighbor {
        std::chrono::system_clock::time_point timestamp{};
        int16_t     rssi = 0;             // dBm, 0 if the event carried none
        std::string mac;                  // AA:BB:CC:DD:EE:FF
        uint16_t    manufacturer_id = 0;

        uint8_t identifier = 0;
        bool    state = false;
        uint8_t rest = 0;                 // 7 bits
        uint8_t pi_temp = 0;
        Mode    mode = Mode::Fill;
        uint8_t msg = 0;
        uint8_t dest = 0;
    };

} // namespace swarmlink::protocol
