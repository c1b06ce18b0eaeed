#pragma once
#include <cstddef>
#include <cstdint>

namespace swarmlink::protocol {

    /*
        NeighborFrameV1

        Manufacturer-specific data carried by every swarm advertisement,
        as the adapter hands it over (company id already stripped).

        DO NOT reorder fields.
        DO NOT change sizes.
        The filler bytes are sent as 0xFF and ignored on receive.
    */
    static constexpr uint16_t SWARM_COMPANY_ID = 0xFFFF;

#pragma pack(push, 1)
    struct NeighborFrameV1 {
        uint8_t filler[3];   // 0xFF
        uint8_t identifier;  // sender identifier
        uint8_t state_rest;  // bit 7 = state, bits 0..6 = rest
        uint8_t pi_temp;     // board temperature (degC)
        uint8_t mode;        // swarmlink::protocol::Mode
        uint8_t msg;         // ChildMsg / ParentMsg value
        uint8_t dest;        // target identifier
    };
#pragma pack(pop)

    static_assert(sizeof(NeighborFrameV1) == 9, "NeighborFrameV1 size mismatch");

    static constexpr size_t  FRAME_PREFIX_LEN = 3;
    static constexpr size_t  FRAME_BODY_LEN   = 6;
    static constexpr uint8_t FRAME_FILLER     = 0xFF;

    static constexpr uint8_t STATE_BIT = 0x80;
    static constexpr uint8_t REST_MASK = 0x7F;

} // namespace swarmlink::protocol
