#pragma once
#include <cstdint>

namespace swarmlink::protocol::hci {

    /*
        HCI LE controller commands used for swarm advertising.

        Issued as raw vendor commands (OGF/OCF pairs), so the exact byte
        layouts below are what the controller receives.
    */

    static constexpr const char* OGF_LE = "0x08";

    static constexpr const char* OCF_SET_ADV_PARAMETERS = "0x0006";
    static constexpr const char* OCF_SET_ADV_DATA       = "0x0008";
    static constexpr const char* OCF_SET_ADV_ENABLE     = "0x000a";

    /*
        Advertising data block (LE Set Advertising Data):

          [0x1E]                 significant length
          [0x02 0x01 0x06]       flags: LE general discoverable, BR/EDR not supported
          [0x1A 0xFF 0xFF 0xFF]  manufacturer specific, company id 0xFFFF
          [NeighborFrameV1 ...]
    */
    static constexpr uint8_t ADV_DATA_LEN          = 0x1E;
    static constexpr uint8_t AD_FLAGS_LEN          = 0x02;
    static constexpr uint8_t AD_TYPE_FLAGS         = 0x01;
    static constexpr uint8_t AD_FLAGS_VALUE        = 0x06;
    static constexpr uint8_t AD_MANUFACTURER_LEN   = 0x1A;
    static constexpr uint8_t AD_TYPE_MANUFACTURER  = 0xFF;

    // Advertising parameter defaults (interval unit = 0.625 ms)
    static constexpr uint16_t ADV_INTERVAL_DEFAULT = 0x00A0;   // 100 ms
    static constexpr uint16_t ADV_INTERVAL_MIN     = 0x0020;
    static constexpr uint16_t ADV_INTERVAL_MAX     = 0x4000;
    static constexpr uint8_t  ADV_TYPE_NONCONN_IND = 0x03;
    static constexpr uint8_t  ADV_CHANNEL_ALL      = 0x07;

} // namespace swarmlink::protocol::hci
