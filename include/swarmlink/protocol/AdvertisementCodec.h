#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <swarmlink/protocol/neighbor.hpp>
#include <swarmlink/protocol/neighbor_frame_v1.hpp>

/*
    AdvertisementCodec

    Pure encode/decode between Neighbor records and advertisement bytes.
    No I/O, no logging; callers decide what a failure means.

    Receive side:
      - IsSwarmFrame(company_id) filters manufacturer data before decoding.
      - Decode() reads a NeighborFrameV1 from the manufacturer data value.
      - NormalizeMac() turns an adapter peripheral id into AA:BB:CC:DD:EE:FF.

    Transmit side:
      - Encode() renders the advertising data block as hex tokens for the
        LE Set Advertising Data command.
      - PackFrame() builds the 9 frame bytes of a Neighbor; its first byte
        is the identifier argument of Encode(), the rest is the data.
*/

namespace swarmlink::protocol {

    enum class CodecErr : uint8_t {
        Ok = 0,
        MalformedPayload,
    };

    // company id -> manufacturer data value
    using ManufacturerData = std::map<uint16_t, std::vector<uint8_t>>;

    class AdvertisementCodec {
    public:
        static bool IsSwarmFrame(uint16_t company_id) { return company_id == SWARM_COMPANY_ID; }

        static CodecErr Decode(const uint8_t* data, size_t size, Neighbor& out);
        static CodecErr Decode(const std::vector<uint8_t>& payload, Neighbor& out)
        {
            return Decode(payload.data(), payload.size(), out);
        }

        static std::vector<std::string> Encode(uint8_t identifier, const std::vector<uint8_t>& data);

        static std::vector<uint8_t> PackFrame(const Neighbor& n);

        // rest is masked to 7 bits.
        static uint8_t PackStateRest(bool state, uint8_t rest);
        static void UnpackStateRest(uint8_t packed, bool& state, uint8_t& rest);

        static std::string NormalizeMac(const std::string& peripheral_id);

        /*
            Walks the AD structures of an advertising data block and collects
            manufacturer-specific elements. An element that runs past the end
            of the block is clipped; a zero length byte ends the walk.
        */
        static ManufacturerData ParseAdvertisingData(const uint8_t* data, size_t size);

        static std::string ToHexToken(uint8_t b);
    };

} // namespace swarmlink::protocol
