#include "swarmlink/protocol/AdvertisementCodec.h"

#include <algorithm>
#include <cstring>

#include <swarmlink/protocol/hci_commands.hpp>

namespace swarmlink::protocol {

CodecErr AdvertisementCodec::Decode(const uint8_t* data, size_t size, Neighbor& out)
{
    if (!data || size < sizeof(NeighborFrameV1)) return CodecErr::MalformedPayload;

    NeighborFrameV1 f{};
    std::memcpy(&f, data, sizeof(NeighborFrameV1));

    out.identifier = f.identifier;
    UnpackStateRest(f.state_rest, out.state, out.rest);
    out.pi_temp = f.pi_temp;
    out.mode = static_cast<Mode>(f.mode);
    out.msg = f.msg;
    out.dest = f.dest;
    return CodecErr::Ok;
}

std::vector<std::string> AdvertisementCodec::Encode(uint8_t identifier, const std::vector<uint8_t>& data)
{
    static constexpr uint8_t kHeader[] = {
        hci::ADV_DATA_LEN,
        hci::AD_FLAGS_LEN, hci::AD_TYPE_FLAGS, hci::AD_FLAGS_VALUE,
        hci::AD_MANUFACTURER_LEN, hci::AD_TYPE_MANUFACTURER,
        static_cast<uint8_t>(SWARM_COMPANY_ID & 0xFF),
        static_cast<uint8_t>(SWARM_COMPANY_ID >> 8),
    };

    std::vector<std::string> tokens;
    tokens.reserve(sizeof(kHeader) + 1 + data.size());

    for (uint8_t b : kHeader) tokens.push_back(ToHexToken(b));
    tokens.push_back(ToHexToken(identifier));
    for (uint8_t b : data) tokens.push_back(ToHexToken(b));

    return tokens;
}

std::vector<uint8_t> AdvertisementCodec::PackFrame(const Neighbor& n)
{
    NeighborFrameV1 f{};
    std::memset(f.filler, FRAME_FILLER, sizeof(f.filler));
    f.identifier = n.identifier;
    f.state_rest = PackStateRest(n.state, n.rest);
    f.pi_temp = n.pi_temp;
    f.mode = static_cast<uint8_t>(n.mode);
    f.msg = n.msg;
    f.dest = n.dest;

    std::vector<uint8_t> out(sizeof(NeighborFrameV1));
    std::memcpy(out.data(), &f, sizeof(NeighborFrameV1));
    return out;
}

uint8_t AdvertisementCodec::PackStateRest(bool state, uint8_t rest)
{
    return static_cast<uint8_t>((state ? STATE_BIT : 0) | (rest & REST_MASK));
}

void AdvertisementCodec::UnpackStateRest(uint8_t packed, bool& state, uint8_t& rest)
{
    state = ((packed >> 7) & 1) != 0;
    rest = static_cast<uint8_t>(packed & REST_MASK);
}

std::string AdvertisementCodec::NormalizeMac(const std::string& peripheral_id)
{
    static constexpr char kDevTag[] = "dev_";

    std::string mac = peripheral_id;

    // "<adapter>/dev_XX_XX_..." or bare "dev_XX_XX_..."
    const size_t slash = mac.rfind('/');
    const size_t start = (slash == std::string::npos) ? 0 : slash + 1;
    if (mac.compare(start, sizeof(kDevTag) - 1, kDevTag) == 0) {
        mac.erase(0, start + sizeof(kDevTag) - 1);
    }

    std::replace(mac.begin(), mac.end(), '_', ':');
    return mac;
}

ManufacturerData AdvertisementCodec::ParseAdvertisingData(const uint8_t* data, size_t size)
{
    ManufacturerData out;
    if (!data) return out;

    size_t i = 0;
    while (i < size) {
        const size_t len = data[i];
        if (len == 0) break;

        const size_t type_at = i + 1;
        const size_t end = std::min(size, i + 1 + len);
        i += 1 + len;

        if (type_at >= end) continue;
        if (data[type_at] != hci::AD_TYPE_MANUFACTURER) continue;

        const size_t value_at = type_at + 1;
        if (end - value_at < 2) continue;

        const uint16_t company = static_cast<uint16_t>(data[value_at] | (data[value_at + 1] << 8));
        out[company].assign(data + value_at + 2, data + end);
    }

    return out;
}

std::string AdvertisementCodec::ToHexToken(uint8_t b)
{
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string s(2, '0');
    s[0] = kDigits[(b >> 4) & 0x0F];
    s[1] = kDigits[b & 0x0F];
    return s;
}

} // namespace swarmlink::protocol
