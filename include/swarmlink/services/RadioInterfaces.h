#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <swarmlink/protocol/AdvertisementCodec.h>
#include <swarmlink/protocol/hci_commands.hpp>

/*
    Radio capabilities consumed by SwarmRadio.

    The BLE stack itself lives outside this library. A platform backend
    implements:
      - IRadioManager / IRadioCentral / IEventStream for discovery
      - IAdvertiser for the three advertising commands
*/

namespace swarmlink::services {

    struct CentralEvent {
        enum class Kind : uint8_t {
            DeviceDiscovered,
            DeviceUpdated,
            DeviceConnected,
            DeviceDisconnected,
            ManufacturerDataAdvertisement,
            ServiceDataAdvertisement,
            ServicesAdvertisement,
        };

        Kind kind = Kind::DeviceDiscovered;
        std::string id;                              // e.g. "hci0/dev_AA_BB_CC_DD_EE_FF"
        int16_t rssi = 0;                            // 0 when unknown
        protocol::ManufacturerData manufacturer_data;
    };

    class IEventStream {
    public:
        virtual ~IEventStream() = default;

        // Blocks until the next event. false = stream ended.
        virtual bool Next(CentralEvent& out) = 0;
    };

    class IRadioCentral {
    public:
        virtual ~IRadioCentral() = default;

        virtual std::string Name() const = 0;

        // nullptr if the subscription could not be made.
        virtual std::unique_ptr<IEventStream> Events() = 0;
        virtual bool StartScan() = 0;
    };

    class IRadioManager {
    public:
        virtual ~IRadioManager() = default;
        virtual std::vector<std::shared_ptr<IRadioCentral>> Adapters() = 0;
    };

    struct AdvertisingParams {
        uint16_t interval_min = protocol::hci::ADV_INTERVAL_DEFAULT;
        uint16_t interval_max = protocol::hci::ADV_INTERVAL_DEFAULT;
        uint8_t  adv_type     = protocol::hci::ADV_TYPE_NONCONN_IND;
        uint8_t  channel_map  = protocol::hci::ADV_CHANNEL_ALL;
    };

    class IAdvertiser {
    public:
        virtual ~IAdvertiser() = default;

        virtual bool ProgramAdvertisingParameters(const AdvertisingParams& p) = 0;
        virtual bool EnableAdvertising() = 0;

        // tokens as produced by AdvertisementCodec::Encode
        virtual bool SetAdvertisingPayload(const std::vector<std::string>& tokens) = 0;
    };

} // namespace swarmlink::services
