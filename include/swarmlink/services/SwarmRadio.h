#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <swarmlink/core/Channel.hpp>
#include <swarmlink/protocol/AdvertisementCodec.h>
#include <swarmlink/protocol/neighbor.hpp>
#include <swarmlink/services/RadioInterfaces.h>

/*
    SwarmRadio

    Purpose:
      - Owns the radio adapter for swarm advertising.
      - Init() programs advertising parameters and enables advertising.
        Each command is retried with doubling backoff; on exhaustion Init()
        fails and LastError() tells which step failed.
      - Listen() starts the discovery worker:
          * first adapter, event subscription, scan start
          * manufacturer data with company id 0xFFFF is decoded into a
            Neighbor and sent on the channel, strictly in arrival order
          * anything else is counted and dropped
          * a closed receiver ends the worker
      - Cast() replaces the broadcast payload. It does not start or stop
        advertising; each call overrides the previous payload.

    The worker only holds shared state (manager, health), so the returned
    thread may outlive the SwarmRadio object.
*/

namespace swarmlink::services {

    enum class RadioError : uint8_t {
        None = 0,
        ProgramParametersFailed,
        EnableAdvertisingFailed,
        NoAdapter,
        SubscribeFailed,
        ScanFailed,
        ReceiverClosed,
        StreamEnded,
    };

    const char* ToString(RadioError e);

    class SwarmRadio {
    public:
        struct Params {
            AdvertisingParams advertising{};

            int      configure_attempts = 3;
            uint32_t retry_backoff_ms = 100;    // doubled after each failed attempt
        };

        struct Health {
            std::atomic<uint64_t> events{ 0 };
            std::atomic<uint64_t> forwarded{ 0 };
            std::atomic<uint64_t> ignored{ 0 };     // not manufacturer data
            std::atomic<uint64_t> filtered{ 0 };    // foreign company id
            std::atomic<uint64_t> malformed{ 0 };
            std::atomic<uint64_t> casts{ 0 };
            std::atomic<uint64_t> cast_failures{ 0 };

            std::atomic<bool>       worker_running{ false };
            std::atomic<RadioError> worker_error{ RadioError::None };
        };

    public:
        // Waits between configuration retries; defaults to std::this_thread::sleep_for.
        using Sleeper = std::function<void(uint32_t ms)>;

        SwarmRadio(std::shared_ptr<IRadioManager> manager, std::shared_ptr<IAdvertiser> advertiser,
            Sleeper sleeper = {});

        bool Init(const Params& p);
        RadioError LastError() const { return m_LastError; }

        std::thread Listen(core::Sender<protocol::Neighbor> tx);

        bool Cast(uint8_t identifier, const std::vector<uint8_t>& data);
        bool CastNeighbor(const protocol::Neighbor& n);

        const Health& GetHealth() const { return *m_Health; }

    private:
        template <typename Fn>
        bool RunWithRetry(const char* what, Fn&& command);

        static void RunDiscovery(std::shared_ptr<IRadioManager> manager,
            std::shared_ptr<Health> health,
            core::Sender<protocol::Neighbor> tx);

        static bool ForwardEvent(const CentralEvent& ev, Health& health,
            const core::Sender<protocol::Neighbor>& tx);

    private:
        Params m_Params{};
        RadioError m_LastError = RadioError::None;

        std::shared_ptr<IRadioManager> m_Manager;
        std::shared_ptr<IAdvertiser>   m_Advertiser;
        std::shared_ptr<Health>        m_Health;
        Sleeper                        m_Sleep;
    };

} // namespace swarmlink::services
