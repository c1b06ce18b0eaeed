#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <swarmlink/device/Actuator.h>
#include <swarmlink/pilot/PilotContext.h>
#include <swarmlink/services/RadioInterfaces.h>

namespace swarmlink::testing {

    // ---------------------------------------------------------------
    // Actuator
    // ---------------------------------------------------------------
    using CommandLog = std::vector<std::string>;

    class RecordingDriver : public device::IActuatorDriver {
    public:
        explicit RecordingDriver(std::shared_ptr<CommandLog> log) : m_Log(std::move(log)) {}

        void Stop() override { m_Log->push_back("stop"); }
        void Speak(const std::string& tag) override { m_Log->push_back("speak:" + tag); }

    private:
        std::shared_ptr<CommandLog> m_Log;
    };

    inline device::ActuatorHandle MakeActuator(std::shared_ptr<CommandLog>& log)
    {
        log = std::make_shared<CommandLog>();
        return std::make_shared<device::Actuator>(std::make_unique<RecordingDriver>(log));
    }

    // ---------------------------------------------------------------
    // Notifier
    // ---------------------------------------------------------------
    class FakeNotifier : public pilot::INotifier {
    public:
        enum class Behavior { Deliver, Fail, Throw, ThrowNonStandard };

        bool Send(const std::string& message, const std::string& image_path,
            const config::NotifySettings&) override
        {
            sent.push_back({ message, image_path });
            if (behavior == Behavior::Throw) throw std::runtime_error("notify endpoint unreachable");
            if (behavior == Behavior::ThrowNonStandard) throw 503;
            return behavior == Behavior::Deliver;
        }

        Behavior behavior = Behavior::Deliver;
        std::vector<std::pair<std::string, std::string>> sent;
    };

    // ---------------------------------------------------------------
    // Radio
    // ---------------------------------------------------------------
    class FakeAdvertiser : public services::IAdvertiser {
    public:
        bool ProgramAdvertisingParameters(const services::AdvertisingParams& p) override
        {
            calls.push_back("program");
            last_params = p;
            if (program_failures > 0) { --program_failures; return false; }
            return true;
        }

        bool EnableAdvertising() override
        {
            calls.push_back("enable");
            if (enable_failures > 0) { --enable_failures; return false; }
            return true;
        }

        bool SetAdvertisingPayload(const std::vector<std::string>& tokens) override
        {
            calls.push_back("payload");
            payloads.push_back(tokens);
            return payload_ok;
        }

        int program_failures = 0;
        int enable_failures = 0;
        bool payload_ok = true;

        std::vector<std::string> calls;
        services::AdvertisingParams last_params{};
        std::vector<std::vector<std::string>> payloads;
    };

    class ScriptedEventStream : public services::IEventStream {
    public:
        explicit ScriptedEventStream(std::vector<services::CentralEvent> events)
            : m_Events(std::move(events)) {}

        bool Next(services::CentralEvent& out) override
        {
            if (m_Pos >= m_Events.size()) return false;
            out = m_Events[m_Pos++];
            return true;
        }

    private:
        std::vector<services::CentralEvent> m_Events;
        size_t m_Pos = 0;
    };

    class FakeCentral : public services::IRadioCentral {
    public:
        explicit FakeCentral(std::vector<services::CentralEvent> events) : m_Events(std::move(events)) {}

        std::string Name() const override { return "hci0"; }

        std::unique_ptr<services::IEventStream> Events() override
        {
            if (!subscribe_ok) return nullptr;
            return std::make_unique<ScriptedEventStream>(m_Events);
        }

        bool StartScan() override
        {
            scan_started = true;
            return scan_ok;
        }

        bool subscribe_ok = true;
        bool scan_ok = true;
        bool scan_started = false;

    private:
        std::vector<services::CentralEvent> m_Events;
    };

    class FakeManager : public services::IRadioManager {
    public:
        std::vector<std::shared_ptr<services::IRadioCentral>> Adapters() override { return adapters; }

        std::vector<std::shared_ptr<services::IRadioCentral>> adapters;
    };

    inline services::CentralEvent ManufacturerEvent(const std::string& id, int16_t rssi,
        protocol::ManufacturerData data)
    {
        services::CentralEvent ev{};
        ev.kind = services::CentralEvent::Kind::ManufacturerDataAdvertisement;
        ev.id = id;
        ev.rssi = rssi;
        ev.manufacturer_data = std::move(data);
        return ev;
    }

    inline services::CentralEvent PlainEvent(services::CentralEvent::Kind kind, const std::string& id)
    {
        services::CentralEvent ev{};
        ev.kind = kind;
        ev.id = id;
        return ev;
    }

    // 3 filler bytes + 6 body bytes
    inline std::vector<uint8_t> SwarmFrame(uint8_t identifier, uint8_t state_rest, uint8_t pi_temp,
        uint8_t mode, uint8_t msg, uint8_t dest)
    {
        return { 0xFF, 0xFF, 0xFF, identifier, state_rest, pi_temp, mode, msg, dest };
    }

    inline std::vector<uint8_t> TokensToBytes(const std::vector<std::string>& tokens)
    {
        std::vector<uint8_t> out;
        out.reserve(tokens.size());
        for (const auto& t : tokens) out.push_back(static_cast<uint8_t>(std::stoul(t, nullptr, 16)));
        return out;
    }

} // namespace swarmlink::testing
