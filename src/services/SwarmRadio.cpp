#include "swarmlink/services/SwarmRadio.h"

#include <chrono>
#include <utility>

#include <FrameKit/Debug/Log.h>

using namespace swarmlink::protocol;

namespace swarmlink::services {

namespace {

    struct RateLimiter {
        double acc = 0.0;
        double every = 1.0;
        bool Step(double dt) {
            if (dt < 0.0 || dt > 5.0) dt = 0.0;
            acc += dt;
            if (acc >= every) { acc = 0.0; return true; }
            return false;
        }
    };

    static void SleepMs(uint32_t ms)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }

    static bool EveryNth(uint64_t count, uint64_t n)
    {
        return count == 1 || (count % n) == 0;
    }

} // namespace

const char* ToString(RadioError e)
{
    switch (e) {
    case RadioError::None:                    return "None";
    case RadioError::ProgramParametersFailed: return "ProgramParametersFailed";
    case RadioError::EnableAdvertisingFailed: return "EnableAdvertisingFailed";
    case RadioError::NoAdapter:               return "NoAdapter";
    case RadioError::SubscribeFailed:         return "SubscribeFailed";
    case RadioError::ScanFailed:              return "ScanFailed";
    case RadioError::ReceiverClosed:          return "ReceiverClosed";
    case RadioError::StreamEnded:             return "StreamEnded";
    }
    return "Unknown";
}

SwarmRadio::SwarmRadio(std::shared_ptr<IRadioManager> manager, std::shared_ptr<IAdvertiser> advertiser,
    Sleeper sleeper)
    : m_Manager(std::move(manager))
    , m_Advertiser(std::move(advertiser))
    , m_Health(std::make_shared<Health>())
    , m_Sleep(sleeper ? std::move(sleeper) : Sleeper(&SleepMs))
{
}

template <typename Fn>
bool SwarmRadio::RunWithRetry(const char* what, Fn&& command)
{
    const int attempts = (m_Params.configure_attempts > 0) ? m_Params.configure_attempts : 1;
    uint32_t backoff_ms = m_Params.retry_backoff_ms;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (command()) {
            if (attempt > 1) FK_INFO("[Radio] {} succeeded on attempt {}", what, attempt);
            return true;
        }

        FK_WARN("[Radio] {} failed (attempt {}/{})", what, attempt, attempts);
        if (attempt < attempts && backoff_ms > 0) {
            m_Sleep(backoff_ms);
            backoff_ms *= 2;
        }
    }
    return false;
}

bool SwarmRadio::Init(const Params& p)
{
    m_Params = p;
    m_LastError = RadioError::None;

    FK_INFO("[Radio] Init begin: interval_min=0x{:04X} interval_max=0x{:04X} adv_type={} channel_map=0x{:02X} attempts={} backoff_ms={}",
        (unsigned)m_Params.advertising.interval_min,
        (unsigned)m_Params.advertising.interval_max,
        (unsigned)m_Params.advertising.adv_type,
        (unsigned)m_Params.advertising.channel_map,
        m_Params.configure_attempts,
        (unsigned)m_Params.retry_backoff_ms
    );

    if (!m_Advertiser) {
        FK_ERROR("[Radio] Init failed: no advertiser");
        m_LastError = RadioError::ProgramParametersFailed;
        return false;
    }

    if (!RunWithRetry("ProgramAdvertisingParameters",
            [this] { return m_Advertiser->ProgramAdvertisingParameters(m_Params.advertising); })) {
        FK_ERROR("[Radio] Init failed: advertising parameters not accepted");
        m_LastError = RadioError::ProgramParametersFailed;
        return false;
    }

    if (!RunWithRetry("EnableAdvertising", [this] { return m_Advertiser->EnableAdvertising(); })) {
        FK_ERROR("[Radio] Init failed: advertising could not be enabled");
        m_LastError = RadioError::EnableAdvertisingFailed;
        return false;
    }

    FK_INFO("[Radio] Init OK. advertising enabled");
    return true;
}

std::thread SwarmRadio::Listen(core::Sender<Neighbor> tx)
{
    m_Health->worker_running = true;
    return std::thread(&SwarmRadio::RunDiscovery, m_Manager, m_Health, std::move(tx));
}

void SwarmRadio::RunDiscovery(std::shared_ptr<IRadioManager> manager,
    std::shared_ptr<Health> health,
    core::Sender<Neighbor> tx)
{
    FK_INFO("[Radio] Discovery worker started");

    auto finish = [&health](RadioError e) {
        health->worker_error = e;
        health->worker_running = false;
    };

    std::vector<std::shared_ptr<IRadioCentral>> adapters;
    if (manager) adapters = manager->Adapters();
    if (adapters.empty() || !adapters.front()) {
        FK_ERROR("[Radio] Discovery failed: no adapter available");
        finish(RadioError::NoAdapter);
        return;
    }

    auto central = adapters.front();
    FK_INFO("[Radio] Using adapter '{}' ({} available)", central->Name(), (int)adapters.size());

    auto events = central->Events();
    if (!events) {
        FK_ERROR("[Radio] Discovery failed: event subscription on '{}' refused", central->Name());
        finish(RadioError::SubscribeFailed);
        return;
    }

    if (!central->StartScan()) {
        FK_ERROR("[Radio] Discovery failed: scan start on '{}' refused", central->Name());
        finish(RadioError::ScanFailed);
        return;
    }

    FK_INFO("[Radio] Scanning on '{}'", central->Name());

    using clock = std::chrono::steady_clock;
    RateLimiter summary{ 0.0, 1.0 };
    auto last = clock::now();

    CentralEvent ev{};
    while (events->Next(ev)) {
        health->events++;

        if (!ForwardEvent(ev, *health, tx)) {
            FK_ERROR("[Radio] Neighbor receiver closed; discovery worker stops");
            finish(RadioError::ReceiverClosed);
            return;
        }

        const auto now = clock::now();
        const double dt = std::chrono::duration<double>(now - last).count();
        last = now;
        if (summary.Step(dt)) {
            FK_INFO("[Radio] Discovery: events={} forwarded={} ignored={} filtered={} malformed={}",
                (unsigned long long)health->events,
                (unsigned long long)health->forwarded,
                (unsigned long long)health->ignored,
                (unsigned long long)health->filtered,
                (unsigned long long)health->malformed
            );
        }
    }

    FK_WARN("[Radio] Discovery event stream ended (events={})", (unsigned long long)health->events);
    finish(RadioError::StreamEnded);
}

bool SwarmRadio::ForwardEvent(const CentralEvent& ev, Health& health, const core::Sender<Neighbor>& tx)
{
    if (ev.kind != CentralEvent::Kind::ManufacturerDataAdvertisement) {
        health.ignored++;
        return true;
    }

    const auto it = ev.manufacturer_data.find(SWARM_COMPANY_ID);
    if (it == ev.manufacturer_data.end()) {
        health.filtered++;
        return true;
    }

    Neighbor n{};
    if (AdvertisementCodec::Decode(it->second, n) != CodecErr::Ok) {
        const uint64_t bad = ++health.malformed;
        if (EveryNth(bad, 32)) {
            FK_WARN("[Radio] Malformed swarm frame from {} ({} bytes, total malformed={})",
                ev.id, (int)it->second.size(), (unsigned long long)bad);
        }
        return true;
    }

    n.mac = AdvertisementCodec::NormalizeMac(ev.id);
    n.manufacturer_id = it->first;
    n.rssi = ev.rssi;
    n.timestamp = std::chrono::system_clock::now();

    const std::string mac = n.mac;
    const uint8_t identifier = n.identifier;

    if (!tx.Send(std::move(n))) return false;

    const uint64_t fwd = ++health.forwarded;
    if (EveryNth(fwd, 64)) {
        FK_INFO("[Radio] Neighbor from {} id={} rssi={} (forwarded={})",
            mac, (unsigned)identifier, (int)ev.rssi, (unsigned long long)fwd);
    }
    return true;
}

bool SwarmRadio::Cast(uint8_t identifier, const std::vector<uint8_t>& data)
{
    if (!m_Advertiser) return false;

    m_Health->casts++;
    if (!m_Advertiser->SetAdvertisingPayload(AdvertisementCodec::Encode(identifier, data))) {
        m_Health->cast_failures++;
        FK_WARN("[Radio] Cast failed: identifier=0x{:02X} bytes={}", (unsigned)identifier, (int)data.size());
        return false;
    }
    return true;
}

bool SwarmRadio::CastNeighbor(const Neighbor& n)
{
    const auto frame = AdvertisementCodec::PackFrame(n);
    return Cast(frame.front(), std::vector<uint8_t>(frame.begin() + 1, frame.end()));
}

} // namespace swarmlink::services
