#include "swarmlink/config/SwarmConfig.h"

#include <yaml-cpp/yaml.h>

#include <FrameKit/Debug/Log.h>

#include <swarmlink/protocol/hci_commands.hpp>

namespace swarmlink::config {

namespace {

    // yaml-cpp reads uint8_t as a character, so byte-sized fields go through unsigned.
    static bool ReadByte(const YAML::Node& node, const char* key, uint8_t& out)
    {
        if (!node[key]) return true;
        const unsigned v = node[key].as<unsigned>();
        if (v > 0xFF) {
            FK_ERROR("[Config] {} out of range: {}", key, v);
            return false;
        }
        out = static_cast<uint8_t>(v);
        return true;
    }

    static bool ReadU16(const YAML::Node& node, const char* key, uint16_t& out)
    {
        if (!node[key]) return true;
        const unsigned v = node[key].as<unsigned>();
        if (v > 0xFFFF) {
            FK_ERROR("[Config] {} out of range: {}", key, v);
            return false;
        }
        out = static_cast<uint16_t>(v);
        return true;
    }

    static bool Apply(const YAML::Node& root, SwarmConfig& cfg)
    {
        if (const auto radio = root["radio"]) {
            cfg.hci_device = radio["hci_device"].as<std::string>(cfg.hci_device);

            auto& adv = cfg.radio.advertising;
            if (!ReadU16(radio, "adv_interval_min", adv.interval_min)) return false;
            if (!ReadU16(radio, "adv_interval_max", adv.interval_max)) return false;
            if (!ReadByte(radio, "adv_type", adv.adv_type)) return false;
            if (!ReadByte(radio, "channel_map", adv.channel_map)) return false;

            cfg.radio.configure_attempts = radio["configure_attempts"].as<int>(cfg.radio.configure_attempts);
            cfg.radio.retry_backoff_ms = radio["retry_backoff_ms"].as<uint32_t>(cfg.radio.retry_backoff_ms);
        }

        if (const auto safety = root["safety"]) {
            cfg.safety.max_pi_temp = safety["max_pi_temp"].as<double>(cfg.safety.max_pi_temp);
        }

        if (const auto monitor = root["monitor"]) {
            cfg.monitor.notify_interval_ms = monitor["notify_interval_ms"].as<uint64_t>(cfg.monitor.notify_interval_ms);
        }

        if (const auto paths = root["paths"]) {
            cfg.paths.last_image = paths["last_image"].as<std::string>(cfg.paths.last_image);
        }

        if (const auto notify = root["notify"]) {
            cfg.notify.enabled = notify["enabled"].as<bool>(cfg.notify.enabled);
            cfg.notify.endpoint = notify["endpoint"].as<std::string>(cfg.notify.endpoint);
            cfg.notify.token = notify["token"].as<std::string>(cfg.notify.token);
        }

        return true;
    }

    static bool LoadNode(const YAML::Node& root, const std::string& origin, SwarmConfig& out)
    {
        SwarmConfig cfg = out;

        try {
            if (!root.IsNull() && !root.IsMap()) {
                FK_ERROR("[Config] {}: top level must be a mapping", origin);
                return false;
            }
            if (!Apply(root, cfg)) {
                FK_ERROR("[Config] {}: rejected", origin);
                return false;
            }
        }
        catch (const YAML::Exception& e) {
            FK_ERROR("[Config] {}: {}", origin, e.what());
            return false;
        }

        if (!ValidateConfig(cfg)) {
            FK_ERROR("[Config] {}: validation failed", origin);
            return false;
        }

        out = cfg;
        FK_INFO("[Config] Loaded {}: hci={} max_pi_temp={} notify_interval_ms={} notify={}",
            origin, out.hci_device, out.safety.max_pi_temp,
            (unsigned long long)out.monitor.notify_interval_ms, (int)out.notify.enabled);
        return true;
    }

} // namespace

bool LoadConfig(const std::string& path, SwarmConfig& out)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        FK_ERROR("[Config] Failed to read '{}': {}", path, e.what());
        return false;
    }
    return LoadNode(root, path, out);
}

bool LoadConfigFromString(const std::string& yaml, SwarmConfig& out)
{
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    }
    catch (const YAML::Exception& e) {
        FK_ERROR("[Config] Failed to parse inline config: {}", e.what());
        return false;
    }
    return LoadNode(root, "<inline>", out);
}

bool ValidateConfig(const SwarmConfig& cfg)
{
    using namespace swarmlink::protocol;

    const auto& adv = cfg.radio.advertising;
    bool ok = true;

    if (cfg.hci_device.empty()) {
        FK_ERROR("[Config] radio.hci_device must not be empty");
        ok = false;
    }
    if (adv.interval_min < hci::ADV_INTERVAL_MIN || adv.interval_max > hci::ADV_INTERVAL_MAX ||
        adv.interval_min > adv.interval_max) {
        FK_ERROR("[Config] advertising interval invalid: min=0x{:04X} max=0x{:04X}",
            (unsigned)adv.interval_min, (unsigned)adv.interval_max);
        ok = false;
    }
    if (adv.channel_map == 0 || adv.channel_map > hci::ADV_CHANNEL_ALL) {
        FK_ERROR("[Config] channel_map must be within 0x01..0x07, got 0x{:02X}", (unsigned)adv.channel_map);
        ok = false;
    }
    if (cfg.radio.configure_attempts < 1) {
        FK_ERROR("[Config] configure_attempts must be >= 1, got {}", cfg.radio.configure_attempts);
        ok = false;
    }
    if (cfg.safety.max_pi_temp <= 0.0) {
        FK_ERROR("[Config] max_pi_temp must be > 0, got {}", cfg.safety.max_pi_temp);
        ok = false;
    }
    return ok;
}

} // namespace swarmlink::config
