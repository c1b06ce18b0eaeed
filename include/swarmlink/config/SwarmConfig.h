#pragma once
#include <cstdint>
#include <string>

#include <swarmlink/services/SwarmRadio.h>

/*
    SwarmConfig

    Static configuration handed to every pilot invocation.
    Defaults are usable as-is; LoadConfig() overrides whatever keys the
    YAML file provides:

      radio:
        hci_device: hci0
        adv_interval_min: 160        # 0.625 ms units
        adv_interval_max: 160
        adv_type: 3
        channel_map: 7
        configure_attempts: 3
        retry_backoff_ms: 100
      safety:
        max_pi_temp: 70.0
      monitor:
        notify_interval_ms: 60000
      paths:
        last_image: /var/lib/swarmlink/last.jpg
      notify:
        enabled: true
        endpoint: https://notify.example/api
        token: ""
*/

namespace swarmlink::config {

    struct SafetyParams {
        double max_pi_temp = 70.0;
    };

    struct MonitorParams {
        uint64_t notify_interval_ms = 60000;
    };

    struct PathParams {
        std::string last_image = "/var/lib/swarmlink/last.jpg";
    };

    struct NotifySettings {
        bool        enabled = true;
        std::string endpoint;
        std::string token;
    };

    struct SwarmConfig {
        std::string hci_device = "hci0";             // see HciToolAdvertiser::FromConfig
        services::SwarmRadio::Params radio{};

        SafetyParams   safety{};
        MonitorParams  monitor{};
        PathParams     paths{};
        NotifySettings notify{};
    };

    bool LoadConfig(const std::string& path, SwarmConfig& out);
    bool LoadConfigFromString(const std::string& yaml, SwarmConfig& out);

    bool ValidateConfig(const SwarmConfig& cfg);

} // namespace swarmlink::config
