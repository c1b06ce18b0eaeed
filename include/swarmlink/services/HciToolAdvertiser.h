#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <swarmlink/services/RadioInterfaces.h>

/*
    HciToolAdvertiser

    IAdvertiser that issues the LE advertising commands through
    `hcitool -i <dev> cmd 0x08 <ocf> <bytes...>`.

    The command runner is injectable; the default spawns the process,
    discards its output and returns its exit status (-1 if it could not
    be started). A command succeeds only on exit status 0.
*/

namespace swarmlink::config {
    struct SwarmConfig;
}

namespace swarmlink::services {

    class HciToolAdvertiser : public IAdvertiser {
    public:
        using CommandRunner = std::function<int(const std::vector<std::string>& argv)>;

        explicit HciToolAdvertiser(std::string hci_device = "hci0", CommandRunner runner = {});

        bool ProgramAdvertisingParameters(const AdvertisingParams& p) override;
        bool EnableAdvertising() override;
        bool SetAdvertisingPayload(const std::vector<std::string>& tokens) override;

        // Advertiser bound to cfg.hci_device.
        static std::shared_ptr<HciToolAdvertiser> FromConfig(const config::SwarmConfig& cfg,
            CommandRunner runner = {});

        static int RunProcess(const std::vector<std::string>& argv);

    private:
        bool Issue(const char* ocf, const std::vector<std::string>& params);

    private:
        std::string   m_Device;
        CommandRunner m_Runner;
    };

} // namespace swarmlink::services
