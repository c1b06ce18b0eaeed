#include "swarmlink/services/HciToolAdvertiser.h"

#include <cerrno>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>

#include <utility>

#include <FrameKit/Debug/Log.h>

#include <swarmlink/config/SwarmConfig.h>

extern char** environ;

using namespace swarmlink::protocol;

namespace swarmlink::services {

namespace {

    static std::string JoinArgs(const std::vector<std::string>& argv)
    {
        std::string s;
        for (const auto& a : argv) {
            if (!s.empty()) s += ' ';
            s += a;
        }
        return s;
    }

} // namespace

HciToolAdvertiser::HciToolAdvertiser(std::string hci_device, CommandRunner runner)
    : m_Device(std::move(hci_device))
    , m_Runner(runner ? std::move(runner) : CommandRunner(&HciToolAdvertiser::RunProcess))
{
}

std::shared_ptr<HciToolAdvertiser> HciToolAdvertiser::FromConfig(const config::SwarmConfig& cfg,
    CommandRunner runner)
{
    return std::make_shared<HciToolAdvertiser>(cfg.hci_device, std::move(runner));
}

bool HciToolAdvertiser::ProgramAdvertisingParameters(const AdvertisingParams& p)
{
    std::vector<std::string> params;
    params.reserve(15);

    params.push_back(AdvertisementCodec::ToHexToken(static_cast<uint8_t>(p.interval_min & 0xFF)));
    params.push_back(AdvertisementCodec::ToHexToken(static_cast<uint8_t>(p.interval_min >> 8)));
    params.push_back(AdvertisementCodec::ToHexToken(static_cast<uint8_t>(p.interval_max & 0xFF)));
    params.push_back(AdvertisementCodec::ToHexToken(static_cast<uint8_t>(p.interval_max >> 8)));
    params.push_back(AdvertisementCodec::ToHexToken(p.adv_type));
    params.push_back("00");                                   // own address type: public
    params.push_back("00");                                   // peer address type
    for (int i = 0; i < 6; ++i) params.push_back("00");       // peer address
    params.push_back(AdvertisementCodec::ToHexToken(p.channel_map));
    params.push_back("00");                                   // filter policy

    return Issue(hci::OCF_SET_ADV_PARAMETERS, params);
}

bool HciToolAdvertiser::EnableAdvertising()
{
    return Issue(hci::OCF_SET_ADV_ENABLE, { "01" });
}

bool HciToolAdvertiser::SetAdvertisingPayload(const std::vector<std::string>& tokens)
{
    return Issue(hci::OCF_SET_ADV_DATA, tokens);
}

bool HciToolAdvertiser::Issue(const char* ocf, const std::vector<std::string>& params)
{
    std::vector<std::string> argv{ "hcitool", "-i", m_Device, "cmd", hci::OGF_LE, ocf };
    argv.insert(argv.end(), params.begin(), params.end());

    const int status = m_Runner(argv);
    if (status != 0) {
        FK_ERROR("[HciTool] command failed status={} cmd='{}'", status, JoinArgs(argv));
        return false;
    }
    return true;
}

int HciToolAdvertiser::RunProcess(const std::vector<std::string>& argv)
{
    if (argv.empty()) return -1;

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    if (posix_spawn_file_actions_init(&actions) != 0) return -1;
    if (posix_spawn_file_actions_addopen(&actions, 1, "/dev/null", O_WRONLY, 0) != 0 ||
        posix_spawn_file_actions_addopen(&actions, 2, "/dev/null", O_WRONLY, 0) != 0) {
        posix_spawn_file_actions_destroy(&actions);
        return -1;
    }

    pid_t pid = 0;
    const int err = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (err != 0) {
        FK_ERROR("[HciTool] spawn '{}' failed errno={}", argv[0], err);
        return -1;
    }

    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR) return -1;
    }

    if (!WIFEXITED(wstatus)) return -1;
    return WEXITSTATUS(wstatus);
}

} // namespace swarmlink::services
