#include <gtest/gtest.h>

#include <algorithm>

#include <swarmlink/protocol/AdvertisementCodec.h>
#include <swarmlink/config/SwarmConfig.h>
#include <swarmlink/services/HciToolAdvertiser.h>

using namespace swarmlink::protocol;
using namespace swarmlink::services;

namespace {

    struct RecordingRunner {
        std::vector<std::vector<std::string>> commands;
        int status = 0;

        HciToolAdvertiser::CommandRunner Runner()
        {
            return [this](const std::vector<std::string>& argv) {
                commands.push_back(argv);
                return status;
            };
        }
    };

} // namespace

TEST(HciToolAdvertiser, DefaultAdvertisingParametersCommand)
{
    RecordingRunner runner;
    HciToolAdvertiser adv("hci0", runner.Runner());

    ASSERT_TRUE(adv.ProgramAdvertisingParameters(AdvertisingParams{}));
    ASSERT_EQ(runner.commands.size(), 1u);

    const std::vector<std::string> expected{
        "hcitool", "-i", "hci0", "cmd", "0x08", "0x0006",
        "A0", "00", "A0", "00", "03", "00", "00",
        "00", "00", "00", "00", "00", "00",
        "07", "00",
    };
    EXPECT_EQ(runner.commands[0], expected);
}

TEST(HciToolAdvertiser, IntervalIsLittleEndian)
{
    RecordingRunner runner;
    HciToolAdvertiser adv("hci1", runner.Runner());

    AdvertisingParams p{};
    p.interval_min = 0x0320;
    p.interval_max = 0x0640;
    p.channel_map = 0x01;
    ASSERT_TRUE(adv.ProgramAdvertisingParameters(p));

    const auto& argv = runner.commands.at(0);
    EXPECT_EQ(argv[2], "hci1");
    EXPECT_EQ(argv[6], "20");
    EXPECT_EQ(argv[7], "03");
    EXPECT_EQ(argv[8], "40");
    EXPECT_EQ(argv[9], "06");
    EXPECT_EQ(argv[19], "01");
}

TEST(HciToolAdvertiser, EnableAndPayloadCommands)
{
    RecordingRunner runner;
    HciToolAdvertiser adv("hci0", runner.Runner());

    ASSERT_TRUE(adv.EnableAdvertising());
    EXPECT_EQ(runner.commands.at(0),
        (std::vector<std::string>{ "hcitool", "-i", "hci0", "cmd", "0x08", "0x000a", "01" }));

    const auto tokens = AdvertisementCodec::Encode(0xFF, { 0xFF, 0xFF, 0x05 });
    ASSERT_TRUE(adv.SetAdvertisingPayload(tokens));

    const auto& argv = runner.commands.at(1);
    ASSERT_EQ(argv.size(), 6 + tokens.size());
    EXPECT_EQ(argv[5], "0x0008");
    EXPECT_TRUE(std::equal(tokens.begin(), tokens.end(), argv.begin() + 6));
}

TEST(HciToolAdvertiser, FromConfigUsesConfiguredDevice)
{
    RecordingRunner runner;
    swarmlink::config::SwarmConfig cfg{};
    cfg.hci_device = "hci2";

    const auto adv = HciToolAdvertiser::FromConfig(cfg, runner.Runner());
    ASSERT_TRUE(adv->EnableAdvertising());
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0][2], "hci2");
}

TEST(HciToolAdvertiser, NonZeroExitStatusFails)
{
    RecordingRunner runner;
    runner.status = 1;
    HciToolAdvertiser adv("hci0", runner.Runner());

    EXPECT_FALSE(adv.EnableAdvertising());
    runner.status = -1;
    EXPECT_FALSE(adv.SetAdvertisingPayload({ "00" }));
}

TEST(HciToolAdvertiser, RunProcessReportsExitStatus)
{
    EXPECT_EQ(HciToolAdvertiser::RunProcess({ "true" }), 0);
    EXPECT_EQ(HciToolAdvertiser::RunProcess({ "false" }), 1);
    EXPECT_EQ(HciToolAdvertiser::RunProcess({ "swarmlink-no-such-binary" }), -1);
    EXPECT_EQ(HciToolAdvertiser::RunProcess({}), -1);
}
