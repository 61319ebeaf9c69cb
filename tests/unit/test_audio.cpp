#include "../framework/SimpleTest.hpp"
#include "audio/PipeWireAudioService.hpp"

using halcyon::audio::PipeWireAudioService;

TEST_CASE(test_cubic_volume_curve) {
    ASSERT_EQ(PipeWireAudioService::linear_to_percent(0.0f), 0);
    ASSERT_EQ(PipeWireAudioService::linear_to_percent(1.0f), 100);
    ASSERT_EQ(PipeWireAudioService::linear_to_percent(0.125f), 50);
    ASSERT_NEAR(PipeWireAudioService::percent_to_linear(50), 0.125f, 0.0001f);
    ASSERT_NEAR(PipeWireAudioService::percent_to_linear(100), 1.0f, 0.0001f);
}

TEST_CASE(test_cubic_volume_curve_clamps) {
    // Software gain can push channelVolumes past 1.0
    ASSERT_EQ(PipeWireAudioService::linear_to_percent(2.5f), 100);
    ASSERT_EQ(PipeWireAudioService::linear_to_percent(-0.5f), 0);
    ASSERT_NEAR(PipeWireAudioService::percent_to_linear(130), 1.0f, 0.0001f);
}

TEST_CASE(test_every_percent_survives_conversion) {
    for (int p = 0; p <= 100; ++p) {
        ASSERT_EQ(PipeWireAudioService::linear_to_percent(PipeWireAudioService::percent_to_linear(p)), p);
    }
}

TEST_CASE(test_parse_metadata_name) {
    ASSERT_EQ(PipeWireAudioService::parse_metadata_name("{\"name\":\"alsa_output.pci-0000_00_1f.3.analog-stereo\"}"),
              "alsa_output.pci-0000_00_1f.3.analog-stereo");
    ASSERT_EQ(PipeWireAudioService::parse_metadata_name("{ \"name\" : \"bluez_output.A0\" }"), "bluez_output.A0");
    ASSERT_EQ(PipeWireAudioService::parse_metadata_name("{\"name\":\"a\\\"b\"}"), "a\"b");
    ASSERT_EQ(PipeWireAudioService::parse_metadata_name("{}"), "");
    ASSERT_EQ(PipeWireAudioService::parse_metadata_name("{\"name\":\"unterminated"), "");
}

int main(int argc, char** argv) {
    return halcyon::test::TestRunner::instance().run_all(argc, argv);
}
