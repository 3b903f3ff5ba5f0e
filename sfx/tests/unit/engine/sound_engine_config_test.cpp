// ==============================================================================
// Tests: Sound Engine Configuration
// ==============================================================================

#include <bleep/sfx/engine/sound_engine_config.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>

using Catch::Approx;
using namespace Bleep::Sfx;

TEST_CASE("SoundEngineConfig defaults are already sane", "[config]") {
    const SoundEngineConfig config;
    const SoundEngineConfig sanitized = config.sanitized();

    CHECK(sanitized.muteTimeConstantSeconds == kDefaultMuteTimeConstant);
    CHECK(sanitized.levelStepRatio == kDefaultLevelStepRatio);
    CHECK(sanitized.maxScaledLevel == kDefaultMaxScaledLevel);
    CHECK(sanitized.masterVolume == 1.0f);
    CHECK(sanitized.noiseSeed == kDefaultNoiseSeed);
}

TEST_CASE("SoundEngineConfig sanitizes out-of-range fields", "[config][edge]") {
    constexpr double nanD = std::numeric_limits<double>::quiet_NaN();
    constexpr float nanF = std::numeric_limits<float>::quiet_NaN();

    SoundEngineConfig config;
    config.muteTimeConstantSeconds = nanD;
    config.levelStepRatio = -0.5f;
    config.maxScaledLevel = -4;
    config.masterVolume = nanF;

    const SoundEngineConfig out = config.sanitized();
    CHECK(out.muteTimeConstantSeconds == kDefaultMuteTimeConstant);
    CHECK(out.levelStepRatio == kDefaultLevelStepRatio);
    CHECK(out.maxScaledLevel == kMinScaledLevel);
    CHECK(out.masterVolume == 1.0f);

    SECTION("zero time constant") {
        config.muteTimeConstantSeconds = 0.0;
        CHECK(config.sanitized().muteTimeConstantSeconds == kDefaultMuteTimeConstant);
    }

    SECTION("zero step ratio would flatten every level") {
        config.levelStepRatio = 0.0f;
        CHECK(config.sanitized().levelStepRatio == kDefaultLevelStepRatio);
    }

    SECTION("small level caps are raised") {
        for (int cap : {1, 2, 4}) {
            config.maxScaledLevel = cap;
            CHECK(config.sanitized().maxScaledLevel == kMinScaledLevel);
        }
        config.maxScaledLevel = kMinScaledLevel + 1;
        CHECK(config.sanitized().maxScaledLevel == kMinScaledLevel + 1);
    }

    SECTION("sanitized scaling always lifts level 5 above level 1") {
        config.levelStepRatio = 0.0f;
        config.maxScaledLevel = 1;
        const LevelScaling scaling = config.sanitized().levelScaling();
        CHECK(scaling.factor(5) > scaling.factor(1));
    }

    SECTION("volume is clamped rather than reset") {
        config.masterVolume = 4.0f;
        CHECK(config.sanitized().masterVolume == 1.0f);
        config.masterVolume = -1.0f;
        CHECK(config.sanitized().masterVolume == 0.0f);
    }
}

TEST_CASE("SoundEngineConfig builds its level scaling", "[config]") {
    SoundEngineConfig config;
    config.levelStepRatio = 0.05f;
    config.maxScaledLevel = 11;

    const LevelScaling scaling = config.levelScaling();
    CHECK(scaling.factor(11) == Approx(1.5f));
    CHECK(scaling.factor(20) == Approx(1.5f));
}
