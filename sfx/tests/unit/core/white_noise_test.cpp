// ==============================================================================
// Tests: White Noise
// ==============================================================================

#include <bleep/sfx/core/white_noise.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <signal_metrics.h>

#include <algorithm>
#include <numeric>
#include <vector>

using Catch::Approx;
using namespace Bleep::Sfx;

namespace {

std::vector<float> burst(WhiteNoise& noise, size_t length) {
    std::vector<float> samples(length);
    noise.fill(samples.data(), samples.size());
    return samples;
}

} // namespace

TEST_CASE("WhiteNoise replays the same bursts for the same seed", "[noise]") {
    WhiteNoise a(0x6C8E9CF5u);
    WhiteNoise b(0x6C8E9CF5u);

    CHECK(burst(a, 256) == burst(b, 256));
    CHECK(burst(a, 100) == burst(b, 100));
}

TEST_CASE("WhiteNoise successive bursts continue one sequence", "[noise]") {
    WhiteNoise whole(42u);
    WhiteNoise split(42u);

    const auto full = burst(whole, 512);
    const auto first = burst(split, 200);
    const auto second = burst(split, 312);

    CHECK(std::equal(first.begin(), first.end(), full.begin()));
    CHECK(std::equal(second.begin(), second.end(), full.begin() + 200));
    CHECK(first != std::vector<float>(full.begin() + 200, full.begin() + 400));
}

TEST_CASE("WhiteNoise different seeds give different bursts", "[noise]") {
    WhiteNoise a(12345u);
    WhiteNoise b(54321u);
    CHECK(burst(a, 64) != burst(b, 64));
}

TEST_CASE("WhiteNoise zero seed still produces noise", "[noise][edge]") {
    WhiteNoise noise(0u);
    const auto samples = burst(noise, 1024);
    CHECK(TestHelpers::peakAbs(samples) > 0.5f);
}

TEST_CASE("WhiteNoise samples are bipolar, full scale and centred", "[noise]") {
    WhiteNoise noise(7u);
    const auto samples = burst(noise, 20000);

    const auto [lowest, highest] = std::minmax_element(samples.begin(), samples.end());
    CHECK(*lowest >= -1.0f);
    CHECK(*highest <= 1.0f);
    CHECK(*lowest < -0.95f);
    CHECK(*highest > 0.95f);

    const double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / samples.size();
    CHECK(mean == Approx(0.0).margin(0.03));
}
