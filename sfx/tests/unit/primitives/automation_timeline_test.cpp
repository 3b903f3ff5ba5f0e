// ==============================================================================
// Tests: Automation Timeline
// ==============================================================================

#include <bleep/sfx/primitives/automation_timeline.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Bleep::Sfx;

TEST_CASE("AutomationTimeline without events returns the intrinsic value", "[automation]") {
    AutomationTimeline timeline(0.25f);
    CHECK(timeline.empty());
    CHECK(timeline.valueAt(0.0) == 0.25f);
    CHECK(timeline.valueAt(100.0) == 0.25f);

    timeline.setIntrinsicValue(0.5f);
    CHECK(timeline.valueAt(1.0) == 0.5f);

    SECTION("non-finite intrinsic values are ignored") {
        timeline.setIntrinsicValue(std::numeric_limits<float>::quiet_NaN());
        CHECK(timeline.intrinsicValue() == 0.5f);
    }
}

TEST_CASE("AutomationTimeline setValueAtTime steps at the event time", "[automation]") {
    AutomationTimeline timeline(1.0f);
    REQUIRE(timeline.setValueAtTime(0.3f, 0.5));

    CHECK(timeline.valueAt(0.49) == 1.0f);
    CHECK(timeline.valueAt(0.5) == 0.3f);
    CHECK(timeline.valueAt(2.0) == 0.3f);
}

TEST_CASE("AutomationTimeline linear ramp interpolates from the previous event", "[automation]") {
    AutomationTimeline timeline;
    timeline.setValueAtTime(0.0f, 1.0);
    timeline.linearRampToValueAtTime(1.0f, 2.0);

    CHECK(timeline.valueAt(1.0) == Approx(0.0f));
    CHECK(timeline.valueAt(1.25) == Approx(0.25f));
    CHECK(timeline.valueAt(1.5) == Approx(0.5f));
    CHECK(timeline.valueAt(2.0) == Approx(1.0f));
    CHECK(timeline.valueAt(3.0) == Approx(1.0f));
}

TEST_CASE("AutomationTimeline exponential ramp is geometric", "[automation]") {
    // The envelope used by every cue: peak -> 0.001
    AutomationTimeline timeline;
    timeline.setValueAtTime(1.0f, 0.0);
    timeline.exponentialRampToValueAtTime(0.001f, 1.0);

    CHECK(timeline.valueAt(0.0) == Approx(1.0f));
    CHECK(timeline.valueAt(0.5) == Approx(std::sqrt(0.001f)).epsilon(1e-4));
    CHECK(timeline.valueAt(1.0) == Approx(0.001f));
    CHECK(timeline.valueAt(5.0) == Approx(0.001f));

    SECTION("frequency glide from 40 Hz down to 20 Hz") {
        AutomationTimeline freq;
        freq.setValueAtTime(40.0f, 0.0);
        freq.exponentialRampToValueAtTime(20.0f, 0.1);
        CHECK(freq.valueAt(0.05) == Approx(40.0f / std::sqrt(2.0f)).epsilon(1e-4));
    }
}

TEST_CASE("AutomationTimeline exponential ramp holds on invalid endpoints", "[automation][edge]") {
    SECTION("zero target") {
        AutomationTimeline timeline;
        timeline.setValueAtTime(1.0f, 0.0);
        timeline.exponentialRampToValueAtTime(0.0f, 1.0);
        CHECK(timeline.valueAt(0.5) == 1.0f);
        CHECK(timeline.valueAt(1.0) == 0.0f);
    }

    SECTION("sign change") {
        AutomationTimeline timeline;
        timeline.setValueAtTime(-1.0f, 0.0);
        timeline.exponentialRampToValueAtTime(1.0f, 1.0);
        CHECK(timeline.valueAt(0.5) == -1.0f);
        CHECK(timeline.valueAt(1.0) == 1.0f);
    }
}

TEST_CASE("AutomationTimeline setTargetAtTime approaches the target", "[automation]") {
    AutomationTimeline timeline(1.0f);
    REQUIRE(timeline.setTargetAtTime(0.0f, 1.0, 0.01));

    CHECK(timeline.valueAt(0.5) == 1.0f);
    CHECK(timeline.valueAt(1.0) == Approx(1.0f));
    CHECK(timeline.valueAt(1.01) == Approx(std::exp(-1.0f)).epsilon(1e-4));
    CHECK(timeline.valueAt(1.1) == Approx(0.0f).margin(1e-4f));
}

TEST_CASE("AutomationTimeline chained targets start from the curve value", "[automation]") {
    // Mute then unmute before the fade completes
    AutomationTimeline timeline(1.0f);
    timeline.setTargetAtTime(0.0f, 0.0, 0.01);
    timeline.setTargetAtTime(1.0f, 0.01, 0.01);

    const float atSwitch = std::exp(-1.0f);
    CHECK(timeline.valueAt(0.01) == Approx(atSwitch).epsilon(1e-4));

    const float expected = 1.0f + (atSwitch - 1.0f) * std::exp(-1.0f);
    CHECK(timeline.valueAt(0.02) == Approx(expected).epsilon(1e-4));

    // No discontinuity around the switch
    CHECK(std::abs(timeline.valueAt(0.0101) - timeline.valueAt(0.0099)) < 0.01f);
}

TEST_CASE("AutomationTimeline ramp after a target interpolates from the target start", "[automation]") {
    AutomationTimeline timeline(1.0f);
    timeline.setTargetAtTime(0.0f, 0.0, 0.1);
    timeline.linearRampToValueAtTime(0.5f, 1.0);

    CHECK(timeline.valueAt(0.5) == Approx(0.75f));
    CHECK(timeline.valueAt(1.0) == Approx(0.5f));
}

TEST_CASE("AutomationTimeline discardBefore keeps the curve from the cut onward", "[automation][compaction]") {
    AutomationTimeline timeline(1.0f);
    timeline.setTargetAtTime(0.0f, 0.0, 0.01);
    timeline.setTargetAtTime(1.0f, 0.01, 0.01);
    timeline.setValueAtTime(0.5f, 0.05);
    timeline.linearRampToValueAtTime(0.2f, 0.1);
    timeline.setTargetAtTime(0.8f, 0.2, 0.05);
    timeline.exponentialRampToValueAtTime(0.4f, 0.5);

    const AutomationTimeline reference = timeline;
    const std::vector<double> cuts{0.0, 0.005, 0.01, 0.03, 0.05, 0.07, 0.1, 0.15, 0.2, 0.3, 0.6};

    for (double cut : cuts) {
        INFO("cut at " << cut);
        timeline.discardBefore(cut);
        for (double t = cut; t < 0.7; t += 0.0037) {
            REQUIRE(timeline.valueAt(t) == Approx(reference.valueAt(t)).margin(1e-6f));
        }
    }
    // Only the finished ramp remains
    CHECK(timeline.events().size() == 1);
}

TEST_CASE("AutomationTimeline discardBefore anchors a running target", "[automation][compaction]") {
    AutomationTimeline timeline(1.0f);
    timeline.setTargetAtTime(0.0f, 0.0, 0.01);
    timeline.setTargetAtTime(1.0f, 0.01, 0.01);
    const float start = timeline.valueAt(0.01);

    timeline.discardBefore(0.02);
    REQUIRE(timeline.events().size() == 2);
    CHECK(timeline.events()[0].type == AutomationEventType::SetValue);
    CHECK(timeline.events()[0].time == 0.01);
    CHECK(timeline.events()[0].value == Approx(start));
    CHECK(timeline.events()[1].type == AutomationEventType::SetTarget);

    SECTION("repeating the cut changes nothing") {
        timeline.discardBefore(0.03);
        CHECK(timeline.events().size() == 2);
        CHECK(timeline.events()[0].value == Approx(start));
    }
}

TEST_CASE("AutomationTimeline discardBefore leaves future events alone", "[automation][compaction]") {
    AutomationTimeline timeline(0.3f);
    timeline.setValueAtTime(0.6f, 1.0);
    timeline.linearRampToValueAtTime(0.9f, 2.0);

    timeline.discardBefore(0.5);
    CHECK(timeline.events().size() == 2);
    CHECK(timeline.valueAt(0.5) == 0.3f);

    timeline.discardBefore(std::numeric_limits<double>::quiet_NaN());
    CHECK(timeline.events().size() == 2);
}

TEST_CASE("AutomationTimeline stays bounded under endless toggling", "[automation][compaction]") {
    constexpr double kTimeConstant = 0.01;
    AutomationTimeline timeline(1.0f);
    AutomationTimeline reference(1.0f);

    double now = 0.0;
    for (int i = 0; i < 1000; ++i) {
        const float target = (i % 2 == 0) ? 0.0f : 1.0f;
        timeline.setTargetAtTime(target, now, kTimeConstant);
        reference.setTargetAtTime(target, now, kTimeConstant);
        now += 0.003;
        timeline.discardBefore(now);
    }

    CHECK(timeline.events().size() <= 2);
    CHECK(reference.events().size() == 1000);
    CHECK(timeline.valueAt(now) == Approx(reference.valueAt(now)).margin(1e-5f));
    CHECK(timeline.valueAt(now + 0.05) == Approx(reference.valueAt(now + 0.05)).margin(1e-5f));
}

TEST_CASE("AutomationTimeline keeps events sorted and stable", "[automation]") {
    AutomationTimeline timeline;
    timeline.setValueAtTime(3.0f, 3.0);
    timeline.setValueAtTime(1.0f, 1.0);
    timeline.setValueAtTime(2.0f, 2.0);
    timeline.setValueAtTime(4.0f, 2.0);  // same time, inserted later

    const auto& events = timeline.events();
    REQUIRE(events.size() == 4);
    CHECK(events[0].time == 1.0);
    CHECK(events[1].value == 2.0f);
    CHECK(events[2].value == 4.0f);
    CHECK(events[3].time == 3.0);

    CHECK(timeline.valueAt(2.5) == 4.0f);
}

TEST_CASE("AutomationTimeline cancelScheduledValues drops later events", "[automation]") {
    AutomationTimeline timeline(0.0f);
    timeline.setValueAtTime(1.0f, 1.0);
    timeline.setValueAtTime(2.0f, 2.0);
    timeline.setValueAtTime(3.0f, 3.0);

    timeline.cancelScheduledValues(2.0);
    REQUIRE(timeline.events().size() == 1);
    CHECK(timeline.valueAt(10.0) == 1.0f);

    SECTION("NaN cancel time is ignored") {
        timeline.cancelScheduledValues(std::numeric_limits<double>::quiet_NaN());
        CHECK(timeline.events().size() == 1);
    }

    SECTION("clear removes everything") {
        timeline.clear();
        CHECK(timeline.empty());
        CHECK(timeline.valueAt(10.0) == 0.0f);
    }
}

TEST_CASE("AutomationTimeline rejects and sanitises bad input", "[automation][edge]") {
    constexpr float nanF = std::numeric_limits<float>::quiet_NaN();
    constexpr double infD = std::numeric_limits<double>::infinity();

    AutomationTimeline timeline(0.5f);
    CHECK_FALSE(timeline.setValueAtTime(nanF, 1.0));
    CHECK_FALSE(timeline.linearRampToValueAtTime(1.0f, infD));
    CHECK_FALSE(timeline.exponentialRampToValueAtTime(nanF, 1.0));
    CHECK_FALSE(timeline.setTargetAtTime(1.0f, 0.0, infD));
    CHECK(timeline.empty());

    SECTION("negative times clamp to zero") {
        REQUIRE(timeline.setValueAtTime(1.0f, -5.0));
        CHECK(timeline.events()[0].time == 0.0);
        CHECK(timeline.valueAt(0.0) == 1.0f);
    }

    SECTION("non-positive time constant degenerates to a step") {
        REQUIRE(timeline.setTargetAtTime(0.0f, 1.0, 0.0));
        CHECK(timeline.events()[0].type == AutomationEventType::SetValue);
        CHECK(timeline.valueAt(1.0) == 0.0f);
    }
}

TEST_CASE("AutomationTimeline fill matches valueAt sample by sample", "[automation]") {
    AutomationTimeline timeline;
    timeline.setValueAtTime(0.3f, 0.0);
    timeline.exponentialRampToValueAtTime(0.001f, 0.05);

    constexpr double kRate = 44100.0;
    std::vector<float> values(4096);
    timeline.fill(0, kRate, values.data(), values.size());

    for (size_t i = 0; i < values.size(); i += 97) {
        REQUIRE(values[i] == timeline.valueAt(static_cast<double>(i) / kRate));
    }

    SECTION("split fills are identical to one fill") {
        std::vector<float> split(4096);
        timeline.fill(0, kRate, split.data(), 1000);
        timeline.fill(1000, kRate, split.data() + 1000, 3096);
        REQUIRE(split == values);
    }

    SECTION("empty timeline fills the intrinsic value") {
        AutomationTimeline flat(0.7f);
        std::vector<float> out(64, 0.0f);
        flat.fill(123, kRate, out.data(), out.size());
        REQUIRE(out == std::vector<float>(64, 0.7f));
    }
}
