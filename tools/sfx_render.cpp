// ==============================================================================
// SFX Render Tool
// ==============================================================================
// Bounces every game cue to a 16-bit mono WAV file through the offline host.
// Useful for auditioning recipe changes without running the game.
//
// Usage:
//   bleep_sfx_render <outputDir> [--level N] [--lines N] [--sample-rate HZ]
//
// Writes <outputDir>/<event>.wav for each cue (rotate.wav, hard_drop.wav, ...).
// ==============================================================================

#include <bleep/sfx/engine/sfx_event.h>
#include <bleep/sfx/engine/sound_engine.h>
#include <bleep/sfx/graph/offline_audio_context.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

namespace {

using namespace Bleep::Sfx;

/// Longest cue is ~1 s; anything past this is a stuck voice
constexpr double kMaxRenderSeconds = 5.0;

/// Silence kept after the last voice ends
constexpr double kTailSeconds = 0.05;

constexpr size_t kBlockFrames = 1024;

struct RenderOptions {
    std::filesystem::path outputDir;
    EffectParams params{1, 4};
    float sampleRate = 44100.0f;
};

void printUsage() {
    std::cerr << "Usage: bleep_sfx_render <outputDir> [--level N] [--lines N] [--sample-rate HZ]\n";
}

// ==============================================================================
// Argument Parsing
// ==============================================================================

bool parseArguments(int argc, char* argv[], RenderOptions& options) {
    if (argc < 2) {
        return false;
    }
    options.outputDir = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return false;
        }
        const std::string value = argv[++i];
        try {
            if (flag == "--level") {
                options.params.level = std::stoi(value);
            } else if (flag == "--lines") {
                options.params.lineCount = std::stoi(value);
            } else if (flag == "--sample-rate") {
                options.sampleRate = std::stof(value);
                if (!(options.sampleRate >= 8000.0f && options.sampleRate <= 192000.0f)) {
                    std::cerr << "Sample rate out of range: " << value << "\n";
                    return false;
                }
            } else {
                std::cerr << "Unknown option: " << flag << "\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << flag << ": " << value << "\n";
            return false;
        }
    }
    return true;
}

// ==============================================================================
// Rendering
// ==============================================================================

/// Render until every cue voice has been released (only the master gain is left)
std::vector<float> renderCue(SfxEvent event, const RenderOptions& options) {
    OfflineContextOptions contextOptions;
    contextOptions.sampleRate = options.sampleRate;
    OfflineGraphHost host(contextOptions);
    SoundEngine engine(&host);

    engine.play(event, options.params);

    std::vector<float> samples;
    OfflineAudioContext* context = host.context();
    if (context == nullptr) {
        return samples;
    }

    std::vector<float> block(kBlockFrames);
    while (context->currentTime() < kMaxRenderSeconds) {
        context->render(block.data(), block.size());
        samples.insert(samples.end(), block.begin(), block.end());
        if (context->connectedNodeCount() <= 1) {
            break;
        }
    }

    const auto tail = static_cast<size_t>(kTailSeconds * options.sampleRate);
    std::vector<float> silence(tail);
    context->render(silence.data(), silence.size());
    samples.insert(samples.end(), silence.begin(), silence.end());
    return samples;
}

// ==============================================================================
// WAV Output
// ==============================================================================

bool writeWav16(const std::filesystem::path& path, const std::vector<float>& samples, uint32_t sampleRate) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return false;
    }

    constexpr uint16_t kChannels = 1;
    constexpr uint16_t kBitsPerSample = 16;
    const auto dataBytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t byteRate = sampleRate * kChannels * (kBitsPerSample / 8);
    const auto blockAlign = static_cast<uint16_t>(kChannels * (kBitsPerSample / 8));

    auto writeTag = [&](const char (&tag)[5]) { out.write(tag, 4); };
    auto writeLe = [&](auto value) {
        using U = std::make_unsigned_t<std::decay_t<decltype(value)>>;
        const auto v = static_cast<U>(value);
        for (size_t i = 0; i < sizeof(U); ++i) {
            out.put(static_cast<char>((v >> (8u * i)) & 0xFFu));
        }
    };

    writeTag("RIFF");
    writeLe(static_cast<uint32_t>(36u + dataBytes));
    writeTag("WAVE");
    writeTag("fmt ");
    writeLe(static_cast<uint32_t>(16u));
    writeLe(static_cast<uint16_t>(1u));  // PCM
    writeLe(kChannels);
    writeLe(sampleRate);
    writeLe(byteRate);
    writeLe(blockAlign);
    writeLe(kBitsPerSample);
    writeTag("data");
    writeLe(dataBytes);

    for (float sample : samples) {
        const float clamped = std::clamp(sample, -1.0f, 1.0f);
        writeLe(static_cast<int16_t>(std::lround(clamped * 32767.0f)));
    }
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[]) {
    RenderOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(options.outputDir, ec);
    if (ec) {
        std::cerr << "Cannot create " << options.outputDir << ": " << ec.message() << "\n";
        return 1;
    }

    std::cout << "Rendering cues to: " << options.outputDir << "\n";

    int failures = 0;
    for (SfxEvent event : kAllSfxEvents) {
        const auto samples = renderCue(event, options);
        const auto path = options.outputDir / (std::string(sfxEventName(event)) + ".wav");

        if (!writeWav16(path, samples, static_cast<uint32_t>(options.sampleRate))) {
            std::cerr << "Failed to write: " << path << "\n";
            ++failures;
            continue;
        }
        std::cout << "  " << path.filename().string() << " ("
                  << samples.size() << " frames)\n";
    }

    if (failures > 0) {
        return 1;
    }
    std::cout << "Done: " << kNumSfxEvents << " cues\n";
    return 0;
}
