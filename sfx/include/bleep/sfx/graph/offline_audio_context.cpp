// ==============================================================================
// Offline Audio Context Implementation
// ==============================================================================

#include "offline_audio_context.h"

#include <bleep/sfx/core/logging.h>
#include <bleep/sfx/core/time_utils.h>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace Bleep {
namespace Sfx {

namespace {

constexpr float kFallbackSampleRate = 44100.0f;

} // namespace

// =============================================================================
// OfflineAudioContext
// =============================================================================

OfflineAudioContext::OfflineAudioContext(const OfflineContextOptions& options)
    : clock_(std::make_shared<detail::RenderClock>())
    , state_(options.startSuspended ? ContextState::Suspended : ContextState::Running)
    , allowResume_(options.allowResume) {
    const bool validRate = options.sampleRate > 0.0f && detail::isFinite(options.sampleRate);
    if (!validRate) {
        BLEEP_SFX_LOG_WARN("invalid sample rate %f, using %.0f Hz",
                           static_cast<double>(options.sampleRate),
                           static_cast<double>(kFallbackSampleRate));
    }
    clock_->sampleRate = static_cast<double>(validRate ? options.sampleRate : kFallbackSampleRate);
    destination_ = std::make_shared<detail::OfflineDestinationNode>(clock_);
}

OfflineAudioContext::~OfflineAudioContext() = default;

double OfflineAudioContext::currentTime() const {
    return clock_->currentTime();
}

float OfflineAudioContext::sampleRate() const {
    return static_cast<float>(clock_->sampleRate);
}

void OfflineAudioContext::resume(ResumeCallback onComplete) {
    ++resumeRequests_;
    pendingResumes_.push_back(std::move(onComplete));
}

AudioNode& OfflineAudioContext::destination() {
    return *destination_;
}

std::shared_ptr<GainNode> OfflineAudioContext::createGain() {
    return std::make_shared<detail::OfflineGainNode>(clock_);
}

std::shared_ptr<OscillatorNode> OfflineAudioContext::createOscillator() {
    return std::make_shared<detail::OfflineOscillatorNode>(clock_);
}

std::shared_ptr<BufferSourceNode> OfflineAudioContext::createBufferSource() {
    return std::make_shared<detail::OfflineBufferSourceNode>(clock_);
}

std::shared_ptr<BiquadFilterNode> OfflineAudioContext::createBiquadFilter() {
    return std::make_shared<detail::OfflineBiquadFilterNode>(clock_);
}

std::shared_ptr<AudioBuffer> OfflineAudioContext::createBuffer(
    size_t numChannels, size_t length, float sampleRate) {
    return std::make_shared<AudioBuffer>(numChannels, length, sampleRate);
}

void OfflineAudioContext::render(float* output, size_t numFrames) {
    deliverPendingResumes();

    if (state_ != ContextState::Running) {
        std::fill(output, output + numFrames, 0.0f);
        return;
    }

    size_t done = 0;
    while (done < numFrames) {
        const size_t frames = std::min(kRenderQuantumFrames, numFrames - done);
        clock_->quantumFrames = frames;
        ++clock_->quantumIndex;

        const float* mixed = destination_->pull();
        std::copy(mixed, mixed + frames, output + done);

        clock_->framesRendered += frames;
        destination_->prune(clock_->currentTime());
        done += frames;
    }
}

std::vector<float> OfflineAudioContext::renderSeconds(double seconds) {
    std::vector<float> output(secondsToFrames(seconds, clock_->sampleRate), 0.0f);
    render(output.data(), output.size());
    return output;
}

void OfflineAudioContext::suspend() noexcept {
    if (state_ != ContextState::Closed) {
        state_ = ContextState::Suspended;
    }
}

void OfflineAudioContext::close() noexcept {
    state_ = ContextState::Closed;
}

size_t OfflineAudioContext::connectedNodeCount() const {
    std::unordered_set<const detail::RenderNode*> seen;
    destination_->collectUpstream(seen);
    return seen.size();
}

size_t OfflineAudioContext::framesRendered() const noexcept {
    return clock_->framesRendered;
}

void OfflineAudioContext::deliverPendingResumes() {
    if (pendingResumes_.empty()) {
        return;
    }
    // Callbacks may issue new requests; those wait for the following render
    std::vector<ResumeCallback> pending;
    pending.swap(pendingResumes_);

    for (auto& callback : pending) {
        bool resumed = false;
        const char* reason = "";
        if (state_ == ContextState::Closed) {
            reason = "context is closed";
        } else if (!allowResume_) {
            reason = "resume not allowed";
        } else {
            state_ = ContextState::Running;
            resumed = true;
        }
        if (callback) {
            callback(resumed, reason);
        }
    }
}

// =============================================================================
// OfflineGraphHost
// =============================================================================

std::unique_ptr<AudioContext> OfflineGraphHost::createContext() {
    if (!available_) {
        return nullptr;
    }
    auto context = std::make_unique<OfflineAudioContext>(options_);
    lastContext_ = context.get();
    ++contextsCreated_;
    return context;
}

} // namespace Sfx
} // namespace Bleep
