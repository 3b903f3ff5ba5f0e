// ==============================================================================
// Layer 2: Graph - Offline Audio Context
// ==============================================================================
// A complete AudioGraphHost that renders the node graph into caller-provided
// buffers instead of a sound device. Used by the render tool to bounce every
// cue to disk and by tests to check what the engine actually produces.
//
// Behaviour:
// - Mono output, pulled in 128-frame quanta
// - currentTime() advances only while Running and only through render()
// - resume() completions are delivered at the start of the next render()
// - Finished nodes are released after each quantum
//
// Single-threaded: render() and all graph calls must come from one thread.
// ==============================================================================

#pragma once

#include <bleep/sfx/graph/audio_graph.h>
#include <bleep/sfx/graph/offline_nodes.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace Bleep {
namespace Sfx {

// =============================================================================
// Options
// =============================================================================

/// @brief Configuration of an offline context.
struct OfflineContextOptions {
    float sampleRate = 44100.0f;    ///< Render rate in Hz (non-positive -> 44100)
    bool startSuspended = false;    ///< Start in Suspended, like a device awaiting a gesture
    bool allowResume = true;        ///< Whether resume() requests succeed
};

// =============================================================================
// OfflineAudioContext
// =============================================================================

/// @brief AudioContext rendered on demand.
///
/// @par Usage
/// @code
/// OfflineAudioContext context;
/// auto osc = context.createOscillator();
/// osc->connect(context.destination());
/// osc->start(0.0);
/// osc->stop(0.5);
/// std::vector<float> out = context.renderSeconds(0.5);
/// @endcode
class OfflineAudioContext final : public AudioContext {
public:
    explicit OfflineAudioContext(const OfflineContextOptions& options = {});
    ~OfflineAudioContext() override;

    OfflineAudioContext(const OfflineAudioContext&) = delete;
    OfflineAudioContext& operator=(const OfflineAudioContext&) = delete;

    // =========================================================================
    // AudioContext
    // =========================================================================

    [[nodiscard]] double currentTime() const override;
    [[nodiscard]] float sampleRate() const override;
    [[nodiscard]] ContextState state() const override { return state_; }
    void resume(ResumeCallback onComplete) override;
    [[nodiscard]] AudioNode& destination() override;

    [[nodiscard]] std::shared_ptr<GainNode> createGain() override;
    [[nodiscard]] std::shared_ptr<OscillatorNode> createOscillator() override;
    [[nodiscard]] std::shared_ptr<BufferSourceNode> createBufferSource() override;
    [[nodiscard]] std::shared_ptr<BiquadFilterNode> createBiquadFilter() override;
    [[nodiscard]] std::shared_ptr<AudioBuffer> createBuffer(
        size_t numChannels, size_t length, float sampleRate) override;

    // =========================================================================
    // Rendering
    // =========================================================================

    /// @brief Render numFrames mono samples into output.
    ///
    /// Delivers pending resume completions first. A context that is not
    /// Running writes silence and leaves the clock untouched.
    void render(float* output, size_t numFrames);

    /// @brief Convenience wrapper: render a duration into a new buffer.
    [[nodiscard]] std::vector<float> renderSeconds(double seconds);

    /// @brief Move to Suspended (no effect once closed).
    void suspend() noexcept;

    /// @brief Move to Closed permanently. Pending resumes then fail.
    void close() noexcept;

    // =========================================================================
    // Introspection
    // =========================================================================

    /// @brief Distinct nodes still reachable upstream of the destination.
    [[nodiscard]] size_t connectedNodeCount() const;

    /// @brief Total frames rendered while Running.
    [[nodiscard]] size_t framesRendered() const noexcept;

    /// @brief Resume requests received so far.
    [[nodiscard]] size_t resumeRequests() const noexcept { return resumeRequests_; }

private:
    void deliverPendingResumes();

    std::shared_ptr<detail::RenderClock> clock_;
    std::shared_ptr<detail::OfflineDestinationNode> destination_;
    std::vector<ResumeCallback> pendingResumes_;
    ContextState state_;
    bool allowResume_;
    size_t resumeRequests_ = 0;
};

// =============================================================================
// OfflineGraphHost
// =============================================================================

/// @brief AudioGraphHost producing OfflineAudioContexts.
class OfflineGraphHost final : public AudioGraphHost {
public:
    explicit OfflineGraphHost(const OfflineContextOptions& options = {}) noexcept
        : options_(options) {}

    [[nodiscard]] std::unique_ptr<AudioContext> createContext() override;

    /// @brief Simulate a machine without audio: createContext() returns nullptr.
    void setAvailable(bool available) noexcept { available_ = available; }

    /// @brief Most recently created context (non-owning; valid while its owner keeps it).
    [[nodiscard]] OfflineAudioContext* context() const noexcept { return lastContext_; }

    [[nodiscard]] size_t contextsCreated() const noexcept { return contextsCreated_; }
    [[nodiscard]] const OfflineContextOptions& options() const noexcept { return options_; }

private:
    OfflineContextOptions options_;
    OfflineAudioContext* lastContext_ = nullptr;
    size_t contextsCreated_ = 0;
    bool available_ = true;
};

} // namespace Sfx
} // namespace Bleep
