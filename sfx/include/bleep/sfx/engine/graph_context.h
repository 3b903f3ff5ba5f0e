// ==============================================================================
// Layer 3: Engine - Graph Context
// ==============================================================================
// Lazily created host context plus the master gain every cue feeds.
//
//   cue voices -> masterGain -> context.destination()
//
// Nothing touches the host until ensure() is first called. A suspended
// context gets one resume request at a time; completion is never awaited.
// A host that cannot provide a context is asked once, after which the
// GraphContext stays unavailable for its lifetime.
// ==============================================================================

#pragma once

#include <bleep/sfx/graph/audio_graph.h>

#include <atomic>
#include <memory>

namespace Bleep {
namespace Sfx {

class GraphContext {
public:
    /// @param host Non-owning; may be nullptr (sound permanently disabled).
    explicit GraphContext(AudioGraphHost* host) noexcept;
    ~GraphContext();

    GraphContext(const GraphContext&) = delete;
    GraphContext& operator=(const GraphContext&) = delete;

    /// @brief Create the context on first use, and resume it if suspended.
    /// @param initialGain Master gain value applied when the context is created
    /// @return true when context() and masterGain() are usable
    bool ensure(float initialGain);

    [[nodiscard]] bool ready() const noexcept { return context_ != nullptr; }
    [[nodiscard]] bool unavailable() const noexcept { return unavailable_; }

    [[nodiscard]] AudioContext* context() const noexcept { return context_.get(); }
    [[nodiscard]] GainNode* masterGain() const noexcept { return masterGain_.get(); }

    /// @brief True while a resume request awaits its completion.
    [[nodiscard]] bool resumePending() const noexcept { return resumePending_->load(); }

private:
    bool create(float initialGain);
    void resumeIfSuspended();
    void disable(const char* reason);

    AudioGraphHost* host_;
    std::unique_ptr<AudioContext> context_;
    std::shared_ptr<GainNode> masterGain_;
    // Shared with in-flight completion callbacks, which may outlive this object
    std::shared_ptr<std::atomic<bool>> resumePending_;
    bool unavailable_ = false;
};

} // namespace Sfx
} // namespace Bleep
