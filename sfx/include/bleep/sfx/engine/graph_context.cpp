// ==============================================================================
// Graph Context Implementation
// ==============================================================================

#include "graph_context.h"

#include <bleep/sfx/core/logging.h>

#include <exception>
#include <string_view>
#include <utility>

namespace Bleep {
namespace Sfx {

GraphContext::GraphContext(AudioGraphHost* host) noexcept
    : host_(host)
    , resumePending_(std::make_shared<std::atomic<bool>>(false)) {}

GraphContext::~GraphContext() = default;

bool GraphContext::ensure(float initialGain) {
    if (unavailable_) {
        return false;
    }
    if (!context_ && !create(initialGain)) {
        return false;
    }
    resumeIfSuspended();
    return true;
}

bool GraphContext::create(float initialGain) {
    if (host_ == nullptr) {
        disable("no audio host");
        return false;
    }

    std::unique_ptr<AudioContext> context;
    try {
        context = host_->createContext();
    } catch (const std::exception& e) {
        BLEEP_SFX_LOG_WARN("audio context creation threw: %s", e.what());
        disable("context creation failed");
        return false;
    }
    if (!context) {
        disable("host provided no audio context");
        return false;
    }

    std::shared_ptr<GainNode> master;
    try {
        master = context->createGain();
        if (master) {
            master->gain().setValue(initialGain);
            master->connect(context->destination());
        }
    } catch (const std::exception& e) {
        BLEEP_SFX_LOG_WARN("master gain setup threw: %s", e.what());
        disable("master gain setup failed");
        return false;
    }
    if (!master) {
        disable("host provided no master gain");
        return false;
    }

    BLEEP_SFX_LOG_INFO("audio context created (%.0f Hz)", static_cast<double>(context->sampleRate()));
    context_ = std::move(context);
    masterGain_ = std::move(master);
    return true;
}

void GraphContext::resumeIfSuspended() {
    if (context_->state() != ContextState::Suspended) {
        return;
    }
    if (resumePending_->exchange(true)) {
        return;
    }

    auto pending = resumePending_;
    try {
        context_->resume([pending](bool resumed, std::string_view reason) {
            pending->store(false);
            if (!resumed) {
                BLEEP_SFX_LOG_WARN("audio context resume failed: %.*s",
                                   static_cast<int>(reason.size()), reason.data());
            }
        });
    } catch (const std::exception& e) {
        resumePending_->store(false);
        BLEEP_SFX_LOG_WARN("audio context resume request threw: %s", e.what());
    }
}

void GraphContext::disable(const char* reason) {
    unavailable_ = true;
    BLEEP_SFX_LOG_WARN("%s; sound effects disabled", reason);
}

} // namespace Sfx
} // namespace Bleep
