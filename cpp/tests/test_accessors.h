#pragma once

#include "paintcore/engine.h"
#include "paintcore/internal/engine_state.h"

class PaintEngineTestAccessor {
public:
    static const LayerStore& layerStore(const PaintEngine& engine) {
        return engine.state().layerStore;
    }

    static const HistoryManager& historyManager(const PaintEngine& engine) {
        return engine.state().historyManager;
    }

    static const StrokeCapture& capture(const PaintEngine& engine) {
        return engine.state().capture;
    }

    static EngineError lastError(const PaintEngine& engine) {
        return engine.state().lastError;
    }

    static std::uint32_t nextStrokeId(const PaintEngine& engine) {
        return engine.state().nextStrokeId;
    }
};
