#pragma once

#include "paintcore/brush/brush.h"
#include "paintcore/brush/brush_library.h"
#include "paintcore/core/color.h"
#include "paintcore/core/types.h"
#include "paintcore/engine.h"
#include "paintcore/history/history_manager.h"
#include "paintcore/layer/layer_store.h"
#include "paintcore/perf/quality_controller.h"
#include "paintcore/protocol/events.h"
#include "paintcore/render/canvas_snapshot.h"
#include "paintcore/stroke/stroke_capture.h"

#include <cstdint>

struct EngineState {
    explicit EngineState(const EngineConfig& cfg);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    EngineConfig config;

    LayerStore layerStore;
    HistoryManager historyManager;
    BrushLibrary brushLibrary;
    StrokeCapture capture;
    QualityController quality;
    EventRegistry events;

    Brush activeBrush;
    ColorRGBA color{0.0f, 0.0f, 0.0f, 1.0f};
    paintcore::RecentColors recentColors;
    ViewState view{};
    std::uint32_t nextStrokeId{1};
    double strokeStartMs{0.0};

    mutable EngineError lastError{EngineError::Ok};
};
