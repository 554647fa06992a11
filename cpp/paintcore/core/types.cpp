#include "paintcore/core/types.h"

const char* engineErrorName(EngineError err) noexcept {
    switch (err) {
        case EngineError::Ok: return "Ok";
        case EngineError::InvalidMagic: return "InvalidMagic";
        case EngineError::UnsupportedVersion: return "UnsupportedVersion";
        case EngineError::BufferTruncated: return "BufferTruncated";
        case EngineError::InvalidPayloadSize: return "InvalidPayloadSize";
        case EngineError::InvalidArgument: return "InvalidArgument";
        case EngineError::LayerLocked: return "LayerLocked";
        case EngineError::LayerNotFound: return "LayerNotFound";
        case EngineError::LastLayer: return "LastLayer";
        case EngineError::InvalidPermutation: return "InvalidPermutation";
        case EngineError::InvalidBrush: return "InvalidBrush";
        case EngineError::ExportFailed: return "ExportFailed";
        case EngineError::NoActiveStroke: return "NoActiveStroke";
        case EngineError::StorageFailed: return "StorageFailed";
    }
    return "Unknown";
}
