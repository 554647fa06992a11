#ifndef PAINTCORE_CORE_TYPES_H
#define PAINTCORE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants shared by every paintcore module.

// Capacity defaults
static constexpr std::size_t kHistoryCapacity = 50;
static constexpr std::uint32_t kDefaultCanvasWidth = 1024;
static constexpr std::uint32_t kDefaultCanvasHeight = 1024;
static constexpr std::uint64_t kDefaultMaxExportPixels = 64ull * 1024ull * 1024ull;
static constexpr std::size_t kStrokeReservePoints = 256;
static constexpr std::size_t kMaxStampsPerSegment = 4096;
static constexpr std::size_t kMaxSmoothingWindow = 8;
static constexpr std::size_t kMaxRecentColors = 20;

// View limits
static constexpr float kMinZoom = 0.1f;
static constexpr float kMaxZoom = 5.0f;

// Input defaults
static constexpr float kDefaultPressure = 0.5f;
static constexpr float kMaxTiltDegrees = 90.0f;
static constexpr float kMinStampSpacingPx = 0.5f;
static constexpr float kVelocitySaturationPxPerSec = 2000.0f;
static constexpr float kPredictionVelocityScale = 0.5f;
static constexpr float kPredictionPressureScale = 0.8f;
static constexpr std::uint64_t kPredictionLeadMs = 16;

// Snapshot format constants
static constexpr std::uint32_t snapshotMagicPcsn = 0x4E534350; // "PCSN"
static constexpr std::uint32_t snapshotVersionPcsn = 2;
static constexpr std::size_t snapshotHeaderBytesPcsn = 4 * 4; // magic + version + sectionCount + reserved
static constexpr std::size_t snapshotSectionEntryBytes = 4 * 4; // tag + offset + size + crc32
static constexpr std::uint32_t brushMagicPcbr = 0x52424350; // "PCBR"
static constexpr std::uint32_t brushVersionPcbr = 1;
static constexpr std::size_t brushHeaderBytesPcbr = 4 * 4; // magic + version + payloadSize + crc32

// Raw input sample as delivered by the host.
struct PointerSample {
    float x;
    float y;
    float pressure;
    float tiltX;
    float tiltY;
    std::uint64_t timestamp; // ms
    bool hasPressure;
};

// Sanitized, immutable stroke point.
struct SamplePoint {
    float x;
    float y;
    float pressure; // [0, 1]
    float tiltX;    // degrees, [-90, 90]
    float tiltY;
    std::uint64_t timestamp;
};

struct Point2 { float x, y; };

struct Bounds {
    float minX;
    float minY;
    float maxX;
    float maxY;
    bool valid;
};

struct ColorRGBA {
    float r, g, b, a;
};

enum class BrushCategory : std::uint8_t {
    Pencil = 0,
    Ink = 1,
    Paint = 2,
    Watercolor = 3,
    Airbrush = 4,
    Marker = 5,
    Texture = 6,
    Eraser = 7,
};

enum class BlendMode : std::uint8_t {
    Normal = 0,
    Multiply = 1,
    Screen = 2,
    Overlay = 3,
    Darken = 4,
    Lighten = 5,
    ColorDodge = 6,
    ColorBurn = 7,
    HardLight = 8,
    SoftLight = 9,
};

static constexpr std::uint8_t kBlendModeCount = 10;

enum class LayerKind : std::uint8_t {
    Raster = 0,
    Vector = 1,
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    InvalidArgument = 5,
    LayerLocked = 6,
    LayerNotFound = 7,
    LastLayer = 8,
    InvalidPermutation = 9,
    InvalidBrush = 10,
    ExportFailed = 11,
    NoActiveStroke = 12,
    StorageFailed = 13,
};

const char* engineErrorName(EngineError err) noexcept;

#endif // PAINTCORE_CORE_TYPES_H
