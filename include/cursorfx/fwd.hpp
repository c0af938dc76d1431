#pragma once

#include <cstdint>

namespace cursorfx
{

struct Vec2;
struct VideoSize;

struct CursorKeyframe;
struct ZoomKeyframe;
struct ZoomSection;
struct ZoomRegion;
struct ClickEvent;
struct MouseEvent;

template <typename K>
class KeyframeTrack;

struct CursorState;
class MotionSmoother;
class ShapeStabilizer;
class CursorVisibilityTracker;

struct CursorConfig;
struct ZoomConfig;
struct EngineConfig;
struct ClickPulseConfig;
struct VisibilityConfig;
struct MouseEffectsConfig;
enum class AnimationStyle : uint8_t;

class ZoomPathGenerator;
struct RecordedTrack;

struct VideoInfo;
struct RecordingMetadata;
class MetadataDocument;

struct CursorFrame;
struct FrameParams;
class FrameEvaluator;

class Logger;

}   // namespace cursorfx
