#pragma once

#include <cursorfx/click_pulse.hpp>
#include <cursorfx/config.hpp>
#include <cursorfx/cursor_visibility.hpp>
#include <cursorfx/easing.hpp>
#include <cursorfx/frame_evaluator.hpp>
#include <cursorfx/fwd.hpp>
#include <cursorfx/interpolator.hpp>
#include <cursorfx/keyframe.hpp>
#include <cursorfx/keyframe_generator.hpp>
#include <cursorfx/logger.hpp>
#include <cursorfx/metadata.hpp>
#include <cursorfx/motion_smoother.hpp>
#include <cursorfx/shape_stabilizer.hpp>
#include <cursorfx/timeline.hpp>
#include <cursorfx/zoom_path.hpp>

// ─── Quick start ────────────────────────────────────────────────────────────
//
//   auto meta = cursorfx::load_metadata("recording.json");
//   cursorfx::FrameEvaluator eval(cursorfx::EvaluationMode::Export);
//   eval.load(*meta);
//   for (size_t i = 0; i < eval.frame_count(); ++i)
//       draw(eval.evaluate_frame(i));
