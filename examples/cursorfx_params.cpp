// Dump per-frame render parameters of a recording as CSV.
//
//   cursorfx_params recording.json [engine.json] > frames.csv

#include <cursorfx/cursorfx.hpp>

#include <cstdio>
#include <iostream>
#include <string>

using namespace cursorfx;

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <recording.json> [engine.json]\n";
        return 1;
    }

    // Console sink writes to stderr; stdout carries the CSV.
    Logger::instance().set_level(LogLevel::Warning);
    Logger::instance().add_sink(sinks::console_sink());

    EngineConfig config;
    const std::string config_path = argc > 2 ? argv[2] : EngineConfig::default_path();
    if (!config.load(config_path) && argc > 2)
        CURSORFX_LOG_WARN("example", "Using default engine config");

    auto meta = load_metadata(argv[1]);
    if (!meta)
    {
        CURSORFX_LOG_ERROR("example", "Cannot read recording metadata from {}", argv[1]);
        return 1;
    }

    FrameEvaluator eval(EvaluationMode::Export, config);
    eval.load(std::move(*meta));

    std::printf("frame,time_ms,cursor_x,cursor_y,size,shape,scale,visible,"
                "zoom_cx,zoom_cy,zoom_level,crop_w,crop_h\n");
    for (size_t i = 0; i < eval.frame_count(); ++i)
    {
        const auto p = eval.evaluate_frame(i);
        std::printf("%zu,%.3f,", i, p.timestamp);
        if (p.cursor)
        {
            std::printf("%.3f,%.3f,%.2f,%s,%.4f,%d,",
                        p.cursor->x,
                        p.cursor->y,
                        p.cursor->size,
                        cursor_shape_name(p.cursor->shape),
                        p.cursor->scale,
                        p.cursor->visible ? 1 : 0);
        }
        else
        {
            std::printf(",,,,,0,");
        }
        std::printf("%.3f,%.3f,%.4f,%.3f,%.3f\n",
                    p.zoom.center_x,
                    p.zoom.center_y,
                    p.zoom.level,
                    p.zoom.crop_width,
                    p.zoom.crop_height);
    }
    return 0;
}
