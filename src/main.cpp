/**
 * @file main.cpp
 * @brief Pursuit simulator entry point
 *
 * Drives the tracking pipeline with a synthetic detection stream:
 * - A target box moving on a Lissajous path in model space
 * - A stationary box over the screen center standing in for the subject
 *   itself, which the selector must ignore
 * The simulated cursor is advanced by each tick's movement.
 */

#include "pursuit/core/config.hpp"
#include "pursuit/core/coordinate.hpp"
#include "pursuit/core/logger.hpp"
#include "pursuit/core/types.hpp"
#include "pursuit/guidance/tracking_pipeline.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true, std::memory_order_release);
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Path to configuration file (default: config/default.yaml)\n"
              << "  --help             Show this help message\n"
              << "  --version          Show version information\n"
              << "\n"
              << "Configuration can also be overridden via command line:\n"
              << "  --controller.kp=0.2\n"
              << "  --controller.max_speed=40\n"
              << "  --sim.ticks=600\n"
              << "  --logging.level=debug\n"
              << std::endl;
}

void print_version() {
    std::cout << "Pursuit Tracking Simulator v1.0.0\n"
              << "Build type: "
#ifdef NDEBUG
              << "Release"
#else
              << "Debug"
#endif
              << std::endl;
}

/**
 * @brief Synthetic detector output for one tick, model coordinates
 */
pursuit::Detections synthesize_detections(uint64_t tick, const pursuit::Size2D& model) {
    using namespace pursuit;

    const float t = static_cast<float>(tick) * 0.02f;
    const float cx = model.width * (0.5f + 0.35f * std::sin(1.3f * t));
    const float cy = model.height * (0.5f + 0.30f * std::sin(2.1f * t + 0.7f));
    const float half_w = model.width * 0.025f;
    const float half_h = model.height * 0.08f;

    Detections dets;
    dets.push_back(BoundingBox{cx - half_w, cy - half_h, cx + half_w, cy + half_h, 0.87f, 0});

    // Subject's own box around the center of the surface
    const Point2D c = surface_center(model);
    dets.push_back(BoundingBox{c.x - half_w, c.y - half_h, c.x + half_w, c.y + half_h, 0.95f, 0});

    return dets;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace pursuit;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        }
    }

    // Load configuration before logging so logging.* keys apply
    Config& config = global_config();

    std::string config_path = "config/default.yaml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        }
    }

    bool config_loaded = config.load(config_path);
    config.parse_args(argc, argv);

    LogLevel level = log_level_from_string(config.get_string("logging.level", "info"));
    if (!Logger::init(config.get_string("logging.file", ""), level, LogLevel::DEBUG)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    if (!config_loaded) {
        LOG_ERROR("Failed to load configuration from: {}", config_path);
        Logger::shutdown();
        return 1;
    }

    LOG_INFO("=== Pursuit Tracking Simulator Starting ===");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto pipeline = create_tracking_pipeline(config);
    bind_controller_params(config, pipeline->controller());

    const PipelineConfig pc = load_pipeline_config(config);
    const int total_ticks = config.get_int("sim.ticks", 300);
    const int engage_tick = config.get_int("sim.engage_tick", 10);
    const float dt = config.get_float("sim.dt", 1.0f);
    const float fps = config.get_float("sim.fps", 0.0f);

    Point2D cursor{config.get_float("sim.cursor_x", 0.0f),
                   config.get_float("sim.cursor_y", 0.0f)};

    LOG_INFO("Simulating {} ticks, engaging at tick {}", total_ticks, engage_tick);

    float error_sum = 0.0f;
    uint64_t error_samples = 0;

    for (int tick = 0; tick < total_ticks; ++tick) {
        if (g_shutdown_requested.load(std::memory_order_acquire)) {
            LOG_INFO("Shutdown signal received");
            break;
        }

        auto loop_start = Clock::now();

        if (tick == engage_tick && !pipeline->is_enabled()) {
            pipeline->set_enabled(true);
        }

        auto dets = synthesize_detections(static_cast<uint64_t>(tick), pc.model_size);
        TickResult result = pipeline->tick(dets, cursor, dt);

        cursor = cursor + result.movement;

        if (result.target) {
            float err = distance(result.target->center(), cursor);
            if (pipeline->is_enabled()) {
                error_sum += err;
                ++error_samples;
            }
            LOG_DEBUG("tick={} target=({:.1f}, {:.1f}) cursor=({:.1f}, {:.1f}) move=({:.2f}, {:.2f}) "
                      "error={:.1f} phase={}",
                      tick, result.target->center_x(), result.target->center_y(),
                      cursor.x, cursor.y, result.movement.x, result.movement.y,
                      err, to_string(pipeline->controller().phase()));
        } else {
            LOG_DEBUG("tick={} no target ({} detections)", tick, result.screen_detections.size());
        }

        if (fps > 0.0f) {
            auto interval = std::chrono::duration<float>(1.0f / fps);
            auto elapsed = Clock::now() - loop_start;
            if (elapsed < interval) {
                std::this_thread::sleep_for(interval - elapsed);
            }
        }
    }

    const PipelineStats& stats = pipeline->stats();
    LOG_INFO("Ticks: {}, with target: {}, engaged: {}, moved: {}, detections: {}",
             stats.ticks, stats.ticks_with_target, stats.ticks_engaged,
             stats.ticks_moved, stats.total_detections);
    if (error_samples > 0) {
        LOG_INFO("Mean tracking error while engaged: {:.2f} px",
                 error_sum / static_cast<float>(error_samples));
    }

    Logger::flush();
    Logger::shutdown();

    std::cout << "Pursuit simulator stopped." << std::endl;
    return 0;
}
