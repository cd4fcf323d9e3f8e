/**
 * RoboEyes - Eye Service (Linux)
 *
 * Standalone service for small-display robot eyes.
 * Reads newline-delimited JSON events on stdin.
 * Renders the eye pair at a fixed rate and hands frames to a sink.
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <getopt.h>

#include "config_store.hpp"
#include "error_handler.hpp"
#include "eye_animator.hpp"
#include "eye_command.hpp"
#include "eye_renderer.hpp"
#include "eye_sequence.hpp"
#include "event_line_buffer.hpp"
#include "logger.h"
#include "pnm_frame_sink.hpp"

extern "C" {
#include "eye_event_protocol.h"
#include "eye_limits.h"
}

#define DEFAULT_CONFIG_PATH "/etc/roboeyes/eyeconfig.json"
#define MACHINE_ID_PATH     "/etc/machine-id"

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

// FNV-1a over the machine id, so every unit gets its own stable face
static uint64_t machineSeed() {
    std::ifstream file(MACHINE_ID_PATH);
    std::string id;
    if (!file.is_open() || !std::getline(file, id) || id.empty()) {
        LOG_WARN(LOG_TAG_SERVICE, "No %s, using seed 0", MACHINE_ID_PATH);
        return 0;
    }

    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : id) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

static void handleEvent(const std::string &line, EyeAnimator &animator,
                        EyeSequencePlayer &player, ErrorHandler &errors) {
    EyeCommandParser::ParseResult parsed = EyeCommandParser::parse(line);
    if (!parsed.valid) {
        errors.report(EyeError::INVALID_COMMAND, parsed.error);
        return;
    }

    const EyeCommand &cmd = parsed.command;
    switch (cmd.type) {
        case CommandType::WAKEUP:
            player.start(makeWakeupSequence());
            return;
        case CommandType::STATUS:
            std::cout << statusToJson(animator.status()) << std::endl;
            return;
        default:
            break;
    }

    CommandResult result = applyCommand(animator, cmd);
    if (!result.ok) {
        errors.report(result, toString(cmd.type));
        return;
    }
    LOG_DEBUG(LOG_TAG_CMD, "%s accepted", toString(cmd.type));
}

static void printUsage(const char *progname) {
    std::cout << "Usage: " << progname << " [OPTIONS]\n"
              << "Options:\n"
              << "  --config PATH      Config file (default " DEFAULT_CONFIG_PATH ")\n"
              << "  --seed N           Appearance seed (default: config, then machine id)\n"
              << "  --frames PATH      Write the latest frame as PBM/PPM to PATH\n"
              << "  --fps N            Render rate (1-120)\n"
              << "  --skip-boot        Skip wake-up animation\n"
              << "  --save-unit        Persist the resolved eye appearance to the config\n"
              << "  --log-level L      debug, info, warn, error or off\n"
              << "  --log-file PATH    Also append log lines to PATH\n"
              << "  --help             Show this help\n";
}

int main(int argc, char *argv[]) {
    std::string configPath = DEFAULT_CONFIG_PATH;
    std::string framesPath;
    std::string logFile;
    bool skipBoot = false;
    bool saveUnit = false;
    bool haveSeed = false;
    uint64_t seedArg = 0;
    int fpsArg = 0;

    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"seed",      required_argument, 0, 'S'},
        {"frames",    required_argument, 0, 'o'},
        {"fps",       required_argument, 0, 'f'},
        {"skip-boot", no_argument,       0, 's'},
        {"save-unit", no_argument,       0, 'u'},
        {"log-level", required_argument, 0, 'l'},
        {"log-file",  required_argument, 0, 'L'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    char *end = nullptr;
    while ((opt = getopt_long(argc, argv, "c:S:o:f:sul:L:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                configPath = optarg;
                break;
            case 'S':
                errno = 0;
                seedArg = strtoull(optarg, &end, 0);
                if (errno != 0 || end == optarg || *end != '\0') {
                    std::cerr << "Invalid seed: " << optarg << std::endl;
                    return 1;
                }
                haveSeed = true;
                break;
            case 'o':
                framesPath = optarg;
                break;
            case 'f':
                fpsArg = static_cast<int>(strtol(optarg, &end, 10));
                if (end == optarg || *end != '\0' ||
                    fpsArg < ROBOEYES_RENDER_FPS_MIN || fpsArg > ROBOEYES_RENDER_FPS_MAX) {
                    std::cerr << "Invalid fps: " << optarg << std::endl;
                    return 1;
                }
                break;
            case 's':
                skipBoot = true;
                break;
            case 'u':
                saveUnit = true;
                break;
            case 'l':
                if (!Logger::instance().setLevel(std::string(optarg))) {
                    std::cerr << "Invalid log level: " << optarg << std::endl;
                    return 1;
                }
                break;
            case 'L':
                logFile = optarg;
                break;
            case 'h':
                printUsage(argv[0]);
                return 0;
            default:
                printUsage(argv[0]);
                return 1;
        }
    }

    if (!logFile.empty() && !Logger::instance().openFile(logFile)) {
        return 1;
    }

    LOG_INFO(LOG_TAG_SERVICE, "RoboEyes Eye Service starting...");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ErrorHandler errors;
    errors.setListener([](EyeError kind, const std::string &message) {
        if (kind != EyeError::INVALID_COMMAND) return;
        std::cout << errorToJson(kind, message) << std::endl;
    });

    // Configuration
    ConfigStore store;
    if (!store.load(configPath)) {
        LOG_INFO(LOG_TAG_SERVICE, "Using built-in configuration");
    }
    if (fpsArg > 0) store.fps = fpsArg;

    // Seed: --seed, then the config file, then the machine id
    uint64_t fallbackSeed = 0;
    if (!haveSeed && !store.seed) {
        fallbackSeed = machineSeed();
    }
    UnitConfig unit = store.unitConfig(fallbackSeed);
    if (haveSeed) unit.seed = seedArg;

    ResolveResult resolved = ConfigResolver::resolve(store.screen, store.eye, unit);
    if (resolved.clamped()) {
        errors.report(EyeError::CONFIG_OUT_OF_BOUNDS,
                      std::to_string(resolved.warnings.size()) + " value(s) clamped");
    }
    LOG_INFO(LOG_TAG_SERVICE, "Eyes from %s, seed %llu, %dx%d %s @ %d fps",
             toString(resolved.source), static_cast<unsigned long long>(resolved.config.seed),
             resolved.config.screen.width, resolved.config.screen.height,
             toString(resolved.config.screen.mode), store.fps);

    if (saveUnit && store.rejected()) {
        LOG_ERROR(LOG_TAG_SERVICE, "Not saving unit appearance: fix %s first", configPath.c_str());
    } else if (saveUnit) {
        store.setUnitOverride(ConfigResolver::toOverride(resolved.config));
        if (!store.save(configPath)) {
            LOG_ERROR(LOG_TAG_SERVICE, "Failed to persist unit appearance");
        }
    }

    // Output
    std::unique_ptr<FrameSink> sink;
    if (!framesPath.empty()) {
        sink = std::make_unique<PnmFrameSink>(framesPath, resolved.config.screen.rotate);
        if (!sink->init()) {
            LOG_ERROR(LOG_TAG_SERVICE, "Failed to initialize frame sink");
            return 1;
        }
    } else {
        LOG_INFO(LOG_TAG_SERVICE, "No --frames given, frames are not written");
    }

    EyeAnimator animator(resolved.config);
    EyeRenderer renderer(resolved.config);
    EyeSequencePlayer player(animator);
    Bitmap frame;
    bool sinkFailing = false;

    if (!skipBoot) {
        player.start(makeWakeupSequence());
    }

    bool stdinOpen = true;
    if (!setNonBlocking(STDIN_FILENO)) {
        LOG_ERROR(LOG_TAG_SERVICE, "Cannot make stdin non-blocking: %s", strerror(errno));
        stdinOpen = false;
    }
    EventLineBuffer lines(ROBOEYES_EVENT_MAX_SIZE);
    auto onLine = [&](const std::string &line) {
        handleEvent(line, animator, player, errors);
    };

    using Clock = std::chrono::steady_clock;
    const auto framePeriod = std::chrono::microseconds(1000000 / store.fps);
    auto lastTick = Clock::now();
    auto nextFrame = lastTick;

    while (!g_shutdown.load()) {
        // Drain whatever stdin has without blocking the frame loop
        while (stdinOpen) {
            char chunk[256];
            ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n > 0) {
                size_t dropped = lines.feed(chunk, static_cast<size_t>(n), onLine);
                for (size_t i = 0; i < dropped; i++) {
                    errors.report(EyeError::INVALID_COMMAND, "event too long, dropped");
                }
            } else if (n == 0) {
                LOG_INFO(LOG_TAG_SERVICE, "stdin closed, animation continues");
                stdinOpen = false;
            } else {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_ERROR(LOG_TAG_SERVICE, "stdin read error: %s", strerror(errno));
                    stdinOpen = false;
                }
                break;
            }
        }

        auto now = Clock::now();
        float dt = std::chrono::duration<float>(now - lastTick).count();
        lastTick = now;

        animator.tick(dt);
        player.tick(dt);

        renderer.renderInto(frame, animator.eye(EyeSide::LEFT), animator.eye(EyeSide::RIGHT));
        if (sink) {
            bool presented = sink->present(frame);
            if (!presented && !sinkFailing) {
                LOG_ERROR(LOG_TAG_SERVICE, "Frame sink failing (%s), frames are dropped",
                          sink->lastError().c_str());
            } else if (presented && sinkFailing) {
                LOG_INFO(LOG_TAG_SERVICE, "Frame sink recovered");
            }
            sinkFailing = !presented;
        }

        nextFrame += framePeriod;
        if (nextFrame < Clock::now()) {
            nextFrame = Clock::now();
        }
        std::this_thread::sleep_until(nextFrame);
    }

    LOG_INFO(LOG_TAG_SERVICE, "Shutting down...");
    return 0;
}
