#include "stride/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <string>

namespace stride::log {

namespace {
// Root logger (all channels aggregated)
quill::Logger* g_logger = nullptr;

// Per-subsystem named loggers
quill::Logger* g_logger_physics = nullptr;
quill::Logger* g_logger_movement = nullptr;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "StrideLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
}

void setAllLoggersInfoLevel() {
    for (auto* lg : {g_logger, g_logger_physics, g_logger_movement}) {
        if (lg)
            lg->set_log_level(quill::LogLevel::Info);
    }
}

} // namespace

void init() {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto pattern = makePattern();

    g_logger = quill::Frontend::create_or_get_logger("stride", console_sink, pattern);
    g_logger_physics = quill::Frontend::create_or_get_logger("physics", console_sink, pattern);
    g_logger_movement = quill::Frontend::create_or_get_logger("movement", console_sink, pattern);

    setAllLoggersInfoLevel();
}

void init(const char* log_file_path) {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto file_sink = makeFileSink(log_file_path);
    auto pattern = makePattern();

    // All channels write to console + caller file
    g_logger = quill::Frontend::create_or_get_logger("stride", {console_sink, file_sink}, pattern);
    g_logger_physics = quill::Frontend::create_or_get_logger("physics", {console_sink, file_sink}, pattern);
    g_logger_movement = quill::Frontend::create_or_get_logger("movement", {console_sink, file_sink}, pattern);

    setAllLoggersInfoLevel();
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_physics, g_logger_movement}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* physicsLogger() {
    return g_logger_physics;
}

quill::Logger* movementLogger() {
    return g_logger_movement;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

void setPhysicsLevel(quill::LogLevel level) {
    if (g_logger_physics)
        g_logger_physics->set_log_level(level);
}

void setMovementLevel(quill::LogLevel level) {
    if (g_logger_movement)
        g_logger_movement->set_log_level(level);
}

} // namespace stride::log
