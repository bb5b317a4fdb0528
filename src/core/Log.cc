#include "brickforge/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <memory>
#include <string>
#include <vector>

namespace brickforge::log {

namespace {
quill::Logger* g_logger = nullptr;
quill::Logger* g_logger_plugin = nullptr;

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "BrickforgeLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
}

void createLoggers(const std::vector<std::shared_ptr<quill::Sink>>& sinks) {
    auto pattern = makePattern();

    g_logger = quill::Frontend::create_or_get_logger("brickforge", sinks, pattern);
    g_logger->set_log_level(quill::LogLevel::Info);

    g_logger_plugin = quill::Frontend::create_or_get_logger("plugin", sinks, pattern);
    g_logger_plugin->set_log_level(quill::LogLevel::Info);
}

} // namespace

void init() {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    createLoggers({console_sink});
}

void init(const char* log_file_path) {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto file_sink = quill::Frontend::create_or_get_sink<quill::FileSink>(log_file_path, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());

    createLoggers({console_sink, file_sink});
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_plugin}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* pluginLogger() {
    return g_logger_plugin ? g_logger_plugin : g_logger;
}

void setLevel(quill::LogLevel level) {
    for (auto* lg : {g_logger, g_logger_plugin}) {
        if (lg)
            lg->set_log_level(level);
    }
}

} // namespace brickforge::log
