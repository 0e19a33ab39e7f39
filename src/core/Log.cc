#include "trellis/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace trellis::log {

namespace {
// Root logger (all channels aggregated)
std::atomic<quill::Logger*> g_logger{nullptr};

// Matrix engine channel
std::atomic<quill::Logger*> g_logger_math{nullptr};

// Guards creation and replacement of the loggers above
std::mutex g_init_mutex;
bool g_backend_running = false;
std::string g_log_file_path;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::None);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(logger:<7) %(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    if (g_backend_running)
        return;

    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "TrellisLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
    g_backend_running = true;
}

// Quill fixes a logger's sinks at creation, so attaching a sink means
// draining and removing the old logger. Returns the level it had.
quill::LogLevel retireLogger(std::atomic<quill::Logger*>& slot) {
    quill::Logger* old = slot.exchange(nullptr, std::memory_order_acq_rel);
    if (!old)
        return quill::LogLevel::Info;

    quill::LogLevel level = old->get_log_level();
    old->flush_log();
    quill::Frontend::remove_logger_blocking(old);
    return level;
}

quill::Logger* createLogger(const char* name, const std::vector<std::shared_ptr<quill::Sink>>& sinks,
                            quill::LogLevel level) {
    quill::Logger* lg = quill::Frontend::create_or_get_logger(name, sinks, makePattern());
    lg->set_log_level(level);
    return lg;
}

// Caller holds g_init_mutex and the backend is running.
void buildLoggers(const std::string& file_path) {
    quill::LogLevel root_level = retireLogger(g_logger);
    quill::LogLevel math_level = retireLogger(g_logger_math);

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    if (!file_path.empty())
        sinks.push_back(makeFileSink(file_path));

    g_logger_math.store(createLogger("math", sinks, math_level), std::memory_order_release);
    g_logger.store(createLogger("trellis", sinks, root_level), std::memory_order_release);
    g_log_file_path = file_path;
}

} // namespace

void init() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger.load(std::memory_order_acquire))
        return;

    startBackend();
    buildLoggers({});
}

void init(const char* log_file_path) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger.load(std::memory_order_acquire) && g_log_file_path == log_file_path)
        return;

    startBackend();
    buildLoggers(log_file_path);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    for (auto* lg : {g_logger.load(), g_logger_math.load()}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
    g_backend_running = false;
}

quill::Logger* logger() {
    if (auto* lg = g_logger.load(std::memory_order_acquire))
        return lg;
    init();
    return g_logger.load(std::memory_order_acquire);
}

quill::Logger* mathLogger() {
    if (auto* lg = g_logger_math.load(std::memory_order_acquire))
        return lg;
    init();
    return g_logger_math.load(std::memory_order_acquire);
}

std::string logFilePath() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    return g_log_file_path;
}

void setLevel(quill::LogLevel level) {
    logger()->set_log_level(level);
}

void setMathLevel(quill::LogLevel level) {
    mathLogger()->set_log_level(level);
}

} // namespace trellis::log
