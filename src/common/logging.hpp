#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace hashprint::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Names the log files after processName and resolves the log directory.
// Without a call, both are resolved from the application name on the first
// event.
void initLogging(const QString &processName, bool traceEnabled);

// Debug events are dropped unless trace is on. With trace on, every event is
// also appended to <process>-trace.log.
void setTraceEnabled(bool enabled);
bool isTraceEnabled();

// Mirror Info and above to stderr as "[LEVEL] component: event {context}".
void setConsoleEcho(bool enabled);

// $HASHPRINT_LOG_DIR, else $HOME/.local/share/hashprint/logs.
QString logsDirPath();

// Tags every event logged on this thread with runId until destroyed.
class RunScope {
public:
    explicit RunScope(const QString &runId);
    ~RunScope();

    RunScope(const RunScope &) = delete;
    RunScope &operator=(const RunScope &) = delete;

private:
    QString m_previous;
};

QString currentRunId();

void logEvent(LogLevel level,
              const char *component,
              const char *event,
              const nlohmann::json &context = nlohmann::json::object());

} // namespace hashprint::logging

// The context is variadic so braced initializers with commas pass through.
// HLOG_DEBUG does not evaluate its context unless trace is on.
#define HLOG_DEBUG(component, event, ...)                                          \
    do {                                                                           \
        if (::hashprint::logging::isTraceEnabled()) {                              \
            ::hashprint::logging::logEvent(::hashprint::logging::LogLevel::Debug,  \
                                           (component), (event), __VA_ARGS__);     \
        }                                                                          \
    } while (false)

#define HLOG_INFO(component, event, ...) \
    ::hashprint::logging::logEvent(::hashprint::logging::LogLevel::Info, (component), (event), __VA_ARGS__)

#define HLOG_WARN(component, event, ...) \
    ::hashprint::logging::logEvent(::hashprint::logging::LogLevel::Warn, (component), (event), __VA_ARGS__)

#define HLOG_ERROR(component, event, ...) \
    ::hashprint::logging::logEvent(::hashprint::logging::LogLevel::Error, (component), (event), __VA_ARGS__)
