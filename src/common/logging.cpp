#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace hashprint::logging {

namespace {

constexpr qint64 kRotateBytes = 5 * 1024 * 1024;

// Append-only log file kept open between events. Once it grows past
// kRotateBytes it is moved to "<path>.1" and reopened on the next write.
class LogFile {
public:
    void setPath(const QString &path)
    {
        if (m_file.fileName() == path) {
            return;
        }
        m_file.close();
        m_file.setFileName(path);
    }

    bool append(const QByteArray &line)
    {
        if (!m_file.isOpen()) {
            QDir().mkpath(QFileInfo(m_file.fileName()).absolutePath());
            if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
                return false;
            }
        }
        if (m_file.write(line) != line.size() || !m_file.flush()) {
            m_file.close();
            return false;
        }
        if (m_file.size() >= kRotateBytes) {
            rotate();
        }
        return true;
    }

private:
    void rotate()
    {
        const QString path = m_file.fileName();
        const QString rotated = path + QStringLiteral(".1");
        m_file.close();
        QFile::remove(rotated);
        QFile::rename(path, rotated);
    }

    QFile m_file;
};

struct Logger {
    std::mutex mutex;
    bool configured = false;
    bool consoleEcho = false;
    QString processName;
    QString directory;
    LogFile mainLog;
    LogFile traceLog;
};

Logger &logger()
{
    static Logger instance;
    return instance;
}

std::atomic<bool> g_traceEnabled{false};

thread_local QString t_runId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString resolveLogsDir()
{
    const QString overrideDir = qEnvironmentVariable("HASHPRINT_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    return qEnvironmentVariable("HOME") + QStringLiteral("/.local/share/hashprint/logs");
}

QString applicationProcessName()
{
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("hashprint");
}

// Caller holds state.mutex.
void configure(Logger &state, const QString &processName)
{
    state.processName = processName;
    state.directory = resolveLogsDir();
    const QString base = state.directory + QLatin1Char('/') + state.processName;
    state.mainLog.setPath(base + QStringLiteral(".log"));
    state.traceLog.setPath(base + QStringLiteral("-trace.log"));
    state.configured = true;
}

void appendOrStderr(LogFile &file, const QByteArray &line)
{
    if (!file.append(line)) {
        std::fputs(line.constData(), stderr);
    }
}

void echoToConsole(LogLevel level, const char *component, const char *event,
                   const nlohmann::json &context)
{
    std::string line = std::string("[") + levelName(level) + "] " + component + ": " + event;
    if (context.is_object() && !context.empty()) {
        line += ' ';
        line += context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::fprintf(stderr, "%s\n", line.c_str());
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    Logger &state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    configure(state, processName.isEmpty() ? applicationProcessName() : processName);
    g_traceEnabled = traceEnabled;
}

void setTraceEnabled(bool enabled)
{
    g_traceEnabled = enabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

void setConsoleEcho(bool enabled)
{
    Logger &state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.consoleEcho = enabled;
}

QString logsDirPath()
{
    Logger &state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.configured ? state.directory : resolveLogsDir();
}

RunScope::RunScope(const QString &runId)
    : m_previous(t_runId)
{
    t_runId = runId;
}

RunScope::~RunScope()
{
    t_runId = m_previous;
}

QString currentRunId()
{
    return t_runId;
}

void logEvent(LogLevel level,
              const char *component,
              const char *event,
              const nlohmann::json &context)
{
    const bool trace = g_traceEnabled;
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const nlohmann::json record = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"pid", QCoreApplication::applicationPid()},
        {"component", component},
        {"event", event},
        {"run", t_runId.toStdString()},
        {"context", context}
    };

    // Paths may carry arbitrary bytes; replace rather than throw on bad UTF-8.
    QByteArray line = QByteArray::fromStdString(
        record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    line.append('\n');

    Logger &state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.configured) {
        configure(state, applicationProcessName());
    }

    if (level != LogLevel::Debug) {
        appendOrStderr(state.mainLog, line);
        if (state.consoleEcho) {
            echoToConsole(level, component, event, context);
        }
    }
    if (trace) {
        appendOrStderr(state.traceLog, line);
    }
}

} // namespace hashprint::logging
