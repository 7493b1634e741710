#pragma once

#include <QByteArray>
#include <QString>
#include <QFile>
#include <QHash>
#include <QMutex>
#include <QDateTime>
#include <functional>

namespace qedl {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Fatal
};

// Process-wide logger. Console output goes to stderr; every category
// ("Sahara", "Firehose", "Session", ...) can have its own threshold.
class Logger {
public:
    using Sink = std::function<void(const QString&, LogLevel)>;

    static Logger& instance();

    // Opens (appends to) a log file in addition to console output
    bool openLogFile(const QString& path);
    void setMinLevel(LogLevel level);
    void setCategoryLevel(const QString& category, LogLevel level);
    void setConsoleEnabled(bool enabled) { m_consoleEnabled = enabled; }
    // Receives every formatted line that passes the thresholds
    void setSink(Sink callback);

    void debug(const QString& msg, const QString& category = QString());
    void info(const QString& msg, const QString& category = QString());
    void warning(const QString& msg, const QString& category = QString());
    void error(const QString& msg, const QString& category = QString());
    void fatal(const QString& msg, const QString& category = QString());

    void log(LogLevel level, const QString& msg, const QString& category = QString());
    bool isEnabled(LogLevel level, const QString& category = QString()) const;

    // Debug trace of bytes crossing the wire. Binary packets are shown as
    // hex, cut after WIRE_HEX_LIMIT bytes; XML is shown as text. Nothing is
    // formatted unless the category is at Debug.
    void wire(const QString& category, bool outbound, const QByteArray& data, bool text);

    static constexpr int WIRE_HEX_LIMIT = 64;

    static QString levelToString(LogLevel level);
    static const char* levelToAnsi(LogLevel level);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeToFile(const QString& formatted);

    QFile m_logFile;
    LogLevel m_minLevel = LogLevel::Info;
    QHash<QString, LogLevel> m_categoryLevels;
    bool m_consoleEnabled = true;
    bool m_colorConsole = false;
    mutable QMutex m_mutex;
    Sink m_sink;
};

// Convenience macros
#define LOG_DEBUG(msg)   qedl::Logger::instance().debug(msg)
#define LOG_INFO(msg)    qedl::Logger::instance().info(msg)
#define LOG_WARNING(msg) qedl::Logger::instance().warning(msg)
#define LOG_ERROR(msg)   qedl::Logger::instance().error(msg)
#define LOG_FATAL(msg)   qedl::Logger::instance().fatal(msg)

#define LOG_DEBUG_CAT(cat, msg)   qedl::Logger::instance().debug(msg, cat)
#define LOG_INFO_CAT(cat, msg)    qedl::Logger::instance().info(msg, cat)
#define LOG_WARNING_CAT(cat, msg) qedl::Logger::instance().warning(msg, cat)
#define LOG_ERROR_CAT(cat, msg)   qedl::Logger::instance().error(msg, cat)

#define LOG_WIRE_OUT(cat, data, text) qedl::Logger::instance().wire(cat, true, data, text)
#define LOG_WIRE_IN(cat, data, text)  qedl::Logger::instance().wire(cat, false, data, text)

} // namespace qedl
