#include "logger.h"
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <iostream>
#include <unistd.h>

namespace qedl {

Logger::Logger()
    : m_colorConsole(::isatty(STDERR_FILENO) == 1)
{
}

Logger::~Logger()
{
    if (m_logFile.isOpen())
        m_logFile.close();
}

Logger& Logger::instance()
{
    static Logger inst;
    return inst;
}

bool Logger::openLogFile(const QString& path)
{
    QMutexLocker lock(&m_mutex);

    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_logFile.setFileName(path);
    return m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
}

void Logger::setMinLevel(LogLevel level)
{
    m_minLevel = level;
}

void Logger::setCategoryLevel(const QString& category, LogLevel level)
{
    QMutexLocker lock(&m_mutex);
    m_categoryLevels.insert(category, level);
}

void Logger::setSink(Sink callback)
{
    m_sink = std::move(callback);
}

void Logger::debug(const QString& msg, const QString& category)
{
    log(LogLevel::Debug, msg, category);
}

void Logger::info(const QString& msg, const QString& category)
{
    log(LogLevel::Info, msg, category);
}

void Logger::warning(const QString& msg, const QString& category)
{
    log(LogLevel::Warning, msg, category);
}

void Logger::error(const QString& msg, const QString& category)
{
    log(LogLevel::Error, msg, category);
}

void Logger::fatal(const QString& msg, const QString& category)
{
    log(LogLevel::Fatal, msg, category);
}

bool Logger::isEnabled(LogLevel level, const QString& category) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_categoryLevels.constFind(category);
    LogLevel threshold = (it != m_categoryLevels.constEnd()) ? it.value() : m_minLevel;
    return level >= threshold;
}

void Logger::log(LogLevel level, const QString& msg, const QString& category)
{
    if (!isEnabled(level, category))
        return;

    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    QString levelStr = levelToString(level);
    QString catStr = category.isEmpty() ? "" : ("[" + category + "] ");
    QString formatted = QString("[%1] [%2] %3%4").arg(timestamp, levelStr, catStr, msg);

    {
        QMutexLocker lock(&m_mutex);
        writeToFile(formatted);
    }

    // Console output goes to stderr so stdout stays clean for tables and dumps
    if (m_consoleEnabled) {
        if (m_colorConsole)
            std::cerr << levelToAnsi(level) << formatted.toStdString() << "\x1b[0m" << std::endl;
        else
            std::cerr << formatted.toStdString() << std::endl;
    }

    if (m_sink)
        m_sink(formatted, level);
}

void Logger::wire(const QString& category, bool outbound, const QByteArray& data, bool text)
{
    if (!isEnabled(LogLevel::Debug, category))
        return;

    const char* arrow = outbound ? "->" : "<-";
    if (text) {
        log(LogLevel::Debug, QString("%1 %2").arg(arrow, QString::fromUtf8(data).simplified()), category);
        return;
    }

    QString hex = QString::fromLatin1(data.left(WIRE_HEX_LIMIT).toHex(' '));
    if (data.size() > WIRE_HEX_LIMIT)
        hex += QString(" ... (%1 bytes)").arg(data.size());
    log(LogLevel::Debug, QString("%1 %2").arg(arrow, hex), category);
}

void Logger::writeToFile(const QString& formatted)
{
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* Logger::levelToAnsi(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return "\x1b[90m";
    case LogLevel::Info:    return "\x1b[32m";
    case LogLevel::Warning: return "\x1b[33m";
    case LogLevel::Error:   return "\x1b[31m";
    case LogLevel::Fatal:   return "\x1b[1;31m";
    }
    return "";
}

} // namespace qedl
