#include "Logger.h"

#include <QDateTime>
#include <QDebug>
#include <utility>

namespace kitcheck {

namespace {

QString levelToken(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtWarningMsg:
        return QStringLiteral("WARNING");
    case QtCriticalMsg:
    case QtFatalMsg:
        return QStringLiteral("ERROR");
    case QtInfoMsg:
    default:
        return QStringLiteral("INFO");
    }
}

QString prefix(QtMsgType type)
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz") +
           QStringLiteral(" [") + levelToken(type) + QStringLiteral("] ");
}

} // namespace

Logger::Sink Logger::s_sink;
std::mutex Logger::s_mutex;

void Logger::debug(const QString &message)
{
    emitLine(QtDebugMsg, message);
}

void Logger::info(const QString &message)
{
    emitLine(QtInfoMsg, message);
}

void Logger::warning(const QString &message)
{
    emitLine(QtWarningMsg, message);
}

void Logger::error(const QString &message)
{
    emitLine(QtCriticalMsg, message);
}

void Logger::emitLine(QtMsgType type, const QString &message)
{
    const QString text = prefix(type) + message;
    switch (type) {
    case QtDebugMsg:
        qDebug().noquote() << text;
        break;
    case QtWarningMsg:
        qWarning().noquote() << text;
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        qCritical().noquote() << text;
        break;
    case QtInfoMsg:
    default:
        qInfo().noquote() << text;
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_sink) {
        s_sink(type, text);
    }
}

void Logger::setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

} // namespace kitcheck
