#include "ActivityLog.hpp"
#include "EngineSettings.hpp"

#include <QTime>

ActivityLog::ActivityLog(int maxLines, QObject *parent)
    : QObject(parent), maxLines_(maxLines < 1 ? 1 : maxLines) {}

ActivityLog::ActivityLog(const EngineSettings &settings, QObject *parent)
    : ActivityLog(settings.logMaxLines, parent) {}

void ActivityLog::append(const QString &message) {
    const QString line =
        QStringLiteral("[%1] %2")
            .arg(QTime::currentTime().toString(QStringLiteral("HH:mm:ss")),
                 message);
    lines_ << line;
    trim();
    emit lineAppended(line);
}

void ActivityLog::setMaxLines(int n) {
    maxLines_ = n < 1 ? 1 : n;
    trim();
}

void ActivityLog::trim() {
    while (lines_.size() > maxLines_)
        lines_.removeFirst();
}
