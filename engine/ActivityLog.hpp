// Bounded, timestamped activity lines ("[HH:MM:SS] message").
#pragma once
#include <QObject>
#include <QString>
#include <QStringList>

struct EngineSettings;

class ActivityLog : public QObject {
    Q_OBJECT
public:
    explicit ActivityLog(int maxLines = 2000, QObject *parent = nullptr);
    // Bounded by 'Log/maxLines'.
    explicit ActivityLog(const EngineSettings &settings,
                         QObject *parent = nullptr);

    void append(const QString &message);
    QStringList lines() const { return lines_; }
    void clear() { lines_.clear(); }

    int maxLines() const { return maxLines_; }
    // Values below 1 are clamped to 1. Drops the oldest lines if needed.
    void setMaxLines(int n);

signals:
    void lineAppended(const QString &line);

private:
    QStringList lines_;
    int maxLines_;

    void trim();
};
