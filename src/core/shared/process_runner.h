#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>

#include <cstdint>

namespace gf {

struct ProcessOutcome {
    enum class Status {
        Finished,
        FailedToStart,
        TimedOut,
        Crashed,
    };

    Status status = Status::FailedToStart;
    int exitCode = -1;
    QByteArray standardOutput;
    QString standardError;       // trimmed, at most 300 characters
    int64_t durationMs = 0;
};

// Runs |program| to completion with a wall-clock timeout, killing it when the
// timeout expires. |input| is written to stdin before the channel is closed.
// Blocking; usable from any thread.
ProcessOutcome runProcess(const QString& program,
                          const QStringList& args,
                          int timeoutMs,
                          const QByteArray& input = {});

// Replaces each {key} in |args| by its value from |values|.
QStringList expandArguments(const QStringList& args,
                            const QList<QPair<QString, QString>>& values);

} // namespace gf
