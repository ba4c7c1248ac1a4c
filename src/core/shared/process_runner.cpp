#include "core/shared/process_runner.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QProcess>

#include <algorithm>

namespace gf {

namespace {

constexpr int kStartTimeoutMs = 10000;
constexpr int kMaxStderrChars = 300;

} // namespace

ProcessOutcome runProcess(const QString& program,
                          const QStringList& args,
                          int timeoutMs,
                          const QByteArray& input)
{
    QElapsedTimer timer;
    timer.start();

    ProcessOutcome outcome;
    QProcess process;
    process.start(program, args);

    if (!process.waitForStarted(std::min(kStartTimeoutMs, std::max(timeoutMs, 1)))) {
        outcome.status = ProcessOutcome::Status::FailedToStart;
        outcome.standardError = process.errorString();
        outcome.durationMs = timer.elapsed();
        LOG_WARN(gfCore, "Failed to start %s: %s",
                 qPrintable(program), qPrintable(outcome.standardError));
        return outcome;
    }

    if (!input.isEmpty()) {
        process.write(input);
    }
    process.closeWriteChannel();

    const int remainingMs = std::max(1, timeoutMs - static_cast<int>(timer.elapsed()));
    if (!process.waitForFinished(remainingMs)) {
        process.kill();
        process.waitForFinished();
        outcome.status = ProcessOutcome::Status::TimedOut;
        outcome.durationMs = timer.elapsed();
        LOG_WARN(gfCore, "%s killed after %dms", qPrintable(program), timeoutMs);
        return outcome;
    }

    outcome.standardOutput = process.readAllStandardOutput();
    outcome.standardError =
        QString::fromUtf8(process.readAllStandardError()).trimmed().left(kMaxStderrChars);
    outcome.exitCode = process.exitCode();
    outcome.status = process.exitStatus() == QProcess::NormalExit
        ? ProcessOutcome::Status::Finished
        : ProcessOutcome::Status::Crashed;
    outcome.durationMs = timer.elapsed();
    return outcome;
}

QStringList expandArguments(const QStringList& args,
                            const QList<QPair<QString, QString>>& values)
{
    QStringList expanded;
    expanded.reserve(args.size());
    for (QString arg : args) {
        for (const auto& value : values) {
            arg.replace(QLatin1Char('{') + value.first + QLatin1Char('}'), value.second);
        }
        expanded.append(arg);
    }
    return expanded;
}

} // namespace gf
