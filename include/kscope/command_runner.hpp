#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace kscope {

struct CommandResult {
    int exitCode = -1;
    QByteArray stdoutData;
    QString stderrText;
    bool timedOut = false;
    bool failedToStart = false;

    [[nodiscard]] bool success() const { return !timedOut && !failedToStart && exitCode == 0; }
};

// Runs a short-lived child process to completion. A process that outlives
// timeoutMs is killed and reported as timed out.
class CommandRunner {
public:
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 3000);

    // Longest run() can block: start wait, finish wait, then the kill grace.
    static int worstCaseMs(int timeoutMs) { return 2 * timeoutMs + kKillGraceMs; }

    static constexpr int kKillGraceMs = 500;
};

}  // namespace kscope
