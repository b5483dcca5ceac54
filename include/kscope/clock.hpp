#pragma once

#include <QString>
#include <QtGlobal>

namespace kscope {

// Millisecond wall-clock source. Everything that windows or schedules by time
// takes a Clock so it can be driven without real sleeps.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual qint64 nowMs() const = 0;
};

class SystemClock final : public Clock {
public:
    static const SystemClock& instance();

    [[nodiscard]] qint64 nowMs() const override;
};

// UTC "yyyyMMdd-HHmmss", used to name session logs and capture files.
QString utcFileStamp(qint64 epochMs);

}  // namespace kscope
