#pragma once

#include <QString>
#include <QVector>

namespace DUB {

enum class Gender {
    Unknown,
    Male,
    Female
};

/**
 * One transcribed dialog line on the source timeline
 */
struct TimedChunk
{
    double start = 0.0;         // seconds
    double end = 0.0;           // seconds (start < end expected, not enforced)
    QString text;
    QString speaker;            // e.g. "SPEAKER_01"
    Gender gender = Gender::Unknown;

    double duration() const { return end - start; }
};

using TimedScript = QVector<TimedChunk>;

// "Male" / "Female"; anything else is Unknown
Gender genderFromString(const QString& value);
QString genderToString(Gender gender);

} // namespace DUB
