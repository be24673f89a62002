#include "timed_chunk.h"

namespace DUB {

Gender genderFromString(const QString& value)
{
    const QString normalized = value.trimmed();
    if (normalized.compare("Male", Qt::CaseInsensitive) == 0) {
        return Gender::Male;
    }
    if (normalized.compare("Female", Qt::CaseInsensitive) == 0) {
        return Gender::Female;
    }
    return Gender::Unknown;
}

QString genderToString(Gender gender)
{
    switch (gender) {
        case Gender::Male:    return "Male";
        case Gender::Female:  return "Female";
        case Gender::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace DUB
