#pragma once

#include <QString>
#include <QVector>

namespace DUB {

struct VoiceInfo
{
    QString id;             // identifier the speech service expects
    QString name;
    QString description;    // e.g. "(Female, Clear & Professional)"
    QString language;
};

struct LanguageInfo
{
    QString code;           // e.g. "ms"
    QString displayName;    // e.g. "Bahasa Malaysia"
};

/**
 * Prebuilt voices and dub target languages
 */
class VoiceCatalog
{
public:
    static const QVector<VoiceInfo>& voices();
    static const VoiceInfo* findVoice(const QString& id);

    // Voice for the n-th speaker when voices are handed out in turn
    static const VoiceInfo& voiceForSpeakerIndex(int index);

    static const QVector<LanguageInfo>& languages();
    static const LanguageInfo* findLanguage(const QString& code);

    /**
     * Language name given to the transcription service.
     * Display name, except Malay which is requested by its common English
     * name; unknown codes fall back to "the selected language".
     */
    static QString transcriptionLanguageName(const QString& code);
};

} // namespace DUB
