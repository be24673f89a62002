#include "voice_catalog.h"

namespace DUB {

const QVector<VoiceInfo>& VoiceCatalog::voices()
{
    static const QVector<VoiceInfo> s_voices = {
        {"Kore",   "Kore",   "(Female, Clear & Professional)", "English"},
        {"Puck",   "Puck",   "(Male, Warm & Engaging)",        "English"},
        {"Charon", "Charon", "(Female, Sophisticated & Calm)", "English"},
        {"Fenrir", "Fenrir", "(Male, Deep & Authoritative)",   "English"},
        {"Zephyr", "Zephyr", "(Neutral, Friendly & Upbeat)",   "English"},
    };
    return s_voices;
}

const VoiceInfo* VoiceCatalog::findVoice(const QString& id)
{
    for (const VoiceInfo& voice : voices()) {
        if (voice.id == id) {
            return &voice;
        }
    }
    return nullptr;
}

const VoiceInfo& VoiceCatalog::voiceForSpeakerIndex(int index)
{
    const auto& all = voices();
    const int n = static_cast<int>(all.size());
    return all[((index % n) + n) % n];
}

const QVector<LanguageInfo>& VoiceCatalog::languages()
{
    static const QVector<LanguageInfo> s_languages = {
        {"zh", "Chinese (Mandarin)"},
        {"en", "English"},
        {"fr", "French"},
        {"de", "German"},
        {"hi", "Hindi"},
        {"it", "Italian"},
        {"ja", "Japanese"},
        {"ms", "Bahasa Malaysia"},
        {"pt", "Portuguese"},
        {"ru", "Russian"},
        {"es", "Spanish"},
    };
    return s_languages;
}

const LanguageInfo* VoiceCatalog::findLanguage(const QString& code)
{
    for (const LanguageInfo& language : languages()) {
        if (language.code == code) {
            return &language;
        }
    }
    return nullptr;
}

QString VoiceCatalog::transcriptionLanguageName(const QString& code)
{
    if (code == "ms") {
        return "Malay";
    }
    const LanguageInfo* language = findLanguage(code);
    return language ? language->displayName : QString("the selected language");
}

} // namespace DUB
