#include "transcript_parser.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(dubServices, "dub.services")

namespace DUB {

namespace {

dmp::Error malformed(const QString& detail)
{
    return dmp::Error::collaborator_failure(
        ("Transcription returned malformed data: " + detail).toStdString());
}

} // namespace

QString TranscriptParser::stripCodeFence(const QString& output)
{
    QString text = output.trimmed();
    if (text.startsWith("```json")) {
        text = text.mid(7);
    } else if (text.startsWith("```")) {
        text = text.mid(3);
    } else {
        return text;
    }
    if (text.endsWith("```")) {
        text.chop(3);
    }
    return text.trimmed();
}

dmp::Result<TimedScript> TranscriptParser::parse(const QString& output)
{
    const QString jsonText = stripCodeFence(output);

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jsonText.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return malformed(parseError.errorString() + " at offset " +
                         QString::number(parseError.offset));
    }
    if (!doc.isArray()) {
        return malformed("expected a JSON array of segments");
    }

    const QJsonArray array = doc.array();
    TimedScript script;
    script.reserve(array.size());

    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            return malformed(QString("segment %1 is not an object").arg(i));
        }
        const QJsonObject obj = array.at(i).toObject();

        if (!obj.value("start").isDouble() || !obj.value("end").isDouble()) {
            return malformed(QString("segment %1 needs numeric start and end").arg(i));
        }
        if (!obj.value("text").isString() || !obj.value("speaker").isString()) {
            return malformed(QString("segment %1 needs string text and speaker").arg(i));
        }
        if (obj.contains("gender") && !obj.value("gender").isString() &&
            !obj.value("gender").isNull()) {
            return malformed(QString("segment %1 has a non-string gender").arg(i));
        }

        TimedChunk chunk;
        chunk.start = obj.value("start").toDouble();
        chunk.end = obj.value("end").toDouble();
        chunk.text = obj.value("text").toString();
        chunk.speaker = obj.value("speaker").toString();
        chunk.gender = genderFromString(obj.value("gender").toString());
        script.append(chunk);
    }

    qCDebug(dubServices, "Parsed %d transcript segments", static_cast<int>(script.size()));
    return script;
}

QByteArray TranscriptParser::serialize(const TimedScript& script)
{
    QJsonArray array;
    for (const TimedChunk& chunk : script) {
        QJsonObject obj;
        obj.insert("start", chunk.start);
        obj.insert("end", chunk.end);
        obj.insert("text", chunk.text);
        obj.insert("speaker", chunk.speaker);
        obj.insert("gender", genderToString(chunk.gender));
        array.append(obj);
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

} // namespace DUB
