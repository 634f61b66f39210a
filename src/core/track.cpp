module;
#include <QString>

module nava.core.track;

QString formatExtension(AudioFormat format)
{
    switch (format) {
    case AudioFormat::Wav: return QStringLiteral("wav");
    case AudioFormat::Mp3: return QStringLiteral("mp3");
    }
    return QStringLiteral("mp3");
}

bool parseAudioFormat(const QString& value, AudioFormat* format)
{
    const QString lower = value.trimmed().toLower();
    AudioFormat parsed;
    if (lower == QStringLiteral("mp3")) {
        parsed = AudioFormat::Mp3;
    } else if (lower == QStringLiteral("wav")) {
        parsed = AudioFormat::Wav;
    } else {
        return false;
    }
    if (format) *format = parsed;
    return true;
}

QString mediaKindName(MediaKind kind)
{
    return kind == MediaKind::Episode ? QStringLiteral("episode") : QStringLiteral("track");
}
