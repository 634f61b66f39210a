module;
#include <QRegularExpression>
#include <QString>

module nava.utils.resource_uri;

namespace nava::utils {

static ResourceKind kindFromName(const QString& name)
{
    if (name == QStringLiteral("track")) return ResourceKind::Track;
    if (name == QStringLiteral("album")) return ResourceKind::Album;
    if (name == QStringLiteral("playlist")) return ResourceKind::Playlist;
    if (name == QStringLiteral("episode")) return ResourceKind::Episode;
    return ResourceKind::Invalid;
}

ResourceRef parseResourceRef(const QString& text)
{
    static const QRegularExpression uriRe(
        QStringLiteral("^spotify:(track|album|playlist|episode):([0-9a-zA-Z]{22})$"));
    static const QRegularExpression urlRe(
        QStringLiteral("^(?:https?://)?open\\.spotify\\.com/(track|album|playlist|episode)/([0-9a-zA-Z]{22})(?:\\?si=.+?)?$"));

    const QString input = text.trimmed();
    ResourceRef ref;
    QRegularExpressionMatch match = uriRe.match(input);
    if (!match.hasMatch()) match = urlRe.match(input);
    if (!match.hasMatch()) return ref;

    ref.kind = kindFromName(match.captured(1));
    ref.id = match.captured(2);
    return ref;
}

QString resourceKindName(ResourceKind kind)
{
    switch (kind) {
    case ResourceKind::Track: return QStringLiteral("track");
    case ResourceKind::Album: return QStringLiteral("album");
    case ResourceKind::Playlist: return QStringLiteral("playlist");
    case ResourceKind::Episode: return QStringLiteral("episode");
    case ResourceKind::Invalid: break;
    }
    return QStringLiteral("invalid");
}

} // namespace nava::utils
