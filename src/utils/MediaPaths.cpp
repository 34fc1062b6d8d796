#include "MediaPaths.h"
#include <QDir>
#include <QDebug>

namespace CamCtl {

QString MediaPaths::fileName(MediaKind kind, const QDateTime& when) {
    const QString stamp = when.toString("yyyyMMdd_HHmmss");
    if (kind == MediaKind::Photo) {
        return QString("photo_%1.jpg").arg(stamp);
    }
    return QString("video_%1.mp4").arg(stamp);
}

QString MediaPaths::outputPath(const QString& directory, MediaKind kind, const QDateTime& when) {
    return QDir(directory).absoluteFilePath(fileName(kind, when));
}

bool MediaPaths::ensureDirectoryExists(const QString& path) {
    QDir dir(path);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(".")) {
        qWarning() << "MediaPaths: Failed to create directory" << path;
        return false;
    }
    qDebug() << "MediaPaths: Created directory" << path;
    return true;
}

} // namespace CamCtl
