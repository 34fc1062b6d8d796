#include "MediaLibrary.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <algorithm>

namespace CamCtl {

const QStringList& MediaLibrary::photoExtensions() {
    static const QStringList extensions{"png", "jpg", "jpeg", "bmp", "gif"};
    return extensions;
}

const QStringList& MediaLibrary::videoExtensions() {
    static const QStringList extensions{"mp4", "mkv", "avi"};
    return extensions;
}

QStringList MediaLibrary::listEntries(const QString& directory, const QStringList& extensions) {
    QStringList entries;

    QDir dir(directory);
    if (!dir.exists()) {
        qDebug() << "MediaLibrary: Directory does not exist:" << directory;
        return entries;
    }

    const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QFileInfo& info : files) {
        if (extensions.contains(info.suffix().toLower())) {
            entries.append(info.fileName());
        }
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace CamCtl
