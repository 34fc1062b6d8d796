#ifndef MEDIALIBRARY_H
#define MEDIALIBRARY_H

#include <QString>
#include <QStringList>

namespace CamCtl {

/**
 * @brief Directory listing for the photo and video browsers
 *
 * The filesystem is the only index. Listings are rebuilt on demand.
 */
class MediaLibrary {
public:
    static const QStringList& photoExtensions();   // png jpg jpeg bmp gif
    static const QStringList& videoExtensions();   // mp4 mkv avi

    /**
     * @brief List regular files in directory whose extension is allowed
     * @param directory Directory to scan (missing directory -> empty list)
     * @param extensions Lower-case extensions without dot, matched case-insensitively
     * @return File names (not paths), sorted lexicographically
     */
    static QStringList listEntries(const QString& directory, const QStringList& extensions);
};

} // namespace CamCtl

#endif // MEDIALIBRARY_H
