#ifndef PHOTOBROWSER_H
#define PHOTOBROWSER_H

#include <QWidget>
#include <QListWidget>
#include <QLabel>
#include <QImage>
#include <QSize>

namespace CamCtl {

/**
 * @brief Photos tab: file list plus a scaled preview of the selection
 */
class PhotoBrowser : public QWidget {
    Q_OBJECT

public:
    explicit PhotoBrowser(const QString& directory, QWidget* parent = nullptr);

    /**
     * @brief Re-scan the photo directory, keeping the selection if possible
     */
    void refresh();

    /**
     * @brief min(area.w / image.w, area.h / image.h), 0 for empty sizes
     */
    static double fitScaleFactor(const QSize& image, const QSize& area);

    /**
     * @brief image scaled by fitScaleFactor, aspect ratio preserved
     */
    static QSize fitSize(const QSize& image, const QSize& area);

protected:
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onCurrentRowChanged(int row);

private:
    void setupUi();
    void showImage(const QString& path);
    void rescale();

    QString m_directory;
    QString m_currentPath;
    QImage m_currentImage;

    QListWidget* m_list;
    QLabel* m_imageLabel;
};

} // namespace CamCtl

#endif // PHOTOBROWSER_H
