#include "PhotoBrowser.h"
#include "utils/MediaLibrary.h"

#include <QHBoxLayout>
#include <QDir>
#include <QFileInfo>
#include <QImageReader>
#include <QPixmap>
#include <QResizeEvent>
#include <QDebug>

namespace CamCtl {

PhotoBrowser::PhotoBrowser(const QString& directory, QWidget* parent)
    : QWidget(parent)
    , m_directory(directory)
{
    setupUi();
}

void PhotoBrowser::setupUi() {
    setObjectName("photoBrowser");

    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(8);

    m_list = new QListWidget(this);
    m_list->setObjectName("mediaList");
    m_list->setMaximumWidth(280);
    connect(m_list, &QListWidget::currentRowChanged,
            this, &PhotoBrowser::onCurrentRowChanged);

    m_imageLabel = new QLabel(this);
    m_imageLabel->setObjectName("photoView");
    m_imageLabel->setAlignment(Qt::AlignCenter);
    m_imageLabel->setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Ignored);
    m_imageLabel->setMinimumSize(200, 150);
    m_imageLabel->setText("No photo selected");

    layout->addWidget(m_list);
    layout->addWidget(m_imageLabel, 1);
}

void PhotoBrowser::refresh() {
    const QString selectedName = m_list->currentItem() ? m_list->currentItem()->text() : QString();
    const QStringList entries = MediaLibrary::listEntries(m_directory, MediaLibrary::photoExtensions());

    m_list->blockSignals(true);
    m_list->clear();
    m_list->addItems(entries);

    const int row = entries.indexOf(selectedName);
    if (row >= 0) {
        m_list->setCurrentRow(row);
    }
    m_list->blockSignals(false);

    if (row < 0 && !m_currentPath.isEmpty()) {
        // Selected file is gone
        m_currentPath.clear();
        m_currentImage = QImage();
        m_imageLabel->setPixmap(QPixmap());
        m_imageLabel->setText("No photo selected");
    }

    qDebug() << "PhotoBrowser: Listed" << entries.size() << "photos in" << m_directory;
}

void PhotoBrowser::onCurrentRowChanged(int row) {
    if (row < 0) {
        return;
    }
    showImage(QDir(m_directory).absoluteFilePath(m_list->item(row)->text()));
}

void PhotoBrowser::showImage(const QString& path) {
    QImageReader reader(path);
    reader.setAutoTransform(true);
    QImage image = reader.read();

    if (image.isNull()) {
        qWarning() << "PhotoBrowser: Cannot load" << path << ":" << reader.errorString();
        m_currentPath.clear();
        m_currentImage = QImage();
        m_imageLabel->setPixmap(QPixmap());
        m_imageLabel->setText(QString("Cannot load %1").arg(QFileInfo(path).fileName()));
        return;
    }

    m_currentPath = path;
    m_currentImage = image;
    rescale();
}

void PhotoBrowser::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    rescale();
}

void PhotoBrowser::rescale() {
    if (m_currentImage.isNull()) {
        return;
    }

    const QSize target = fitSize(m_currentImage.size(), m_imageLabel->contentsRect().size());
    if (target.isEmpty()) {
        return;
    }

    m_imageLabel->setPixmap(QPixmap::fromImage(
        m_currentImage.scaled(target, Qt::KeepAspectRatio, Qt::SmoothTransformation)));
}

double PhotoBrowser::fitScaleFactor(const QSize& image, const QSize& area) {
    if (image.isEmpty() || area.isEmpty()) {
        return 0.0;
    }
    return qMin(static_cast<double>(area.width()) / image.width(),
                static_cast<double>(area.height()) / image.height());
}

QSize PhotoBrowser::fitSize(const QSize& image, const QSize& area) {
    if (image.isEmpty() || area.isEmpty()) {
        return QSize();
    }
    return image.scaled(area, Qt::KeepAspectRatio);
}

} // namespace CamCtl
