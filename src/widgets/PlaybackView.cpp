#include "PlaybackView.h"
#include <QResizeEvent>
#include <QDebug>

namespace CamCtl {

PlaybackView::PlaybackView(QWidget* parent)
    : QGraphicsView(parent)
    , m_scene(new QGraphicsScene(this))
    , m_videoItem(new QGraphicsVideoItem())
{
    setObjectName("playbackView");
    setScene(m_scene);
    setFrameShape(QFrame::NoFrame);
    setBackgroundBrush(QColor(17, 17, 17));
    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setViewportUpdateMode(QGraphicsView::FullViewportUpdate);
    setAlignment(Qt::AlignLeft | Qt::AlignTop);

    // Scene takes ownership
    m_videoItem->setAspectRatioMode(Qt::KeepAspectRatio);
    m_scene->addItem(m_videoItem);

    connect(m_videoItem, &QGraphicsVideoItem::nativeSizeChanged,
            this, &PlaybackView::onNativeSizeChanged);

    setMinimumSize(320, 180);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
}

void PlaybackView::clear() {
    m_videoItem->hide();
}

void PlaybackView::showVideo() {
    m_videoItem->show();
    layoutVideoItem();
}

void PlaybackView::resizeEvent(QResizeEvent* event) {
    QGraphicsView::resizeEvent(event);
    layoutVideoItem();
}

void PlaybackView::onNativeSizeChanged(const QSizeF& size) {
    qDebug() << "PlaybackView: Frame size" << size;
    m_frameSize = size;
    layoutVideoItem();
}

void PlaybackView::layoutVideoItem() {
    const QSizeF area = viewport()->size();
    m_scene->setSceneRect(QRectF(QPointF(0, 0), area));

    if (!hasFrameSize() || area.isEmpty()) {
        return;
    }

    const QSizeF fitted = m_frameSize.scaled(area, Qt::KeepAspectRatio);
    m_videoItem->setSize(fitted);
    m_videoItem->setPos((area.width() - fitted.width()) / 2.0,
                        (area.height() - fitted.height()) / 2.0);
}

} // namespace CamCtl
