#ifndef PLAYBACKVIEW_H
#define PLAYBACKVIEW_H

#include <QGraphicsView>
#include <QGraphicsScene>
#include <QGraphicsVideoItem>

namespace CamCtl {

/**
 * @brief Video output of the video browser
 *
 * A graphics view holding a single QGraphicsVideoItem, which Qt Multimedia
 * renders through the GPU. The item is kept centered and letterboxed to
 * the frame's native aspect ratio.
 *
 * Usage: backend->setVideoOutput(view->videoItem());
 */
class PlaybackView : public QGraphicsView {
    Q_OBJECT

public:
    explicit PlaybackView(QWidget* parent = nullptr);

    QGraphicsVideoItem* videoItem() const { return m_videoItem; }

    /**
     * @brief Hide the video item. The last frame size is kept.
     */
    void clear();

    /**
     * @brief Show the video item again, laid out for the last frame size
     *
     * Call before loading a file: a file with the same resolution does not
     * report a new native size.
     */
    void showVideo();

    bool hasFrameSize() const { return !m_frameSize.isEmpty(); }

protected:
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onNativeSizeChanged(const QSizeF& size);

private:
    void layoutVideoItem();

    QGraphicsScene* m_scene;
    QGraphicsVideoItem* m_videoItem;
    QSizeF m_frameSize;
};

} // namespace CamCtl

#endif // PLAYBACKVIEW_H
