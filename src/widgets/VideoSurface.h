#ifndef VIDEOSURFACE_H
#define VIDEOSURFACE_H

#include <QWidget>

namespace CamCtl {

/**
 * @brief Native child window a video overlay sink renders into
 *
 * Qt does not paint this widget. The sink draws directly into its
 * window handle, which only stays stable once the widget has been
 * placed in its final parent.
 */
class VideoSurface : public QWidget {
    Q_OBJECT

public:
    explicit VideoSurface(QWidget* parent = nullptr);
    ~VideoSurface() override;

    QPaintEngine* paintEngine() const override { return nullptr; }

protected:
    void paintEvent(QPaintEvent* event) override;
};

} // namespace CamCtl

#endif // VIDEOSURFACE_H
