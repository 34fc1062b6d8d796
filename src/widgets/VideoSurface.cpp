#include "VideoSurface.h"
#include <QPaintEvent>
#include <QDebug>

namespace CamCtl {

VideoSurface::VideoSurface(QWidget* parent)
    : QWidget(parent)
{
    setObjectName("videoSurface");
    setAttribute(Qt::WA_NativeWindow);
    setAttribute(Qt::WA_PaintOnScreen);
    setAttribute(Qt::WA_NoSystemBackground);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setMinimumSize(160, 90);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
}

VideoSurface::~VideoSurface() {
    qDebug() << "VideoSurface: Destroyed";
}

void VideoSurface::paintEvent(QPaintEvent* event) {
    // The sink owns the pixels
    event->accept();
}

} // namespace CamCtl
