#include <QtTest>

#include "widgets/PlaybackView.h"

using namespace CamCtl;

class TestPlaybackView : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void frameSize_fitsAndCenters();
    void resize_keepsAspectRatio();
    void clear_keepsFrameSizeForNextLoad();

private:
    QSizeF expectedSize() const;

    PlaybackView* m_view{nullptr};
};

void TestPlaybackView::init() {
    m_view = new PlaybackView();
    m_view->resize(640, 480);
    m_view->show();
    QVERIFY(QTest::qWaitForWindowExposed(m_view));
}

void TestPlaybackView::cleanup() {
    delete m_view;
    m_view = nullptr;
}

QSizeF TestPlaybackView::expectedSize() const {
    return QSizeF(1280, 720).scaled(QSizeF(m_view->viewport()->size()), Qt::KeepAspectRatio);
}

void TestPlaybackView::frameSize_fitsAndCenters() {
    QVERIFY(!m_view->hasFrameSize());

    emit m_view->videoItem()->nativeSizeChanged(QSizeF(1280, 720));

    QVERIFY(m_view->hasFrameSize());
    const QSizeF fitted = expectedSize();
    QCOMPARE(m_view->videoItem()->size(), fitted);

    const QSizeF area(m_view->viewport()->size());
    QCOMPARE(m_view->videoItem()->pos().x(), (area.width() - fitted.width()) / 2.0);
    QCOMPARE(m_view->videoItem()->pos().y(), (area.height() - fitted.height()) / 2.0);
}

void TestPlaybackView::resize_keepsAspectRatio() {
    emit m_view->videoItem()->nativeSizeChanged(QSizeF(1280, 720));

    m_view->resize(900, 300);
    QTRY_COMPARE(m_view->videoItem()->size(), expectedSize());

    const QSizeF size = m_view->videoItem()->size();
    QVERIFY(qAbs(size.width() / size.height() - 16.0 / 9.0) < 0.01);
}

void TestPlaybackView::clear_keepsFrameSizeForNextLoad() {
    emit m_view->videoItem()->nativeSizeChanged(QSizeF(1280, 720));

    m_view->clear();
    QVERIFY(!m_view->videoItem()->isVisible());
    QVERIFY(m_view->hasFrameSize());

    // The next file has the same resolution, so no new native size arrives
    m_view->showVideo();
    QVERIFY(m_view->videoItem()->isVisible());
    QCOMPARE(m_view->videoItem()->size(), expectedSize());
    QVERIFY(!m_view->videoItem()->size().isEmpty());
}

QTEST_MAIN(TestPlaybackView)
#include "tst_PlaybackView.moc"
