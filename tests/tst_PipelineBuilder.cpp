#include <QtTest>

#include "core/PipelineBuilder.h"

using namespace CamCtl;

class TestPipelineBuilder : public QObject {
    Q_OBJECT

private slots:
    void init();

    void preview_hasDisplayAndStillBranches();
    void record_hasThreeBranches();
    void record_bindsOutputOutsideDescription();
    void branches_neverBlockTheTee();
    void displaySink_prefersEmbeddable();
    void displaySink_fallsBackToAuto();
    void encoder_selectionPolicy();
    void encoder_openh264Fallback();
    void encoder_missingKeepsX264Id();
    void source_mapping_data();
    void source_mapping();
    void overlays_followConfig();
    void previewScaling_canBeDisabled();

private:
    static int branchCount(const QString& description);

    CapabilitySet m_capabilities;
    CameraConfig m_camera;
    OverlayConfig m_overlay;
};

int TestPipelineBuilder::branchCount(const QString& description) {
    return description.count(QString("%1. ! queue").arg(GraphDescriptor::TeeName));
}

void TestPipelineBuilder::init() {
    m_capabilities = CapabilitySet();
    m_capabilities.hasEmbeddableSink = true;
    m_capabilities.embeddableSinkFactory = "glimagesink";
    m_capabilities.hasLibcameraSource = false;
    m_capabilities.encoderChoice = EncoderChoice::X264;

    m_camera = CameraConfig();
    m_overlay = OverlayConfig();
}

void TestPipelineBuilder::preview_hasDisplayAndStillBranches() {
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);
    const GraphDescriptor graph = builder.buildPreviewGraph();

    QVERIFY(graph.mode == CaptureMode::Preview);
    QVERIFY(graph.outputPath.isEmpty());
    QVERIFY(graph.embeddableDisplay);

    const QString& text = graph.launchDescription;
    QCOMPARE(text.count("tee name=t"), 1);
    QCOMPARE(branchCount(text), 2);
    QVERIFY(text.contains("name=video_sink"));
    QVERIFY(text.contains("appsink name=photo_sink max-buffers=1 drop=true"));
    QVERIFY(text.contains("jpegenc"));
    QVERIFY(!text.contains("file_sink"));
    QVERIFY(!text.contains("x264enc"));
    QVERIFY(text.contains("video/x-raw,format=NV12,width=1920,height=1080"));
}

void TestPipelineBuilder::record_hasThreeBranches() {
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);
    const GraphDescriptor graph = builder.buildRecordGraph("/tmp/video_20240101_120000.mp4");

    QVERIFY(graph.mode == CaptureMode::Record);
    QCOMPARE(graph.encoderName, QString("x264enc"));

    const QString& text = graph.launchDescription;
    QCOMPARE(text.count("tee name=t"), 1);
    QCOMPARE(branchCount(text), 3);
    QVERIFY(text.contains("name=video_sink"));
    QVERIFY(text.contains("name=photo_sink"));
    QVERIFY(text.contains("splitmuxsink name=file_sink"));
    QVERIFY(text.contains("x264enc speed-preset=ultrafast tune=zerolatency ! h264parse"));

    // Elapsed time overlay appears on the record graph only
    QVERIFY(text.contains("timeoverlay"));
    QVERIFY(!builder.buildPreviewGraph().launchDescription.contains("timeoverlay"));
}

void TestPipelineBuilder::record_bindsOutputOutsideDescription() {
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);
    const QString path = "/home/user/Videos/100% quality/video_20240101_120000.mp4";
    const GraphDescriptor graph = builder.buildRecordGraph(path);

    QCOMPARE(graph.outputPath, path);
    QVERIFY(!graph.launchDescription.contains(path));
    QVERIFY(!graph.launchDescription.contains("location="));
}

void TestPipelineBuilder::branches_neverBlockTheTee() {
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);
    const QString text = builder.buildRecordGraph("/tmp/video_20240101_120000.mp4").launchDescription;

    const QString branchHead = QString("%1. ! queue leaky=downstream").arg(GraphDescriptor::TeeName);
    QCOMPARE(text.count(branchHead), 3);
    QVERIFY(text.contains("queue leaky=downstream max-size-buffers=0 max-size-bytes=0 max-size-time=3000000000"));
}

void TestPipelineBuilder::displaySink_prefersEmbeddable() {
    m_capabilities.embeddableSinkFactory = "xvimagesink";
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);

    const QString text = builder.buildPreviewGraph().launchDescription;
    QVERIFY(text.contains("xvimagesink name=video_sink"));
    QVERIFY(!text.contains("autovideosink"));
}

void TestPipelineBuilder::displaySink_fallsBackToAuto() {
    m_capabilities.hasEmbeddableSink = false;
    m_capabilities.embeddableSinkFactory.clear();
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);

    const GraphDescriptor graph = builder.buildPreviewGraph();
    QVERIFY(!graph.embeddableDisplay);
    QVERIFY(graph.launchDescription.contains("autovideosink name=video_sink"));
}

void TestPipelineBuilder::encoder_selectionPolicy() {
    QVERIFY(CapabilitySet::chooseEncoder(true, true) == EncoderChoice::X264);
    QVERIFY(CapabilitySet::chooseEncoder(true, false) == EncoderChoice::X264);
    QVERIFY(CapabilitySet::chooseEncoder(false, true) == EncoderChoice::OpenH264);
    QVERIFY(CapabilitySet::chooseEncoder(false, false) == EncoderChoice::NoneAvailable);
}

void TestPipelineBuilder::encoder_openh264Fallback() {
    m_capabilities.encoderChoice = EncoderChoice::OpenH264;
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);

    const GraphDescriptor graph = builder.buildRecordGraph("/tmp/out.mp4");
    QCOMPARE(graph.encoderName, QString("openh264enc"));
    QVERIFY(graph.launchDescription.contains("openh264enc"));
    QVERIFY(!graph.launchDescription.contains("x264enc speed-preset"));
}

void TestPipelineBuilder::encoder_missingKeepsX264Id() {
    m_capabilities.encoderChoice = EncoderChoice::NoneAvailable;
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);

    const GraphDescriptor graph = builder.buildRecordGraph("/tmp/out.mp4");
    QCOMPARE(graph.encoderName, QString("x264enc"));
    QVERIFY(graph.launchDescription.contains("x264enc"));
}

void TestPipelineBuilder::source_mapping_data() {
    QTest::addColumn<QString>("source");
    QTest::addColumn<bool>("hasLibcamera");
    QTest::addColumn<QString>("expected");

    QTest::newRow("auto without libcamera") << "auto" << false << "v4l2src name=cam !";
    QTest::newRow("auto with libcamera") << "auto" << true << "libcamerasrc name=cam !";
    QTest::newRow("libcamera") << "libcamera" << false << "libcamerasrc name=cam !";
    QTest::newRow("test pattern") << "test" << false << "videotestsrc name=cam is-live=true !";
    QTest::newRow("v4l2 device") << "v4l2:/dev/video1" << true << "v4l2src name=cam device=/dev/video1 !";
    QTest::newRow("v4l2 default") << "v4l2:" << true << "v4l2src name=cam !";
    QTest::newRow("unknown") << "firewire" << false << "v4l2src name=cam !";
}

void TestPipelineBuilder::source_mapping() {
    QFETCH(QString, source);
    QFETCH(bool, hasLibcamera);
    QFETCH(QString, expected);

    m_capabilities.hasLibcameraSource = hasLibcamera;
    m_camera.source = source;
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);

    QVERIFY2(builder.buildPreviewGraph().launchDescription.startsWith(expected),
             qPrintable(builder.buildPreviewGraph().launchDescription));
}

void TestPipelineBuilder::overlays_followConfig() {
    m_overlay.crosshair = false;
    m_overlay.clock = false;
    m_overlay.elapsed = false;
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);

    const QString text = builder.buildRecordGraph("/tmp/out.mp4").launchDescription;
    QVERIFY(!text.contains("textoverlay"));
    QVERIFY(!text.contains("clockoverlay"));
    QVERIFY(!text.contains("timeoverlay"));
    QCOMPARE(branchCount(text), 3);

    m_overlay.crosshair = true;
    m_overlay.clock = true;
    m_overlay.clockFormat = "%H:%M";
    PipelineBuilder withOverlays(m_capabilities, m_camera, m_overlay);
    const QString preview = withOverlays.buildPreviewGraph().launchDescription;
    QVERIFY(preview.contains("textoverlay text=\"+\""));
    QVERIFY(preview.contains("clockoverlay time-format=\"%H:%M\""));
}

void TestPipelineBuilder::previewScaling_canBeDisabled() {
    m_camera.previewWidth = 0;
    m_camera.previewHeight = 0;
    PipelineBuilder builder(m_capabilities, m_camera, m_overlay);
    QVERIFY(!builder.buildPreviewGraph().launchDescription.contains("width=0"));

    m_camera.previewWidth = 640;
    m_camera.previewHeight = 360;
    PipelineBuilder scaled(m_capabilities, m_camera, m_overlay);
    QVERIFY(scaled.buildPreviewGraph().launchDescription.contains("video/x-raw,width=640,height=360"));
}

QTEST_MAIN(TestPipelineBuilder)
#include "tst_PipelineBuilder.moc"
