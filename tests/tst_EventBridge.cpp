#include <QtTest>
#include <QSignalSpy>

#include "FakeMediaEngine.h"
#include "core/EventBridge.h"

using namespace CamCtl;

class TestEventBridge : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void error_becomesEngineError();
    void endOfStream_isForwarded();
    void playingTransition_becomesPipelineStarted();
    void informational_isDropped();
    void detach_stopsForwarding();
    void attach_replacesPrevious();
    void destroyedPipeline_detaches();
    void typeName_coversAllTypes();

private:
    SessionEvent takeOne(QSignalSpy& spy);

    FakeMediaEngine m_engine;
};

void TestEventBridge::initTestCase() {
    qRegisterMetaType<CamCtl::SessionEvent>("CamCtl::SessionEvent");
}

SessionEvent TestEventBridge::takeOne(QSignalSpy& spy) {
    if (spy.count() != 1) {
        return SessionEvent();
    }
    return spy.takeFirst().at(0).value<SessionEvent>();
}

void TestEventBridge::error_becomesEngineError() {
    FakePipeline pipeline(GraphDescriptor(), &m_engine, false);
    EventBridge bridge;
    QSignalSpy spy(&bridge, &EventBridge::sessionEvent);

    bridge.attach(&pipeline, 7);
    QVERIFY(bridge.isAttached());
    QCOMPARE(bridge.generation(), quint64(7));

    pipeline.emitEvent(PipelineEvent::Type::Error, "Could not open device");

    QCOMPARE(spy.count(), 1);
    const SessionEvent event = takeOne(spy);
    QVERIFY(event.type == SessionEvent::Type::EngineError);
    QCOMPARE(event.generation, quint64(7));
    QCOMPARE(event.detail, QString("fake: Could not open device"));
}

void TestEventBridge::endOfStream_isForwarded() {
    FakePipeline pipeline(GraphDescriptor(), &m_engine, false);
    EventBridge bridge;
    QSignalSpy spy(&bridge, &EventBridge::sessionEvent);

    bridge.attach(&pipeline, 3);
    pipeline.emitEvent(PipelineEvent::Type::EndOfStream);

    QCOMPARE(spy.count(), 1);
    const SessionEvent event = takeOne(spy);
    QVERIFY(event.type == SessionEvent::Type::EndOfStream);
    QCOMPARE(event.generation, quint64(3));
}

void TestEventBridge::playingTransition_becomesPipelineStarted() {
    FakePipeline pipeline(GraphDescriptor(), &m_engine, false);
    EventBridge bridge;
    QSignalSpy spy(&bridge, &EventBridge::sessionEvent);

    bridge.attach(&pipeline, 1);

    pipeline.emitEvent(PipelineEvent::Type::StateChanged, "READY", false);
    QCOMPARE(spy.count(), 0);

    pipeline.emitEvent(PipelineEvent::Type::StateChanged, "PLAYING", true);
    QCOMPARE(spy.count(), 1);
    QVERIFY(takeOne(spy).type == SessionEvent::Type::PipelineStarted);
}

void TestEventBridge::informational_isDropped() {
    FakePipeline pipeline(GraphDescriptor(), &m_engine, false);
    EventBridge bridge;
    QSignalSpy spy(&bridge, &EventBridge::sessionEvent);

    bridge.attach(&pipeline, 1);
    pipeline.emitEvent(PipelineEvent::Type::Warning, "dropped frames");
    pipeline.emitEvent(PipelineEvent::Type::DurationChanged);
    pipeline.emitEvent(PipelineEvent::Type::Other, "latency");

    QCOMPARE(spy.count(), 0);
}

void TestEventBridge::detach_stopsForwarding() {
    FakePipeline pipeline(GraphDescriptor(), &m_engine, false);
    EventBridge bridge;
    QSignalSpy spy(&bridge, &EventBridge::sessionEvent);

    bridge.detach();
    QVERIFY(!bridge.isAttached());

    bridge.attach(&pipeline, 1);
    bridge.detach();
    QVERIFY(!bridge.isAttached());

    pipeline.emitEvent(PipelineEvent::Type::Error, "late");
    pipeline.emitEvent(PipelineEvent::Type::EndOfStream);
    QCOMPARE(spy.count(), 0);
}

void TestEventBridge::attach_replacesPrevious() {
    FakePipeline first(GraphDescriptor(), &m_engine, false);
    FakePipeline second(GraphDescriptor(), &m_engine, false);
    EventBridge bridge;
    QSignalSpy spy(&bridge, &EventBridge::sessionEvent);

    bridge.attach(&first, 1);
    bridge.attach(&second, 2);

    first.emitEvent(PipelineEvent::Type::EndOfStream);
    QCOMPARE(spy.count(), 0);

    second.emitEvent(PipelineEvent::Type::EndOfStream);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(takeOne(spy).generation, quint64(2));
}

void TestEventBridge::destroyedPipeline_detaches() {
    EventBridge bridge;
    {
        FakePipeline pipeline(GraphDescriptor(), &m_engine, false);
        bridge.attach(&pipeline, 1);
        QVERIFY(bridge.isAttached());
    }
    QVERIFY(!bridge.isAttached());
    bridge.detach();
}

void TestEventBridge::typeName_coversAllTypes() {
    QCOMPARE(SessionEvent::typeName(SessionEvent::Type::StopTimeout), QString("StopTimeout"));
    QCOMPARE(SessionEvent::typeName(SessionEvent::Type::StartRecording), QString("StartRecording"));
    QCOMPARE(SessionEvent::typeName(SessionEvent::Type::EngineError), QString("EngineError"));
    QCOMPARE(PipelineEvent::typeName(PipelineEvent::Type::EndOfStream), QString("EndOfStream"));
    QCOMPARE(captureModeName(CaptureMode::Record), QString("Record"));
}

QTEST_MAIN(TestEventBridge)
#include "tst_EventBridge.moc"
