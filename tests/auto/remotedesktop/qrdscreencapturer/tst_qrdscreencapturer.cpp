// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>

#include "qrdcapabilities.h"
#include "qrdframecodec.h"
#include "qrdscreencapturer.h"

class FakeDisplay : public QRdDisplaySource
{
public:
    QImage grab(const QRect &region, QString *errorString) override
    {
        grabs++;
        lastRegion = region;
        if (fail) {
            *errorString = u"grab denied"_s;
            return QImage();
        }
        return image;
    }

    void paint(QRgb color)
    {
        image = QImage(32, 24, QImage::Format_RGB32);
        image.fill(color);
    }

    QImage image;
    QRect lastRegion;
    int grabs = 0;
    bool fail = false;
};

class tst_qrdscreencapturer : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void defaults();
    void firstCaptureProducesFrame();
    void rateLimited();
    void unchangedFrameSkipped();
    void changeDetectionDisabled();
    void clearPreviousFrame();
    void failedGrabIsNotFatal();
    void missingSource();
    void settingsClamped();
    void remainingTime();
    void regionForwarded();

private:
    FakeDisplay display;
};

void tst_qrdscreencapturer::init()
{
    display = FakeDisplay();
    display.paint(qRgb(10, 120, 200));
}

void tst_qrdscreencapturer::defaults()
{
    QRdScreenCapturer capturer(&display);
    QCOMPARE(capturer.quality(), 70);
    QCOMPARE(capturer.fps(), 30);
    QCOMPARE(capturer.frameInterval(), 33);
    QVERIFY(capturer.isChangeDetectionEnabled());
    QVERIFY(capturer.region().isNull());
    QVERIFY(capturer.previousFrame().isNull());
}

void tst_qrdscreencapturer::firstCaptureProducesFrame()
{
    QRdScreenCapturer capturer(&display);
    const QByteArray frame = capturer.capture();
    QVERIFY(!frame.isEmpty());
    QCOMPARE(display.grabs, 1);

    // Output is the zlib-compressed form of the stored JPEG
    bool ok = false;
    QCOMPARE(QRdFrameCodec::decompress(frame, &ok), capturer.previousFrame());
    QVERIFY(ok);
    QCOMPARE(QRdFrameCodec::decodeImage(capturer.previousFrame()).size(), QSize(32, 24));
}

void tst_qrdscreencapturer::rateLimited()
{
    QRdScreenCapturer capturer(&display, 70, 1);
    QVERIFY(!capturer.capture().isEmpty());

    display.paint(qRgb(255, 255, 0));
    QVERIFY(capturer.capture().isEmpty());
    // Rejected before grabbing
    QCOMPARE(display.grabs, 1);
}

void tst_qrdscreencapturer::unchangedFrameSkipped()
{
    QRdScreenCapturer capturer(&display, 70, 60);
    QVERIFY(!capturer.capture().isEmpty());
    const QByteArray first = capturer.previousFrame();

    QTest::qWait(capturer.frameInterval() + 10);
    QVERIFY(capturer.capture().isEmpty());
    QCOMPARE(display.grabs, 2);
    QCOMPARE(capturer.previousFrame(), first);

    display.paint(qRgb(0, 255, 0));
    QTest::qWait(capturer.frameInterval() + 10);
    QVERIFY(!capturer.capture().isEmpty());
    QVERIFY(capturer.previousFrame() != first);
}

void tst_qrdscreencapturer::changeDetectionDisabled()
{
    QRdScreenCapturer capturer(&display, 70, 60);
    capturer.setChangeDetectionEnabled(false);
    QVERIFY(!capturer.isChangeDetectionEnabled());

    QVERIFY(!capturer.capture().isEmpty());
    QTest::qWait(capturer.frameInterval() + 10);
    QVERIFY(!capturer.capture().isEmpty());
}

void tst_qrdscreencapturer::clearPreviousFrame()
{
    QRdScreenCapturer capturer(&display, 70, 60);
    QVERIFY(!capturer.capture().isEmpty());
    const QByteArray first = capturer.previousFrame();

    capturer.clearPreviousFrame();
    QVERIFY(capturer.previousFrame().isNull());
    QTest::qWait(capturer.frameInterval() + 10);
    QVERIFY(!capturer.capture().isEmpty());
    QCOMPARE(capturer.previousFrame(), first);
}

void tst_qrdscreencapturer::failedGrabIsNotFatal()
{
    QRdScreenCapturer capturer(&display, 70, 1);

    display.fail = true;
    QVERIFY(capturer.capture().isEmpty());
    QVERIFY(capturer.previousFrame().isNull());

    // A failure does not count as a capture for rate limiting
    display.fail = false;
    QVERIFY(!capturer.capture().isEmpty());
    QCOMPARE(display.grabs, 2);
}

void tst_qrdscreencapturer::missingSource()
{
    QRdScreenCapturer capturer(nullptr);
    QVERIFY(capturer.capture().isEmpty());
}

void tst_qrdscreencapturer::settingsClamped()
{
    QRdScreenCapturer capturer(&display, 0, 0);
    QCOMPARE(capturer.quality(), 1);
    QCOMPARE(capturer.fps(), 1);
    QCOMPARE(capturer.frameInterval(), 1000);

    capturer.setQuality(150);
    QCOMPARE(capturer.quality(), 100);
    capturer.setQuality(-3);
    QCOMPARE(capturer.quality(), 1);
    capturer.setQuality(55);
    QCOMPARE(capturer.quality(), 55);

    capturer.setFps(120);
    QCOMPARE(capturer.fps(), 60);
    QCOMPARE(capturer.frameInterval(), 17);
    capturer.setFps(10);
    QCOMPARE(capturer.frameInterval(), 100);
}

void tst_qrdscreencapturer::remainingTime()
{
    QRdScreenCapturer capturer(&display, 70, 1);
    QCOMPARE(capturer.remainingTime(), 0);

    QVERIFY(!capturer.capture().isEmpty());
    const int remaining = capturer.remainingTime();
    QVERIFY(remaining > 0);
    QVERIFY(remaining <= 1000);

    // Raising the rate applies to the running interval
    capturer.setFps(60);
    QVERIFY(capturer.remainingTime() <= 17);
}

void tst_qrdscreencapturer::regionForwarded()
{
    QRdScreenCapturer capturer(&display);
    capturer.setRegion(QRect(4, 5, 16, 8));
    QCOMPARE(capturer.region(), QRect(4, 5, 16, 8));

    QVERIFY(!capturer.capture().isEmpty());
    QCOMPARE(display.lastRegion, QRect(4, 5, 16, 8));
}

QTEST_GUILESS_MAIN(tst_qrdscreencapturer)
#include "tst_qrdscreencapturer.moc"
