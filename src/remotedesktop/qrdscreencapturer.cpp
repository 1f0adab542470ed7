// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrdscreencapturer.h"
#include "qrdcapabilities.h"
#include "qrdframecodec.h"

#include <QtCore/QElapsedTimer>
#include <QtCore/QMutex>

QT_BEGIN_NAMESPACE

class QRdScreenCapturer::Private
{
public:
    Private(QRdDisplaySource *source, int quality, int fps);

    qint64 intervalNSecs() const { return 1000000000LL / fps; }

    QRdDisplaySource *source;

    // Settings may be changed from any thread; capture() reads a snapshot.
    mutable QMutex mutex;
    QRect region;
    int quality;
    int fps;
    bool changeDetection = true;

    // Only touched by the thread running capture().
    QElapsedTimer lastCapture;
    QByteArray previousFrame;
};

QRdScreenCapturer::Private::Private(QRdDisplaySource *source, int quality, int fps)
    : source(source)
    , quality(qBound(1, quality, 100))
    , fps(qBound(1, fps, 60))
{
}

/*!
    \class QRdScreenCapturer
    \inmodule QtRemoteDesktop

    \brief Produces a rate-limited sequence of encoded display frames.

    Each call to capture() is one tick. A tick returns an empty array ("no
    frame") when it comes too early for the configured frame rate, when the
    display source fails, or when change detection finds the frame identical
    to the previous one. None of these are errors.

    capture() must always be called from the same thread. The setters can be
    called from any thread and take effect on the next tick.
*/

QRdScreenCapturer::QRdScreenCapturer(QRdDisplaySource *source, int quality, int fps)
    : d(new Private(source, quality, fps))
{
}

QRdScreenCapturer::~QRdScreenCapturer() = default;

/*!
    Runs one capture tick and returns the zlib-compressed JPEG frame, or an
    empty array if no frame should be sent.
*/
QByteArray QRdScreenCapturer::capture()
{
    QRect region;
    int quality;
    bool changeDetection;
    qint64 interval;
    {
        QMutexLocker locker(&d->mutex);
        region = d->region;
        quality = d->quality;
        changeDetection = d->changeDetection;
        interval = d->intervalNSecs();
    }

    if (d->lastCapture.isValid() && d->lastCapture.nsecsElapsed() < interval)
        return QByteArray();

    if (!d->source) {
        qCWarning(lcRemoteDesktop) << "Screen capture failed: no display source";
        return QByteArray();
    }

    QElapsedTimer tickStart;
    tickStart.start();

    QString errorString;
    const QImage image = d->source->grab(region, &errorString);
    if (image.isNull()) {
        qCWarning(lcRemoteDesktop) << "Screen capture failed:" << errorString;
        return QByteArray();
    }

    const QByteArray encoded = QRdFrameCodec::encodeImage(image, quality);
    if (encoded.isEmpty())
        return QByteArray();
    d->lastCapture = tickStart;

    if (changeDetection && d->previousFrame.size() == encoded.size() && d->previousFrame == encoded) {
        qCDebug(lcRemoteDesktop) << "Frame unchanged, skipping";
        return QByteArray();
    }

    d->previousFrame = encoded;
    return QRdFrameCodec::compress(encoded);
}

QRect QRdScreenCapturer::region() const
{
    QMutexLocker locker(&d->mutex);
    return d->region;
}

/*!
    Restricts capture to \a region in display coordinates. A null rectangle
    captures the whole display.
*/
void QRdScreenCapturer::setRegion(const QRect &region)
{
    QMutexLocker locker(&d->mutex);
    d->region = region;
}

int QRdScreenCapturer::quality() const
{
    QMutexLocker locker(&d->mutex);
    return d->quality;
}

// JPEG quality, clamped to [1, 100].
void QRdScreenCapturer::setQuality(int quality)
{
    QMutexLocker locker(&d->mutex);
    d->quality = qBound(1, quality, 100);
}

int QRdScreenCapturer::fps() const
{
    QMutexLocker locker(&d->mutex);
    return d->fps;
}

// Frames per second, clamped to [1, 60].
void QRdScreenCapturer::setFps(int fps)
{
    QMutexLocker locker(&d->mutex);
    d->fps = qBound(1, fps, 60);
}

/*!
    Returns the minimum time between two frames in milliseconds.
*/
int QRdScreenCapturer::frameInterval() const
{
    QMutexLocker locker(&d->mutex);
    return qRound(1000.0 / d->fps);
}

/*!
    Returns the number of milliseconds until the next tick may produce a
    frame, rounded up. Returns 0 if a tick would not be rate limited now.
    Must be called from the capturing thread.
*/
int QRdScreenCapturer::remainingTime() const
{
    if (!d->lastCapture.isValid())
        return 0;
    qint64 interval;
    {
        QMutexLocker locker(&d->mutex);
        interval = d->intervalNSecs();
    }
    const qint64 remaining = interval - d->lastCapture.nsecsElapsed();
    if (remaining <= 0)
        return 0;
    return static_cast<int>((remaining + 999999) / 1000000);
}

bool QRdScreenCapturer::isChangeDetectionEnabled() const
{
    QMutexLocker locker(&d->mutex);
    return d->changeDetection;
}

void QRdScreenCapturer::setChangeDetectionEnabled(bool enabled)
{
    QMutexLocker locker(&d->mutex);
    d->changeDetection = enabled;
}

/*!
    Returns the last encoded (uncompressed) JPEG frame that was produced, or a
    null array before the first frame.
*/
QByteArray QRdScreenCapturer::previousFrame() const
{
    return d->previousFrame;
}

/*!
    Forgets the previous frame, so the next tick produces a frame even if the
    display did not change. Must be called from the capturing thread.
*/
void QRdScreenCapturer::clearPreviousFrame()
{
    d->previousFrame = QByteArray();
}

QT_END_NAMESPACE
