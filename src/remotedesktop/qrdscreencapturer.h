// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDSCREENCAPTURER_H
#define QRDSCREENCAPTURER_H

#include "qtremotedesktopglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QRect>
#include <QtCore/QScopedPointer>

QT_BEGIN_NAMESPACE

class QRdDisplaySource;

class QRdScreenCapturer
{
public:
    static constexpr int DefaultQuality = 70;
    static constexpr int DefaultFps = 30;

    explicit QRdScreenCapturer(QRdDisplaySource *source, int quality = DefaultQuality, int fps = DefaultFps);
    ~QRdScreenCapturer();

    QByteArray capture();

    QRect region() const;
    void setRegion(const QRect &region);

    int quality() const;
    void setQuality(int quality);

    int fps() const;
    void setFps(int fps);
    int frameInterval() const;
    int remainingTime() const;

    bool isChangeDetectionEnabled() const;
    void setChangeDetectionEnabled(bool enabled);

    QByteArray previousFrame() const;
    void clearPreviousFrame();

private:
    Q_DISABLE_COPY(QRdScreenCapturer)
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QRDSCREENCAPTURER_H
