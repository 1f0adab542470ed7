// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrdcapabilities.h"

#include <QtGui/QClipboard>
#include <QtGui/QGuiApplication>
#include <QtGui/QPixmap>
#include <QtGui/QScreen>

QT_BEGIN_NAMESPACE

QImage QRdScreenSource::grab(const QRect &region, QString *errorString)
{
    QScreen *screen = QGuiApplication::primaryScreen();
    if (!screen) {
        if (errorString)
            *errorString = u"no display available"_s;
        return QImage();
    }

    const QPixmap pixmap = region.isNull()
        ? screen->grabWindow(0)
        : screen->grabWindow(0, region.x(), region.y(), region.width(), region.height());
    if (pixmap.isNull()) {
        if (errorString)
            *errorString = u"screen grab denied or failed"_s;
        return QImage();
    }
    return pixmap.toImage();
}

QString QRdSystemClipboard::text() const
{
    const QClipboard *clipboard = QGuiApplication::clipboard();
    return clipboard ? clipboard->text() : QString();
}

bool QRdSystemClipboard::setText(const QString &text, QString *errorString)
{
    QClipboard *clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        if (errorString)
            *errorString = u"clipboard unavailable"_s;
        return false;
    }
    clipboard->setText(text);
    return true;
}

QT_END_NAMESPACE
