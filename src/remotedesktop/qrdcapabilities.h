// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDCAPABILITIES_H
#define QRDCAPABILITIES_H

#include "qtremotedesktopglobal.h"
#include "qrdprotocol.h"
#include <QtCore/QRect>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

// Platform services the session controllers depend on. Implementations report
// failures through errorString; callers log them and carry on.

class QRdDisplaySource
{
public:
    virtual ~QRdDisplaySource() = default;

    // A null region means the whole display.
    virtual QImage grab(const QRect &region, QString *errorString) = 0;
};

class QRdInputInjector
{
public:
    virtual ~QRdInputInjector() = default;

    virtual bool injectMouseEvent(const QRdProtocol::MouseEvent &event, QString *errorString) = 0;
    virtual bool injectKeyboardEvent(const QRdProtocol::KeyboardEvent &event, QString *errorString) = 0;
};

class QRdClipboard
{
public:
    virtual ~QRdClipboard() = default;

    virtual QString text() const = 0;
    virtual bool setText(const QString &text, QString *errorString) = 0;
};

// Grabs the primary screen. Must be used from the GUI thread.
class QRdScreenSource : public QRdDisplaySource
{
public:
    QImage grab(const QRect &region, QString *errorString) override;
};

// Wraps QGuiApplication::clipboard(). Must be used from the GUI thread.
class QRdSystemClipboard : public QRdClipboard
{
public:
    QString text() const override;
    bool setText(const QString &text, QString *errorString) override;
};

QT_END_NAMESPACE

#endif // QRDCAPABILITIES_H
