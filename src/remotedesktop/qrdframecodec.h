// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDFRAMECODEC_H
#define QRDFRAMECODEC_H

#include "qtremotedesktopglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

namespace QRdFrameCodec {

constexpr int DefaultCompressionLevel = -1; // Z_DEFAULT_COMPRESSION

QByteArray compress(const QByteArray &data, int level = DefaultCompressionLevel);
QByteArray decompress(const QByteArray &data, bool *ok = nullptr);

QByteArray encodeImage(const QImage &image, int quality);
QImage decodeImage(const QByteArray &data);

/*!
    Sparse byte-level difference between two encoded frames.

    A full-replace diff carries the whole new frame and is produced when there
    is no previous frame. Otherwise \c changes lists the positions inside the
    common length whose byte changed, and \c tail holds the new bytes beyond
    the old length.
*/
struct Diff
{
    struct Change {
        qsizetype position = 0;
        char value = 0;
    };

    bool fullReplace = false;
    QByteArray replacement;
    QList<Change> changes;
    QByteArray tail;
};

Diff diff(const QByteArray &previous, const QByteArray &next);
QByteArray applyDiff(const QByteArray &previous, const Diff &diff);

} // namespace QRdFrameCodec

QT_END_NAMESPACE

#endif // QRDFRAMECODEC_H
