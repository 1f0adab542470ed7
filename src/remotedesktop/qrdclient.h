// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDCLIENT_H
#define QRDCLIENT_H

#include "qtremotedesktopglobal.h"
#include "qrdprotocol.h"
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtGui/QImage>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>
#include <QtNetwork/QSslConfiguration>

QT_BEGIN_NAMESPACE

class QRdConnection;

class QRdClient : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)
    Q_PROPERTY(QSize frameSize READ frameSize NOTIFY frameSizeChanged)
public:
    enum State {
        Unconnected,
        Connecting,
        Authenticating,
        Authenticated,
        Rejected,
    };
    Q_ENUM(State)

    explicit QRdClient(QObject *parent = nullptr);
    ~QRdClient() override;

    State state() const;
    QString errorString() const;

    void setTlsEnabled(bool enabled);
    void setSslConfiguration(const QSslConfiguration &configuration);

    bool connectToHost(const QString &hostName, quint16 port,
                       const QString &username = QString(), const QString &password = QString());
    void disconnectFromHost();

    QRdConnection *connection() const;

    // Get current image
    QImage image() const;
    QSize frameSize() const;

    bool sendMouseMove(const QPoint &pos);
    bool sendMouseButton(const QPoint &pos, Qt::MouseButton button, QRdProtocol::ButtonAction action);
    bool sendMouseClick(const QPoint &pos, Qt::MouseButton button, int clicks = 1);
    bool sendMouseDrag(const QPoint &pos, Qt::MouseButton button);
    bool sendMouseScroll(int amount);
    bool sendKey(const QString &key, QRdProtocol::KeyAction action);
    bool sendText(const QString &text);
    bool requestClipboard();
    bool sendClipboard(const QString &text);

    // Process input events
    void handleKeyEvent(QKeyEvent *e);
    void handlePointerEvent(QMouseEvent *e);
    void handleWheelEvent(QWheelEvent *e);

signals:
    void stateChanged(QRdClient::State state);
    void authenticated();
    void authenticationFailed(const QString &message);
    void disconnected();
    void frameSizeChanged(const QSize &size);
    void imageChanged(const QRect &rect);
    void clipboardReceived(const QString &text);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QRDCLIENT_H
