// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDSERVER_H
#define QRDSERVER_H

#include "qtremotedesktopglobal.h"
#include "qrdconnection.h"
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QSslConfiguration>

#include <functional>

QT_BEGIN_NAMESPACE

class QRdClipboard;
class QRdDisplaySource;
class QRdInputInjector;
class QRdScreenCapturer;

class QRdServer : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool listening READ isListening NOTIFY listeningChanged)
    Q_PROPERTY(int authFailureGracePeriod READ authFailureGracePeriod WRITE setAuthFailureGracePeriod)
public:
    // Returns true to accept. message is sent back in the auth response.
    using Authenticator = std::function<bool(const QString &username, const QString &password, QString *message)>;

    static constexpr int DefaultAuthFailureGracePeriod = 1000;
    static constexpr qint64 DefaultMaximumScreenBacklog = 8 * 1024 * 1024;

    QRdServer(QRdDisplaySource *display, QRdInputInjector *injector, QRdClipboard *clipboard,
              QObject *parent = nullptr);
    ~QRdServer() override;

    void setAuthenticator(Authenticator authenticator);

    int authFailureGracePeriod() const;
    void setAuthFailureGracePeriod(int msecs);

    qint64 maximumScreenBacklog() const;
    void setMaximumScreenBacklog(qint64 bytes);

    void setTlsEnabled(bool enabled);
    void setSslConfiguration(const QSslConfiguration &configuration);

    QRdScreenCapturer *capturer() const;
    QRdConnection *connection() const;

    bool listen(const QHostAddress &address = QHostAddress::Any, quint16 port = QRdProtocol::DefaultPort);
    bool isListening() const;
    quint16 serverPort() const;
    void close();

    QRdPeer *activePeer() const;
    QString errorString() const;

signals:
    void listeningChanged(bool listening);
    void clientAuthenticated(QRdPeer *peer);
    void authenticationRejected(QRdPeer *peer, const QString &message);
    void clientDisconnected(QRdPeer *peer);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QRDSERVER_H
