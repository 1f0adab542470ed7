// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDCONNECTION_H
#define QRDCONNECTION_H

#include "qtremotedesktopglobal.h"
#include "qrdprotocol.h"
#include <QtCore/QMap>
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QSslConfiguration>

#include <functional>

QT_BEGIN_NAMESPACE

class QRdPeer;

class QRdConnection : public QObject
{
    Q_OBJECT
    Q_PROPERTY(Role role READ role CONSTANT)
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(bool tlsEnabled READ isTlsEnabled WRITE setTlsEnabled)
public:
    enum Role {
        ClientRole,
        ServerRole,
    };
    Q_ENUM(Role)

    enum Error {
        NoError,
        RemoteClosedError,
        TruncatedMessageError,
        UnknownMessageKindError,
        PayloadTooLargeError,
        SerializationError,
        WriteError,
        SocketError,
    };
    Q_ENUM(Error)

    using Handler = std::function<void(const QJsonObject &payload, QRdPeer *source)>;

    explicit QRdConnection(Role role, QObject *parent = nullptr);
    ~QRdConnection() override;

    Role role() const;
    bool isRunning() const;

    bool registerHandler(QRdProtocol::MessageKind kind, Handler handler);

    bool isTlsEnabled() const;
    void setTlsEnabled(bool enabled);
    QSslConfiguration sslConfiguration() const;
    void setSslConfiguration(const QSslConfiguration &configuration);

    // Server role
    bool start(const QHostAddress &address = QHostAddress::Any, quint16 port = QRdProtocol::DefaultPort);
    quint16 serverPort() const;

    // Client role
    bool connectToHost(const QString &hostName, quint16 port = QRdProtocol::DefaultPort, int msecs = 30000);

    bool send(QRdProtocol::MessageKind kind, const QJsonObject &payload, QRdPeer *target = nullptr);
    void stop();

    QList<QRdPeer *> peers() const;
    QString errorString() const;

signals:
    void peerConnected(QRdPeer *peer);
    void peerDisconnected(QRdPeer *peer);
    void errorOccurred(QRdPeer *peer, QRdConnection::Error error);
    void runningChanged(bool running);

private:
    void acceptConnection(qintptr socketDescriptor);
    void addPeer(QRdPeer *peer);

    class Private;
    QScopedPointer<Private> d;
};

class QRdPeer : public QObject
{
    Q_OBJECT
public:
    ~QRdPeer() override;

    QRdConnection *connection() const;
    bool isRunning() const;
    QRdConnection::Error error() const;
    QHostAddress peerAddress() const;
    quint16 peerPort() const;
    qint64 bytesToWrite() const;

    bool send(QRdProtocol::MessageKind kind, const QJsonObject &payload);
    void stop();

signals:
    void stopped();
    void errorOccurred(QRdConnection::Error error);

private:
    friend class QRdConnection;
    QRdPeer(QRdConnection *connection, const QMap<QRdProtocol::MessageKind, QRdConnection::Handler> &handlers,
            bool tlsEnabled, const QSslConfiguration &sslConfiguration);

    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QRDCONNECTION_H
