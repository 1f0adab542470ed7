// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// QRdConnection and QRdPeer
// =========================
//
// QRdConnection owns the handler table and either listens for peers (server
// role) or connects to one (client role). Every socket is wrapped in a QRdPeer
// which runs its own QThread:
//
// - The socket is created, read, written and destroyed on the peer thread.
// - Incoming data is decoded on readyRead and dispatched synchronously to the
//   registered handler on the peer thread.
// - send() may be called from any thread. The frame is encoded by the caller
//   and handed to the peer thread as one QByteArray, so frames from different
//   threads are never interleaved on the wire.
// - stop() closes the socket on the peer thread, which also ends reading.
//
#include "qrdconnection.h"

#include <QtCore/QMutex>
#include <QtCore/QPointer>
#include <QtCore/QThread>
#include <QtNetwork/QSslSocket>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>

#include <atomic>
#include <exception>

QT_BEGIN_NAMESPACE

using Handlers = QMap<QRdProtocol::MessageKind, QRdConnection::Handler>;

namespace {

constexpr int CloseTimeout = 1000;

class QRdTcpServer : public QTcpServer
{
public:
    std::function<void(qintptr)> incoming;

protected:
    void incomingConnection(qintptr socketDescriptor) override
    {
        if (incoming)
            incoming(socketDescriptor);
    }
};

} // namespace

/*!
    \internal
    \class QRdPeer::Private
    \brief Worker object living on the peer thread.

    Everything touching the socket runs here. The mutex guards the state that
    other threads read: the running flag, the error and the peer address.
*/
class QRdPeer::Private : public QObject
{
public:
    Private(QRdPeer *parent, QRdConnection *connection, const Handlers &handlers,
            bool tlsEnabled, const QSslConfiguration &sslConfiguration);

    void openDescriptor(qintptr socketDescriptor);
    bool openHost(const QString &hostName, quint16 port, int msecs);
    void watch();

    void read();
    void write(const QByteArray &frame);
    void dispatch(const QRdProtocol::Message &message);
    void close(QRdConnection::Error reason);

    void socketDisconnected();
    void socketError(QAbstractSocket::SocketError error);

    QRdPeer *q;
    QRdConnection *connection;
    const Handlers handlers;
    const bool tlsEnabled;
    const QSslConfiguration sslConfiguration;

    QThread thread;
    QTcpSocket *socket = nullptr;

    mutable QMutex mutex;
    bool running = true;
    bool closed = false;
    QRdConnection::Error error = QRdConnection::NoError;
    QString errorString;
    QHostAddress address;
    quint16 port = 0;

    // Bytes handed to send() that the socket has not written yet
    std::atomic<qint64> backlog { 0 };
};

QRdPeer::Private::Private(QRdPeer *parent, QRdConnection *connection, const Handlers &handlers,
                          bool tlsEnabled, const QSslConfiguration &sslConfiguration)
    : q(parent)
    , connection(connection)
    , handlers(handlers)
    , tlsEnabled(tlsEnabled)
    , sslConfiguration(sslConfiguration)
{
    thread.setObjectName(u"QRdPeer"_s);
    moveToThread(&thread);
}

/*!
    \internal
    Adopts a socket accepted by the server. For TLS the server side handshake
    is started here; frames written before it completes are buffered by
    QSslSocket.
*/
void QRdPeer::Private::openDescriptor(qintptr socketDescriptor)
{
    socket = tlsEnabled ? new QSslSocket(this) : new QTcpSocket(this);
    if (!socket->setSocketDescriptor(socketDescriptor)) {
        qCWarning(lcRemoteDesktop) << "Failed to adopt accepted socket:" << socket->errorString();
        close(QRdConnection::SocketError);
        return;
    }
    {
        QMutexLocker locker(&mutex);
        address = socket->peerAddress();
        port = socket->peerPort();
    }
    qCInfo(lcRemoteDesktop) << "Connection from" << socket->peerAddress() << socket->peerPort();

    watch();
    if (auto *sslSocket = qobject_cast<QSslSocket *>(socket)) {
        sslSocket->setSslConfiguration(sslConfiguration);
        sslSocket->startServerEncryption();
    }
    read();
}

/*!
    \internal
    Connects to \a hostName and blocks up to \a msecs. With TLS enabled the
    certificate is verified against \a hostName using the configured trust.
*/
bool QRdPeer::Private::openHost(const QString &hostName, quint16 port, int msecs)
{
    bool connected = false;
    if (tlsEnabled) {
        auto *sslSocket = new QSslSocket(this);
        socket = sslSocket;
        sslSocket->setSslConfiguration(sslConfiguration);
        sslSocket->connectToHostEncrypted(hostName, port);
        connected = sslSocket->waitForEncrypted(msecs);
    } else {
        socket = new QTcpSocket(this);
        socket->connectToHost(hostName, port);
        connected = socket->waitForConnected(msecs);
    }

    if (!connected) {
        qCWarning(lcRemoteDesktop) << "Failed to connect to" << hostName << port << ":" << socket->errorString();
        {
            QMutexLocker locker(&mutex);
            errorString = socket->errorString();
        }
        close(QRdConnection::SocketError);
        return false;
    }
    {
        QMutexLocker locker(&mutex);
        address = socket->peerAddress();
        this->port = socket->peerPort();
    }
    qCInfo(lcRemoteDesktop) << "Connected to" << hostName << port;

    watch();
    read();
    return true;
}

void QRdPeer::Private::watch()
{
    connect(socket, &QTcpSocket::readyRead, this, [this]() {
        read();
    });
    connect(socket, &QTcpSocket::disconnected, this, [this]() {
        socketDisconnected();
    });
    connect(socket, &QTcpSocket::errorOccurred, this, [this](QAbstractSocket::SocketError error) {
        socketError(error);
    });
    connect(socket, &QTcpSocket::bytesWritten, this, [this](qint64 bytes) {
        backlog -= bytes;
    });
}

/*!
    \internal
    Decodes and dispatches every complete frame in the socket buffer. A frame
    that breaks the framing contract closes the peer, since nothing after it
    can be trusted.
*/
void QRdPeer::Private::read()
{
    while (socket) {
        QRdProtocol::Message message;
        switch (QRdProtocol::tryDecode(socket, &message)) {
        case QRdProtocol::DecodeStatus::Ok:
            dispatch(message);
            break;
        case QRdProtocol::DecodeStatus::NeedMoreData:
            return;
        case QRdProtocol::DecodeStatus::UnknownMessageKind:
            close(QRdConnection::UnknownMessageKindError);
            return;
        case QRdProtocol::DecodeStatus::PayloadTooLarge:
            close(QRdConnection::PayloadTooLargeError);
            return;
        case QRdProtocol::DecodeStatus::SerializationError:
            close(QRdConnection::SerializationError);
            return;
        case QRdProtocol::DecodeStatus::EndOfStream:
        case QRdProtocol::DecodeStatus::TruncatedMessage:
        case QRdProtocol::DecodeStatus::Timeout:
            // Only returned by the blocking decode()
            return;
        }
    }
}

void QRdPeer::Private::write(const QByteArray &frame)
{
    if (!socket)
        return;
    if (socket->write(frame) != frame.size()) {
        qCWarning(lcRemoteDesktop) << "Failed to write frame:" << socket->errorString();
        close(QRdConnection::WriteError);
    }
}

void QRdPeer::Private::dispatch(const QRdProtocol::Message &message)
{
    const auto handler = handlers.value(message.kind);
    if (handler) {
        try {
            handler(message.payload, q);
        } catch (const std::exception &e) {
            qCWarning(lcRemoteDesktop) << "Handler for" << message.kind << "failed:" << e.what();
        }
    } else {
        qCDebug(lcRemoteDesktop) << "No handler for" << message.kind << "- dropped";
    }

    if (message.kind == QRdProtocol::MessageKind::Disconnect) {
        qCInfo(lcRemoteDesktop) << "Peer requested disconnect";
        q->stop();
    }
}

void QRdPeer::Private::socketDisconnected()
{
    // Frames that arrived together with the FIN are still buffered
    read();
    if (!socket)
        return;
    if (socket->bytesAvailable() > 0) {
        qCWarning(lcRemoteDesktop) << "Connection closed inside a frame," << socket->bytesAvailable() << "bytes left";
        close(QRdConnection::TruncatedMessageError);
        return;
    }
    qCInfo(lcRemoteDesktop) << "Remote host closed the connection";
    close(QRdConnection::RemoteClosedError);
}

void QRdPeer::Private::socketError(QAbstractSocket::SocketError error)
{
    if (error == QAbstractSocket::RemoteHostClosedError)
        return; // disconnected() follows
    qCWarning(lcRemoteDesktop) << "Socket error:" << error << socket->errorString();
    {
        QMutexLocker locker(&mutex);
        errorString = socket->errorString();
    }
    close(QRdConnection::SocketError);
}

/*!
    \internal
    Closes the socket. Runs at most once. On an orderly close pending frames
    are flushed before the socket goes away; on an error the socket is
    aborted.
*/
void QRdPeer::Private::close(QRdConnection::Error reason)
{
    {
        QMutexLocker locker(&mutex);
        if (closed)
            return;
        closed = true;
        running = false;
        if (error == QRdConnection::NoError)
            error = reason;
    }

    if (socket) {
        disconnect(socket, nullptr, this, nullptr);
        if (reason == QRdConnection::NoError && socket->state() == QAbstractSocket::ConnectedState) {
            socket->disconnectFromHost();
            if (socket->state() != QAbstractSocket::UnconnectedState)
                socket->waitForDisconnected(CloseTimeout);
        }
        socket->abort();
        socket->deleteLater();
        socket = nullptr;
    }
    backlog = 0;

    if (reason != QRdConnection::NoError && reason != QRdConnection::RemoteClosedError)
        emit q->errorOccurred(reason);
    emit q->stopped();
}

/*!
    \class QRdPeer
    \inmodule QtRemoteDesktop

    \brief One end of a remote desktop session: a socket and the thread that
    reads it.

    Peers are created by QRdConnection and passed to handlers as the source of
    a message. They are deleted by the connection after they stop.
*/

QRdPeer::QRdPeer(QRdConnection *connection, const Handlers &handlers,
                 bool tlsEnabled, const QSslConfiguration &sslConfiguration)
    : QObject(connection)
    , d(new Private(this, connection, handlers, tlsEnabled, sslConfiguration))
{
}

QRdPeer::~QRdPeer()
{
    if (d->thread.isRunning()) {
        Private *p = d.data();
        QMetaObject::invokeMethod(p, [p]() {
            p->close(QRdConnection::NoError);
            p->thread.quit();
        }, Qt::BlockingQueuedConnection);
        d->thread.wait();
    }
}

QRdConnection *QRdPeer::connection() const
{
    return d->connection;
}

bool QRdPeer::isRunning() const
{
    QMutexLocker locker(&d->mutex);
    return d->running;
}

/*!
    Returns the error that stopped the peer, or NoError if it is still running
    or was stopped locally.
*/
QRdConnection::Error QRdPeer::error() const
{
    QMutexLocker locker(&d->mutex);
    return d->error;
}

QHostAddress QRdPeer::peerAddress() const
{
    QMutexLocker locker(&d->mutex);
    return d->address;
}

quint16 QRdPeer::peerPort() const
{
    QMutexLocker locker(&d->mutex);
    return d->port;
}

/*!
    Sends a message of \a kind with \a payload to this peer. Safe to call from
    any thread. Returns false if the peer has stopped.

    The frame is written on the peer thread; a write failure stops the peer.
*/
bool QRdPeer::send(QRdProtocol::MessageKind kind, const QJsonObject &payload)
{
    const QByteArray frame = QRdProtocol::encode(kind, payload);
    Private *p = d.data();

    QMutexLocker locker(&d->mutex);
    if (!d->running) {
        qCDebug(lcRemoteDesktop) << "Peer stopped, dropping" << kind;
        return false;
    }
    d->backlog += frame.size();
    if (QThread::currentThread() == &d->thread) {
        locker.unlock();
        p->write(frame);
    } else {
        // Posted while holding the lock so a concurrent stop() is queued after it
        QMetaObject::invokeMethod(p, [p, frame]() {
            p->write(frame);
        }, Qt::QueuedConnection);
    }
    return true;
}

/*!
    Returns the number of bytes passed to send() that have not been written
    to the operating system yet. A peer that stops reading makes this grow;
    callers that produce data continuously use it to drop data instead of
    queueing it without bound. Safe to call from any thread.
*/
qint64 QRdPeer::bytesToWrite() const
{
    return d->backlog;
}

/*!
    Closes the connection to this peer. Frames already sent are flushed first.
    Calling stop() on a stopped peer does nothing.
*/
void QRdPeer::stop()
{
    {
        QMutexLocker locker(&d->mutex);
        if (!d->running)
            return;
        d->running = false;
    }
    Private *p = d.data();
    if (QThread::currentThread() == &d->thread) {
        p->close(QRdConnection::NoError);
    } else {
        QMetaObject::invokeMethod(p, [p]() {
            p->close(QRdConnection::NoError);
        }, Qt::QueuedConnection);
    }
}

class QRdConnection::Private
{
public:
    Private(QRdConnection *parent, Role role);

    void peerStopped(QRdPeer *peer);
    void setRunning(bool value);

    QRdConnection *q;
    const Role role;
    std::atomic<bool> running { false };
    Handlers handlers;
    bool tlsEnabled = false;
    QSslConfiguration sslConfiguration;
    QRdTcpServer server;
    QString errorString;

    // Peers are added and removed on the connection thread but looked up by
    // send() from any thread.
    mutable QMutex mutex;
    QList<QRdPeer *> peers;
};

QRdConnection::Private::Private(QRdConnection *parent, Role role)
    : q(parent)
    , role(role)
    , sslConfiguration(QSslConfiguration::defaultConfiguration())
{
}

void QRdConnection::Private::peerStopped(QRdPeer *peer)
{
    {
        QMutexLocker locker(&mutex);
        if (!peers.removeOne(peer))
            return;
    }
    qCInfo(lcRemoteDesktop) << "Peer" << peer->peerAddress() << "stopped, error:" << peer->error();
    emit q->peerDisconnected(peer);
    if (role == ClientRole)
        setRunning(false);
    peer->deleteLater();
}

void QRdConnection::Private::setRunning(bool value)
{
    if (running.exchange(value) != value)
        emit q->runningChanged(value);
}

/*!
    \class QRdConnection
    \inmodule QtRemoteDesktop

    \brief Framed message transport between a remote desktop server and client.

    Register a handler per message kind, then call start() (server role) or
    connectToHost() (client role). Handlers run on the thread of the peer the
    message came from and must not be registered while the connection is
    running.

    \sa QRdPeer, QRdProtocol
*/

QRdConnection::QRdConnection(Role role, QObject *parent)
    : QObject(parent)
    , d(new Private(this, role))
{
    d->server.incoming = [this](qintptr socketDescriptor) {
        acceptConnection(socketDescriptor);
    };
}

QRdConnection::~QRdConnection()
{
    stop();
    QList<QRdPeer *> peers;
    {
        QMutexLocker locker(&d->mutex);
        peers.swap(d->peers);
    }
    qDeleteAll(peers);
}

QRdConnection::Role QRdConnection::role() const
{
    return d->role;
}

bool QRdConnection::isRunning() const
{
    return d->running;
}

/*!
    Registers \a handler for messages of \a kind, replacing any earlier one.

    The handler table is copied into each peer when it is created, so it must
    be complete before start() or connectToHost(). Returns false and leaves the
    table untouched if the connection is running.
*/
bool QRdConnection::registerHandler(QRdProtocol::MessageKind kind, Handler handler)
{
    if (isRunning()) {
        qCWarning(lcRemoteDesktop) << "Cannot register a handler for" << kind << "while the connection is running";
        return false;
    }
    if (!handler) {
        qCWarning(lcRemoteDesktop) << "Ignoring empty handler for" << kind;
        return false;
    }
    d->handlers.insert(kind, std::move(handler));
    return true;
}

bool QRdConnection::isTlsEnabled() const
{
    return d->tlsEnabled;
}

void QRdConnection::setTlsEnabled(bool enabled)
{
    d->tlsEnabled = enabled;
}

QSslConfiguration QRdConnection::sslConfiguration() const
{
    return d->sslConfiguration;
}

/*!
    Sets the TLS configuration used when TLS is enabled. A server needs a
    local certificate and private key; a client normally keeps the default
    configuration so the peer is verified against the system trust store.
*/
void QRdConnection::setSslConfiguration(const QSslConfiguration &configuration)
{
    d->sslConfiguration = configuration;
}

/*!
    Starts listening on \a address and \a port. Every accepted socket becomes a
    QRdPeer running its own thread. Returns false if the connection is not in
    the server role or the port cannot be bound.
*/
bool QRdConnection::start(const QHostAddress &address, quint16 port)
{
    if (d->role != ServerRole) {
        qCWarning(lcRemoteDesktop) << "start() requires the server role";
        return false;
    }
    if (isRunning()) {
        qCWarning(lcRemoteDesktop) << "Connection is already running";
        return false;
    }
    if (!d->server.listen(address, port)) {
        d->errorString = d->server.errorString();
        qCWarning(lcRemoteDesktop) << "Failed to listen on" << address << port << ":" << d->errorString;
        return false;
    }
    qCInfo(lcRemoteDesktop) << "Listening on" << address << d->server.serverPort() << (d->tlsEnabled ? "with TLS" : "");
    d->setRunning(true);
    return true;
}

quint16 QRdConnection::serverPort() const
{
    return d->server.serverPort();
}

/*!
    Connects to \a hostName on \a port, waiting up to \a msecs for the
    connection (and the TLS handshake, if enabled). Returns false on failure;
    errorString() then describes the problem.
*/
bool QRdConnection::connectToHost(const QString &hostName, quint16 port, int msecs)
{
    if (d->role != ClientRole) {
        qCWarning(lcRemoteDesktop) << "connectToHost() requires the client role";
        return false;
    }
    if (isRunning()) {
        qCWarning(lcRemoteDesktop) << "Connection is already running";
        return false;
    }

    auto *peer = new QRdPeer(this, d->handlers, d->tlsEnabled, d->sslConfiguration);
    QRdPeer::Private *worker = peer->d.data();
    worker->thread.start();

    bool connected = false;
    QMetaObject::invokeMethod(worker, [&]() {
        connected = worker->openHost(hostName, port, msecs);
    }, Qt::BlockingQueuedConnection);

    if (!connected) {
        {
            QMutexLocker locker(&worker->mutex);
            d->errorString = worker->errorString;
        }
        delete peer;
        return false;
    }

    addPeer(peer);
    d->setRunning(true);
    emit peerConnected(peer);
    return true;
}

void QRdConnection::acceptConnection(qintptr socketDescriptor)
{
    auto *peer = new QRdPeer(this, d->handlers, d->tlsEnabled, d->sslConfiguration);
    QRdPeer::Private *worker = peer->d.data();
    addPeer(peer);
    worker->thread.start();
    QMetaObject::invokeMethod(worker, [worker, socketDescriptor]() {
        worker->openDescriptor(socketDescriptor);
    }, Qt::QueuedConnection);
    emit peerConnected(peer);
}

void QRdConnection::addPeer(QRdPeer *peer)
{
    {
        QMutexLocker locker(&d->mutex);
        d->peers.append(peer);
    }
    // Both signals are emitted on the peer thread and arrive here queued,
    // possibly after the peer was deleted.
    QPointer<QRdPeer> guard(peer);
    connect(peer, &QRdPeer::errorOccurred, this, [this, guard](QRdConnection::Error error) {
        if (guard)
            emit errorOccurred(guard, error);
    });
    connect(peer, &QRdPeer::stopped, this, [this, guard]() {
        if (guard)
            d->peerStopped(guard);
    });
}

/*!
    Sends \a payload as a message of \a kind to \a target. In the client role
    \a target may be null, meaning the connected server.

    Safe to call from any thread. Returns false if there is no running peer to
    send to.
*/
bool QRdConnection::send(QRdProtocol::MessageKind kind, const QJsonObject &payload, QRdPeer *target)
{
    if (target)
        return target->send(kind, payload);

    if (d->role == ServerRole) {
        qCWarning(lcRemoteDesktop) << "send() needs a target peer in the server role";
        return false;
    }
    // Peers are only deleted after leaving the list, so it is safe to send
    // while holding the lock.
    QMutexLocker locker(&d->mutex);
    if (d->peers.isEmpty()) {
        qCDebug(lcRemoteDesktop) << "Not connected, dropping" << kind;
        return false;
    }
    return d->peers.constFirst()->send(kind, payload);
}

/*!
    Stops listening and stops every peer. Safe to call more than once and from
    any thread.
*/
void QRdConnection::stop()
{
    if (d->role == ServerRole) {
        if (QThread::currentThread() == thread()) {
            d->server.close();
        } else {
            QMetaObject::invokeMethod(this, [this]() {
                d->server.close();
            }, Qt::QueuedConnection);
        }
    }

    const auto peers = this->peers();
    for (auto *peer : peers)
        peer->stop();
    d->setRunning(false);
}

QList<QRdPeer *> QRdConnection::peers() const
{
    QMutexLocker locker(&d->mutex);
    return d->peers;
}

QString QRdConnection::errorString() const
{
    return d->errorString;
}

QT_END_NAMESPACE
