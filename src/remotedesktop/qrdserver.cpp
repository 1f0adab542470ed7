// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// Server side of a remote desktop session
// =======================================
//
// Handlers registered on the connection run on the peer threads. They only
// capture the payload and the source peer and post the real work to the
// controller's thread, where the display, the injector and the clipboard are
// used. Peers are deleted on that same thread, so a QPointer checked there is
// enough to know whether the source is still alive.
//
// Session per peer:
//
//   connected --auth ok--> authenticated --disconnect--> gone
//       |
//       +--auth failed--> rejected --grace period--> stopped
//
// Only authenticated peers can inject input or touch the clipboard. Screen
// data goes to the most recently authenticated peer.
//
#include "qrdserver.h"
#include "qrdcapabilities.h"
#include "qrdscreencapturer.h"

#include <QtCore/QPointer>
#include <QtCore/QTimer>

QT_BEGIN_NAMESPACE

class QRdServer::Private
{
public:
    Private(QRdServer *parent, QRdDisplaySource *display, QRdInputInjector *injector, QRdClipboard *clipboard);

    void post(QRdPeer *source, std::function<void(QRdPeer *)> task);
    bool isAuthenticated(QRdPeer *peer, QRdProtocol::MessageKind kind) const;

    void authenticate(QRdPeer *peer, const QJsonObject &payload);
    void reject(QRdPeer *peer, const QString &message);
    void mouseEvent(QRdPeer *peer, const QJsonObject &payload);
    void keyboardEvent(QRdPeer *peer, const QJsonObject &payload);
    void clipboardData(QRdPeer *peer, const QJsonObject &payload);
    void peerDisconnected(QRdPeer *peer);

    void captureFrame();

private:
    QRdServer *q;

public:
    QRdDisplaySource *display;
    QRdInputInjector *injector;
    QRdClipboard *clipboard;

    QRdConnection connection;
    QRdScreenCapturer capturer;
    QTimer captureTimer;

    Authenticator authenticator;
    int authFailureGracePeriod = DefaultAuthFailureGracePeriod;
    qint64 maximumScreenBacklog = DefaultMaximumScreenBacklog;

    // Ordered by authentication time, most recent last
    QList<QRdPeer *> authenticated;
};

QRdServer::Private::Private(QRdServer *parent, QRdDisplaySource *display, QRdInputInjector *injector, QRdClipboard *clipboard)
    : q(parent)
    , display(display)
    , injector(injector)
    , clipboard(clipboard)
    , connection(QRdConnection::ServerRole)
    , capturer(display)
{
    captureTimer.setSingleShot(true);
    captureTimer.setTimerType(Qt::PreciseTimer);
    QObject::connect(&captureTimer, &QTimer::timeout, q, [this]() {
        captureFrame();
    });

    connection.registerHandler(QRdProtocol::MessageKind::AuthRequest, [this](const QJsonObject &payload, QRdPeer *source) {
        post(source, [this, payload](QRdPeer *peer) {
            authenticate(peer, payload);
        });
    });
    connection.registerHandler(QRdProtocol::MessageKind::MouseEvent, [this](const QJsonObject &payload, QRdPeer *source) {
        post(source, [this, payload](QRdPeer *peer) {
            mouseEvent(peer, payload);
        });
    });
    connection.registerHandler(QRdProtocol::MessageKind::KeyboardEvent, [this](const QJsonObject &payload, QRdPeer *source) {
        post(source, [this, payload](QRdPeer *peer) {
            keyboardEvent(peer, payload);
        });
    });
    connection.registerHandler(QRdProtocol::MessageKind::ClipboardData, [this](const QJsonObject &payload, QRdPeer *source) {
        post(source, [this, payload](QRdPeer *peer) {
            clipboardData(peer, payload);
        });
    });

    QObject::connect(&connection, &QRdConnection::peerDisconnected, q, [this](QRdPeer *peer) {
        peerDisconnected(peer);
    });
    QObject::connect(&connection, &QRdConnection::runningChanged, q, &QRdServer::listeningChanged);
}

/*!
    \internal
    Runs \a task on the controller's thread if \a source is still alive by
    then. Called from peer threads.
*/
void QRdServer::Private::post(QRdPeer *source, std::function<void(QRdPeer *)> task)
{
    QPointer<QRdPeer> guard(source);
    QMetaObject::invokeMethod(q, [guard, task]() {
        if (guard)
            task(guard);
    }, Qt::QueuedConnection);
}

bool QRdServer::Private::isAuthenticated(QRdPeer *peer, QRdProtocol::MessageKind kind) const
{
    if (authenticated.contains(peer))
        return true;
    qCWarning(lcRemoteDesktop) << "Dropping" << kind << "from unauthenticated peer" << peer->peerAddress();
    return false;
}

void QRdServer::Private::authenticate(QRdPeer *peer, const QJsonObject &payload)
{
    QRdProtocol::AuthRequest request;
    QString errorString;
    if (!QRdProtocol::AuthRequest::fromJson(payload, &request, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed auth request:" << errorString;
        reject(peer, u"Malformed authentication request"_s);
        return;
    }

    QString message;
    bool accepted = true;
    if (authenticator)
        accepted = authenticator(request.username, request.password, &message);
    if (!accepted) {
        if (message.isEmpty())
            message = u"Authentication failed"_s;
        reject(peer, message);
        return;
    }

    if (message.isEmpty())
        message = u"Authenticated"_s;
    peer->send(QRdProtocol::MessageKind::AuthResponse, QRdProtocol::AuthResponse { true, message }.toJson());

    authenticated.removeOne(peer);
    authenticated.append(peer);
    qCInfo(lcRemoteDesktop) << "Client" << peer->peerAddress() << "authenticated as" << request.username;
    emit q->clientAuthenticated(peer);

    // The new active peer has no frame yet
    capturer.clearPreviousFrame();
    if (!captureTimer.isActive())
        captureTimer.start(0);
}

/*!
    \internal
    Answers with a failed auth response and stops the peer once the grace
    period is over, which gives the response time to reach the client.
*/
void QRdServer::Private::reject(QRdPeer *peer, const QString &message)
{
    peer->send(QRdProtocol::MessageKind::AuthResponse, QRdProtocol::AuthResponse { false, message }.toJson());
    authenticated.removeOne(peer);
    qCInfo(lcRemoteDesktop) << "Client" << peer->peerAddress() << "rejected:" << message;
    emit q->authenticationRejected(peer, message);

    QPointer<QRdPeer> guard(peer);
    QTimer::singleShot(authFailureGracePeriod, q, [guard]() {
        if (guard)
            guard->stop();
    });
}

void QRdServer::Private::mouseEvent(QRdPeer *peer, const QJsonObject &payload)
{
    if (!isAuthenticated(peer, QRdProtocol::MessageKind::MouseEvent))
        return;

    QRdProtocol::MouseEvent event;
    QString errorString;
    if (!QRdProtocol::MouseEvent::fromJson(payload, &event, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed mouse event:" << errorString;
        return;
    }
    if (!injector) {
        qCDebug(lcRemoteDesktop) << "No input injector, mouse event dropped";
        return;
    }
    if (!injector->injectMouseEvent(event, &errorString))
        qCWarning(lcRemoteDesktop) << "Mouse injection failed:" << errorString;
}

void QRdServer::Private::keyboardEvent(QRdPeer *peer, const QJsonObject &payload)
{
    if (!isAuthenticated(peer, QRdProtocol::MessageKind::KeyboardEvent))
        return;

    QRdProtocol::KeyboardEvent event;
    QString errorString;
    if (!QRdProtocol::KeyboardEvent::fromJson(payload, &event, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed keyboard event:" << errorString;
        return;
    }
    if (!injector) {
        qCDebug(lcRemoteDesktop) << "No input injector, keyboard event dropped";
        return;
    }
    if (!injector->injectKeyboardEvent(event, &errorString))
        qCWarning(lcRemoteDesktop) << "Keyboard injection failed:" << errorString;
}

void QRdServer::Private::clipboardData(QRdPeer *peer, const QJsonObject &payload)
{
    if (!isAuthenticated(peer, QRdProtocol::MessageKind::ClipboardData))
        return;

    QRdProtocol::ClipboardData data;
    QString errorString;
    if (!QRdProtocol::ClipboardData::fromJson(payload, &data, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed clipboard data:" << errorString;
        return;
    }
    if (!clipboard) {
        qCDebug(lcRemoteDesktop) << "No clipboard, clipboard data dropped";
        return;
    }

    if (data.request) {
        QRdProtocol::ClipboardData reply;
        reply.data = clipboard->text();
        peer->send(QRdProtocol::MessageKind::ClipboardData, reply.toJson());
    } else if (!clipboard->setText(data.data, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Failed to set clipboard:" << errorString;
    }
}

void QRdServer::Private::peerDisconnected(QRdPeer *peer)
{
    const bool wasActive = !authenticated.isEmpty() && authenticated.constLast() == peer;
    authenticated.removeOne(peer);
    if (authenticated.isEmpty())
        captureTimer.stop();
    else if (wasActive)
        qCInfo(lcRemoteDesktop) << "Screen data now goes to" << authenticated.constLast()->peerAddress();
    emit q->clientDisconnected(peer);
}

/*!
    \internal
    One tick of the capture loop. The timer is re-armed for the moment the
    capturer will accept the next frame, so ticks never land early and get
    rate limited away.

    While the active peer has more than maximumScreenBacklog bytes unwritten
    the display is not grabbed at all, so the skipped frame is not remembered
    as sent.
*/
void QRdServer::Private::captureFrame()
{
    if (authenticated.isEmpty())
        return;

    QRdPeer *peer = authenticated.constLast();
    const qint64 pending = peer->bytesToWrite();
    if (pending > maximumScreenBacklog) {
        qCDebug(lcRemoteDesktop) << "Client" << peer->peerAddress() << "is" << pending << "bytes behind, frame skipped";
        captureTimer.start(capturer.frameInterval());
        return;
    }

    const QByteArray frame = capturer.capture();
    if (!frame.isEmpty()) {
        QRdProtocol::ScreenData data;
        data.frame = frame;
        peer->send(QRdProtocol::MessageKind::ScreenData, data.toJson());
    }

    int next = capturer.remainingTime();
    if (next <= 0)
        next = capturer.frameInterval();
    captureTimer.start(next);
}

/*!
    \class QRdServer
    \inmodule QtRemoteDesktop

    \brief Shares a display with remote desktop clients and injects their
    input.

    The server does not own \a display, \a injector or \a clipboard; each may
    be null, in which case the matching feature is disabled. They are only
    used from the thread the server lives in, which should be the GUI thread.

    \sa QRdClient
*/

QRdServer::QRdServer(QRdDisplaySource *display, QRdInputInjector *injector, QRdClipboard *clipboard,
                     QObject *parent)
    : QObject(parent)
    , d(new Private(this, display, injector, clipboard))
{
}

QRdServer::~QRdServer()
{
    d->captureTimer.stop();
    d->connection.stop();
}

/*!
    Sets the function that decides whether a client may log in. Without one
    every client is accepted.
*/
void QRdServer::setAuthenticator(Authenticator authenticator)
{
    d->authenticator = std::move(authenticator);
}

int QRdServer::authFailureGracePeriod() const
{
    return d->authFailureGracePeriod;
}

void QRdServer::setAuthFailureGracePeriod(int msecs)
{
    d->authFailureGracePeriod = qMax(0, msecs);
}

qint64 QRdServer::maximumScreenBacklog() const
{
    return d->maximumScreenBacklog;
}

/*!
    Sets how many unwritten bytes the active client may have queued before
    screen frames are skipped for it. Input and clipboard replies are never
    skipped.
*/
void QRdServer::setMaximumScreenBacklog(qint64 bytes)
{
    d->maximumScreenBacklog = qMax(qint64(0), bytes);
}

void QRdServer::setTlsEnabled(bool enabled)
{
    d->connection.setTlsEnabled(enabled);
}

void QRdServer::setSslConfiguration(const QSslConfiguration &configuration)
{
    d->connection.setSslConfiguration(configuration);
}

QRdScreenCapturer *QRdServer::capturer() const
{
    return &d->capturer;
}

QRdConnection *QRdServer::connection() const
{
    return &d->connection;
}

bool QRdServer::listen(const QHostAddress &address, quint16 port)
{
    return d->connection.start(address, port);
}

bool QRdServer::isListening() const
{
    return d->connection.isRunning();
}

quint16 QRdServer::serverPort() const
{
    return d->connection.serverPort();
}

/*!
    Stops listening and disconnects every client.
*/
void QRdServer::close()
{
    d->captureTimer.stop();
    d->connection.stop();
}

/*!
    Returns the peer screen data is sent to, or null if no client is
    authenticated.
*/
QRdPeer *QRdServer::activePeer() const
{
    return d->authenticated.isEmpty() ? nullptr : d->authenticated.constLast();
}

QString QRdServer::errorString() const
{
    return d->connection.errorString();
}

QT_END_NAMESPACE
