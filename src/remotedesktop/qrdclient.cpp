// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// Client side of a remote desktop session
// =======================================
//
// The client connects, sends an auth request and waits for the response:
//
//   Unconnected -> Connecting -> Authenticating -> Authenticated
//                                      |
//                                      +--------> Rejected
//
// Input events are only sent while Authenticated. Screen data is decoded on
// the connection's peer thread; the image is stored under a mutex and the
// signals are emitted on the client's own thread.
//
// Every connectToHost() builds a new QRdConnection. Work posted by an older
// connection is discarded once it reaches the client's thread.
//
#include "qrdclient.h"
#include "qrdconnection.h"
#include "qrdframecodec.h"

#include <QtCore/QMap>
#include <QtCore/QMutex>
#include <QtCore/QPointer>

QT_BEGIN_NAMESPACE

class QRdClient::Private
{
public:
    Private(QRdClient *parent);

    void setState(State state);
    bool send(QRdProtocol::MessageKind kind, const QJsonObject &payload);
    bool sendPositioned(const QRdProtocol::MouseEvent &event);
    void post(QRdConnection *source, std::function<void()> task);

    void screenData(QRdConnection *source, const QJsonObject &payload);
    void authResponse(QRdConnection *source, const QJsonObject &payload);
    void clipboardData(QRdConnection *source, const QJsonObject &payload);
    void connectionStopped(QRdConnection *source);

    QString keyName(const QKeyEvent *e) const;
    void keyEvent(const QKeyEvent *e);
    void pointerEvent(const QMouseEvent *e);
    void wheelEvent(const QWheelEvent *e);

private:
    QRdClient *q;

public:
    QPointer<QRdConnection> connection;
    bool tlsEnabled = false;
    QSslConfiguration sslConfiguration = QSslConfiguration::defaultConfiguration();

    State state = Unconnected;
    QString errorString;

    QPoint lastPointer;
    bool hasLastPointer = false;

    // Written on the peer thread, read anywhere
    mutable QMutex mutex;
    QImage image;
    const QRdConnection *imageSource = nullptr;

    QMap<int, QString> keyMap;
};

QRdClient::Private::Private(QRdClient *parent)
    : q(parent)
{
    const QList<QPair<int, QString>> keyList {
        // Key names understood by the server
        { Qt::Key_Backspace, u"backspace"_s },
        { Qt::Key_Tab, u"tab"_s },
        { Qt::Key_Return, u"enter"_s },
        { Qt::Key_Enter, u"enter"_s },
        { Qt::Key_Insert, u"insert"_s },
        { Qt::Key_Delete, u"delete"_s },
        { Qt::Key_Home, u"home"_s },
        { Qt::Key_End, u"end"_s },
        { Qt::Key_PageUp, u"pageup"_s },
        { Qt::Key_PageDown, u"pagedown"_s },
        { Qt::Key_Left, u"left"_s },
        { Qt::Key_Up, u"up"_s },
        { Qt::Key_Right, u"right"_s },
        { Qt::Key_Down, u"down"_s },
        { Qt::Key_Shift, u"shift"_s },
        { Qt::Key_Control, u"ctrl"_s },
        { Qt::Key_Meta, u"win"_s },
        { Qt::Key_Alt, u"alt"_s },
        { Qt::Key_Escape, u"esc"_s },
        { Qt::Key_Space, u"space"_s },
    };
    for (const auto &key : keyList)
        keyMap.insert(key.first, key.second);
    for (int i = 0; i < 12; i++)
        keyMap.insert(Qt::Key_F1 + i, u"f%1"_s.arg(i + 1));
}

void QRdClient::Private::setState(State state)
{
    if (this->state == state)
        return;
    this->state = state;
    emit q->stateChanged(state);
}

bool QRdClient::Private::send(QRdProtocol::MessageKind kind, const QJsonObject &payload)
{
    if (state != Authenticated || !connection) {
        qCDebug(lcRemoteDesktop) << "Not authenticated, dropping" << kind;
        return false;
    }
    return connection->send(kind, payload);
}

/*!
    \internal
    Sends a mouse event that carries a position and remembers that position,
    since the server pointer has moved there.
*/
bool QRdClient::Private::sendPositioned(const QRdProtocol::MouseEvent &event)
{
    if (!send(QRdProtocol::MessageKind::MouseEvent, event.toJson()))
        return false;
    lastPointer = event.pos;
    hasLastPointer = true;
    return true;
}

/*!
    \internal
    Runs \a task on the client's thread unless \a source has been replaced by
    a newer connection in the meantime. Called from peer threads.
*/
void QRdClient::Private::post(QRdConnection *source, std::function<void()> task)
{
    QPointer<QRdConnection> guard(source);
    QMetaObject::invokeMethod(q, [this, guard, task]() {
        if (guard && guard.data() == connection.data())
            task();
    }, Qt::QueuedConnection);
}

void QRdClient::Private::screenData(QRdConnection *source, const QJsonObject &payload)
{
    QRdProtocol::ScreenData data;
    QString errorString;
    if (!QRdProtocol::ScreenData::fromJson(payload, &data, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed screen data:" << errorString;
        return;
    }

    bool ok = false;
    const QByteArray jpeg = QRdFrameCodec::decompress(data.frame, &ok);
    if (!ok) {
        qCWarning(lcRemoteDesktop) << "Dropping frame that failed to decompress";
        return;
    }
    const QImage frame = QRdFrameCodec::decodeImage(jpeg);
    if (frame.isNull())
        return;

    bool sizeChanged;
    {
        QMutexLocker locker(&mutex);
        if (source != imageSource)
            return;
        sizeChanged = image.size() != frame.size();
        image = frame;
    }

    const QSize size = frame.size();
    post(source, [this, size, sizeChanged]() {
        if (sizeChanged)
            emit q->frameSizeChanged(size);
        emit q->imageChanged(QRect(QPoint(0, 0), size));
    });
}

void QRdClient::Private::authResponse(QRdConnection *source, const QJsonObject &payload)
{
    QRdProtocol::AuthResponse response;
    QString errorString;
    if (!QRdProtocol::AuthResponse::fromJson(payload, &response, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed auth response:" << errorString;
        response.success = false;
        response.message = u"Malformed authentication response"_s;
    }

    if (response.success) {
        qCInfo(lcRemoteDesktop) << "Authenticated:" << response.message;
        post(source, [this]() {
            setState(Authenticated);
            emit q->authenticated();
        });
        return;
    }

    qCWarning(lcRemoteDesktop) << "Authentication failed:" << response.message;
    const QString message = response.message;
    post(source, [this, message]() {
        this->errorString = message;
        setState(Rejected);
        emit q->authenticationFailed(message);
    });
    // Stopped here rather than on the client's thread so that no event queued
    // in between can reach the server.
    source->stop();
}

void QRdClient::Private::clipboardData(QRdConnection *source, const QJsonObject &payload)
{
    QRdProtocol::ClipboardData data;
    QString errorString;
    if (!QRdProtocol::ClipboardData::fromJson(payload, &data, &errorString)) {
        qCWarning(lcRemoteDesktop) << "Malformed clipboard data:" << errorString;
        return;
    }
    if (data.request) {
        qCDebug(lcRemoteDesktop) << "Ignoring clipboard request from server";
        return;
    }
    const QString text = data.data;
    post(source, [this, text]() {
        emit q->clipboardReceived(text);
    });
}

void QRdClient::Private::connectionStopped(QRdConnection *source)
{
    if (source != connection)
        return;
    qCInfo(lcRemoteDesktop) << "Disconnected from remote desktop server";
    if (state != Rejected)
        setState(Unconnected);
    emit q->disconnected();
}

QString QRdClient::Private::keyName(const QKeyEvent *e) const
{
    const int key = e->key();
    if (keyMap.contains(key))
        return keyMap.value(key);
    if (key >= Qt::Key_A && key <= Qt::Key_Z)
        return QString(QChar(u'a' + (key - Qt::Key_A)));
    if (key >= Qt::Key_0 && key <= Qt::Key_9)
        return QString(QChar(u'0' + (key - Qt::Key_0)));
    const QString text = e->text();
    if (!text.isEmpty() && text.at(0).isPrint())
        return text;
    return QString();
}

void QRdClient::Private::keyEvent(const QKeyEvent *e)
{
    const QString name = keyName(e);
    if (name.isEmpty()) {
        qCDebug(lcRemoteDesktop) << "Unmapped key" << Qt::hex << e->key();
        return;
    }
    const auto action = e->type() == QEvent::KeyPress ? QRdProtocol::KeyAction::Down : QRdProtocol::KeyAction::Up;
    q->sendKey(name, action);
}

void QRdClient::Private::pointerEvent(const QMouseEvent *e)
{
    const QPoint pos = e->position().toPoint();
    switch (e->type()) {
    case QEvent::MouseMove:
        q->sendMouseMove(pos);
        break;
    case QEvent::MouseButtonPress:
    case QEvent::MouseButtonDblClick:
        q->sendMouseButton(pos, e->button(), QRdProtocol::ButtonAction::Down);
        break;
    case QEvent::MouseButtonRelease:
        q->sendMouseButton(pos, e->button(), QRdProtocol::ButtonAction::Up);
        break;
    default:
        break;
    }
}

void QRdClient::Private::wheelEvent(const QWheelEvent *e)
{
    // One notch is 120 units
    const int amount = e->angleDelta().y() / 120;
    if (amount != 0)
        q->sendMouseScroll(amount);
}

/*!
    \class QRdClient
    \inmodule QtRemoteDesktop

    \brief Views and controls a remote desktop shared by QRdServer.

    Call connectToHost() with credentials, wait for authenticated(), then draw
    image() whenever imageChanged() is emitted and forward local input with the
    send functions or the Qt event adapters.
*/

QRdClient::QRdClient(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
}

QRdClient::~QRdClient()
{
    // Connection threads call into d, so join them before d goes away
    d->connection = nullptr;
    const auto connections = findChildren<QRdConnection *>(Qt::FindDirectChildrenOnly);
    qDeleteAll(connections);
}

QRdClient::State QRdClient::state() const
{
    return d->state;
}

/*!
    Returns a description of the last connection failure or the message of
    the last rejected authentication.
*/
QString QRdClient::errorString() const
{
    return d->errorString;
}

void QRdClient::setTlsEnabled(bool enabled)
{
    d->tlsEnabled = enabled;
}

void QRdClient::setSslConfiguration(const QSslConfiguration &configuration)
{
    d->sslConfiguration = configuration;
}

/*!
    Connects to the server at \a hostName and \a port and logs in with
    \a username and \a password. Any previous connection is dropped.

    Blocks until the connection is established. Returns false if it could not
    be; the outcome of authentication is reported later through authenticated()
    or authenticationFailed().
*/
bool QRdClient::connectToHost(const QString &hostName, quint16 port,
                              const QString &username, const QString &password)
{
    if (d->connection) {
        QRdConnection *previous = d->connection;
        d->connection = nullptr;
        previous->stop();
        previous->deleteLater();
    }
    d->hasLastPointer = false;
    d->errorString.clear();
    d->setState(Connecting);

    auto *connection = new QRdConnection(QRdConnection::ClientRole, this);
    connection->setTlsEnabled(d->tlsEnabled);
    connection->setSslConfiguration(d->sslConfiguration);
    connection->registerHandler(QRdProtocol::MessageKind::ScreenData, [this, connection](const QJsonObject &payload, QRdPeer *) {
        d->screenData(connection, payload);
    });
    connection->registerHandler(QRdProtocol::MessageKind::AuthResponse, [this, connection](const QJsonObject &payload, QRdPeer *) {
        d->authResponse(connection, payload);
    });
    connection->registerHandler(QRdProtocol::MessageKind::ClipboardData, [this, connection](const QJsonObject &payload, QRdPeer *) {
        d->clipboardData(connection, payload);
    });
    connect(connection, &QRdConnection::runningChanged, this, [this, connection](bool running) {
        if (!running)
            d->connectionStopped(connection);
    });
    d->connection = connection;
    {
        QMutexLocker locker(&d->mutex);
        d->imageSource = connection;
    }

    if (!connection->connectToHost(hostName, port)) {
        d->errorString = connection->errorString();
        d->connection = nullptr;
        connection->deleteLater();
        d->setState(Unconnected);
        return false;
    }

    d->setState(Authenticating);
    QRdProtocol::AuthRequest request;
    request.username = username;
    request.password = password;
    connection->send(QRdProtocol::MessageKind::AuthRequest, request.toJson());
    return true;
}

/*!
    Tells the server the session is over and closes the connection.
*/
void QRdClient::disconnectFromHost()
{
    if (!d->connection)
        return;
    if (d->connection->isRunning()) {
        d->connection->send(QRdProtocol::MessageKind::Disconnect, QJsonObject());
        d->connection->stop();
    } else if (d->state != Rejected) {
        d->setState(Unconnected);
    }
}

QRdConnection *QRdClient::connection() const
{
    return d->connection;
}

/*!
    Returns the last frame received from the server.
*/
QImage QRdClient::image() const
{
    QMutexLocker locker(&d->mutex);
    return d->image;
}

QSize QRdClient::frameSize() const
{
    QMutexLocker locker(&d->mutex);
    return d->image.size();
}

/*!
    Moves the remote pointer to \a pos. A move to the position of the last
    positioned mouse event sent is suppressed and returns false.
*/
bool QRdClient::sendMouseMove(const QPoint &pos)
{
    if (d->hasLastPointer && d->lastPointer == pos)
        return false;
    QRdProtocol::MouseEvent event;
    event.action = QRdProtocol::MouseAction::Move;
    event.pos = pos;
    return d->sendPositioned(event);
}

bool QRdClient::sendMouseButton(const QPoint &pos, Qt::MouseButton button, QRdProtocol::ButtonAction action)
{
    QRdProtocol::MouseEvent event;
    event.action = QRdProtocol::MouseAction::Click;
    event.pos = pos;
    event.button = button;
    event.subAction = action;
    return d->sendPositioned(event);
}

bool QRdClient::sendMouseClick(const QPoint &pos, Qt::MouseButton button, int clicks)
{
    QRdProtocol::MouseEvent event;
    event.action = QRdProtocol::MouseAction::Click;
    event.pos = pos;
    event.button = button;
    event.clicks = qMax(1, clicks);
    return d->sendPositioned(event);
}

bool QRdClient::sendMouseDrag(const QPoint &pos, Qt::MouseButton button)
{
    QRdProtocol::MouseEvent event;
    event.action = QRdProtocol::MouseAction::Drag;
    event.pos = pos;
    event.button = button;
    return d->sendPositioned(event);
}

// Positive amounts scroll up.
bool QRdClient::sendMouseScroll(int amount)
{
    QRdProtocol::MouseEvent event;
    event.action = QRdProtocol::MouseAction::Scroll;
    event.amount = amount;
    return d->send(QRdProtocol::MessageKind::MouseEvent, event.toJson());
}

bool QRdClient::sendKey(const QString &key, QRdProtocol::KeyAction action)
{
    QRdProtocol::KeyboardEvent event;
    event.key = key;
    event.action = action;
    return d->send(QRdProtocol::MessageKind::KeyboardEvent, event.toJson());
}

/*!
    Types \a text on the server as literal characters.
*/
bool QRdClient::sendText(const QString &text)
{
    if (text.isEmpty())
        return false;
    return sendKey(text, QRdProtocol::KeyAction::Write);
}

bool QRdClient::requestClipboard()
{
    QRdProtocol::ClipboardData data;
    data.request = true;
    return d->send(QRdProtocol::MessageKind::ClipboardData, data.toJson());
}

bool QRdClient::sendClipboard(const QString &text)
{
    QRdProtocol::ClipboardData data;
    data.data = text;
    return d->send(QRdProtocol::MessageKind::ClipboardData, data.toJson());
}

void QRdClient::handleKeyEvent(QKeyEvent *e)
{
    d->keyEvent(e);
}

void QRdClient::handlePointerEvent(QMouseEvent *e)
{
    d->pointerEvent(e);
}

void QRdClient::handleWheelEvent(QWheelEvent *e)
{
    d->wheelEvent(e);
}

QT_END_NAMESPACE
