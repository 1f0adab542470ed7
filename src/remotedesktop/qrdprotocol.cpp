// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// Remote desktop wire protocol
// ============================
//
// Every message is a fixed 8 byte header followed by a JSON document:
//
//   +----------------+------------------+---------------------------+
//   | kind (u32, BE) | length (u32, BE) | payload (length bytes)    |
//   +----------------+------------------+---------------------------+
//
// The payload is always a JSON object serialized in compact form. Binary data
// is carried as hex text; in this protocol that only applies to the "frame"
// field of ScreenData messages.
//
#include "qrdprotocol.h"

#include <QtCore/QIODevice>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QtEndian>
#include <QtCore/QtNumeric>
#include <QtNetwork/QAbstractSocket>

#include <limits>

QT_BEGIN_NAMESPACE

namespace QRdProtocol {

namespace {

struct FrameHeader {
    quint32_be kind;
    quint32_be length;
};
static_assert(sizeof(FrameHeader) == HeaderSize, "frame header must be 8 bytes");

void setError(QString *errorString, const QString &message)
{
    if (errorString)
        *errorString = message;
}

bool readString(const QJsonObject &json, QLatin1StringView key, QString *out, QString *errorString)
{
    const auto value = json.value(key);
    if (!value.isString()) {
        setError(errorString, u"missing or non-string field \"%1\""_s.arg(key));
        return false;
    }
    *out = value.toString();
    return true;
}

// Numbers come from the peer, so anything that does not fit an int is refused
bool toInt(const QJsonValue &value, int *out)
{
    if (!value.isDouble())
        return false;
    const double number = value.toDouble();
    if (!qIsFinite(number)
        || number < static_cast<double>(std::numeric_limits<int>::min())
        || number > static_cast<double>(std::numeric_limits<int>::max()))
        return false;
    *out = qRound(number);
    return true;
}

bool readInt(const QJsonObject &json, QLatin1StringView key, int *out, QString *errorString)
{
    if (!toInt(json.value(key), out)) {
        setError(errorString, u"field \"%1\" is missing or not an integer in range"_s.arg(key));
        return false;
    }
    return true;
}

bool readPosition(const QJsonObject &json, QPoint *out, QString *errorString)
{
    const auto array = json.value("pos"_L1).toArray();
    int x = 0;
    int y = 0;
    if (array.size() != 2 || !toInt(array.at(0), &x) || !toInt(array.at(1), &y)) {
        setError(errorString, u"field \"pos\" must be an [x, y] array of integers in range"_s);
        return false;
    }
    *out = QPoint(x, y);
    return true;
}

QString buttonName(Qt::MouseButton button)
{
    switch (button) {
    case Qt::RightButton:
        return u"right"_s;
    case Qt::MiddleButton:
        return u"middle"_s;
    default:
        return u"left"_s;
    }
}

} // namespace

/*!
    Returns true if \a value is one of the message kinds defined by the protocol.
*/
bool isValidKind(quint32 value)
{
    return value >= static_cast<quint32>(MessageKind::ScreenData)
        && value <= static_cast<quint32>(MessageKind::Disconnect);
}

/*!
    Serializes \a payload and prefixes it with the frame header for \a kind.
*/
QByteArray encode(MessageKind kind, const QJsonObject &payload)
{
    const QByteArray data = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    FrameHeader header;
    header.kind = static_cast<quint32>(kind);
    header.length = static_cast<quint32>(data.size());

    QByteArray frame;
    frame.reserve(HeaderSize + data.size());
    frame.append(reinterpret_cast<const char *>(&header), sizeof(header));
    frame.append(data);
    return frame;
}

/*!
    Decodes one message from \a device without blocking.

    Returns NeedMoreData and consumes nothing until the header and the whole
    payload are buffered. The kind and the declared length are checked as soon
    as the header is available, so a corrupt header is reported without
    waiting for a payload that may never come.
*/
DecodeStatus tryDecode(QIODevice *device, Message *message)
{
    if (device->bytesAvailable() < HeaderSize)
        return DecodeStatus::NeedMoreData;

    FrameHeader header;
    device->peek(reinterpret_cast<char *>(&header), sizeof(header));
    const quint32 kind = header.kind;
    const quint32 length = header.length;

    if (!isValidKind(kind)) {
        qCWarning(lcRemoteDesktop) << "Unknown message kind:" << kind;
        return DecodeStatus::UnknownMessageKind;
    }
    if (length > MaximumPayloadLength) {
        qCWarning(lcRemoteDesktop) << "Declared payload length too large:" << length;
        return DecodeStatus::PayloadTooLarge;
    }
    if (device->bytesAvailable() < HeaderSize + static_cast<qint64>(length)) {
        qCDebug(lcRemoteDesktop) << "Waiting for payload:" << device->bytesAvailable() - HeaderSize << "of" << length;
        return DecodeStatus::NeedMoreData;
    }

    device->skip(HeaderSize);
    const QByteArray data = device->read(length);

    QJsonParseError error;
    const auto document = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(lcRemoteDesktop) << "Malformed payload:" << error.errorString();
        return DecodeStatus::SerializationError;
    }
    if (!document.isObject()) {
        qCWarning(lcRemoteDesktop) << "Payload is not a JSON object";
        return DecodeStatus::SerializationError;
    }

    message->kind = static_cast<MessageKind>(kind);
    message->payload = document.object();
    return DecodeStatus::Ok;
}

/*!
    Decodes one message from \a device, blocking up to \a msecs for each chunk
    of data (-1 waits forever).

    Returns EndOfStream when the device has nothing left on a message boundary,
    and TruncatedMessage when it ends in the middle of a frame. If the wait
    times out while a socket is still connected, Timeout is returned and any
    partial frame stays buffered for the next call.
*/
DecodeStatus decode(QIODevice *device, Message *message, int msecs)
{
    for (;;) {
        const auto status = tryDecode(device, message);
        if (status != DecodeStatus::NeedMoreData)
            return status;
        if (device->waitForReadyRead(msecs))
            continue;

        const auto *socket = qobject_cast<const QAbstractSocket *>(device);
        if (socket && socket->state() == QAbstractSocket::ConnectedState) {
            qCDebug(lcRemoteDesktop) << "No complete frame within" << msecs << "ms";
            return DecodeStatus::Timeout;
        }
        if (device->bytesAvailable() > 0) {
            qCWarning(lcRemoteDesktop) << "Stream ended inside a frame," << device->bytesAvailable() << "bytes left";
            return DecodeStatus::TruncatedMessage;
        }
        return DecodeStatus::EndOfStream;
    }
}

QString encodeBinary(const QByteArray &data)
{
    return QString::fromLatin1(data.toHex());
}

/*!
    Converts hex \a text back to bytes. QByteArray::fromHex() skips invalid
    characters silently, so the input is validated first.
*/
QByteArray decodeBinary(const QString &text, bool *ok)
{
    bool valid = text.size() % 2 == 0;
    for (qsizetype i = 0; valid && i < text.size(); i++) {
        const char16_t c = text.at(i).unicode();
        valid = (c >= u'0' && c <= u'9') || (c >= u'a' && c <= u'f') || (c >= u'A' && c <= u'F');
    }
    if (ok)
        *ok = valid;
    if (!valid)
        return QByteArray();
    return QByteArray::fromHex(text.toLatin1());
}

QJsonObject ScreenData::toJson() const
{
    return QJsonObject {
        { "frame"_L1, encodeBinary(frame) },
    };
}

bool ScreenData::fromJson(const QJsonObject &json, ScreenData *out, QString *errorString)
{
    QString text;
    if (!readString(json, "frame"_L1, &text, errorString))
        return false;
    bool ok = false;
    out->frame = decodeBinary(text, &ok);
    if (!ok) {
        setError(errorString, u"field \"frame\" is not valid hex"_s);
        return false;
    }
    return true;
}

QJsonObject MouseEvent::toJson() const
{
    QJsonObject json;
    switch (action) {
    case MouseAction::Move:
        json.insert("action"_L1, u"move"_s);
        break;
    case MouseAction::Click:
        json.insert("action"_L1, u"click"_s);
        break;
    case MouseAction::Scroll:
        json.insert("action"_L1, u"scroll"_s);
        json.insert("amount"_L1, amount);
        break;
    case MouseAction::Drag:
        json.insert("action"_L1, u"drag"_s);
        break;
    }
    json.insert("pos"_L1, QJsonArray { pos.x(), pos.y() });
    json.insert("button"_L1, buttonName(button));
    if (action == MouseAction::Click) {
        if (subAction == ButtonAction::Down)
            json.insert("sub_action"_L1, u"down"_s);
        else if (subAction == ButtonAction::Up)
            json.insert("sub_action"_L1, u"up"_s);
        else if (clicks != 1)
            json.insert("clicks"_L1, clicks);
    }
    return json;
}

/*!
    Parses a mouse event. Only the fields the action needs are required:
    move needs pos, click and drag need pos and button, scroll needs amount.
*/
bool MouseEvent::fromJson(const QJsonObject &json, MouseEvent *out, QString *errorString)
{
    QString action;
    if (!readString(json, "action"_L1, &action, errorString))
        return false;

    MouseEvent event;
    if (action == "move"_L1) {
        event.action = MouseAction::Move;
    } else if (action == "click"_L1) {
        event.action = MouseAction::Click;
    } else if (action == "scroll"_L1) {
        event.action = MouseAction::Scroll;
    } else if (action == "drag"_L1) {
        event.action = MouseAction::Drag;
    } else {
        setError(errorString, u"unknown mouse action \"%1\""_s.arg(action));
        return false;
    }

    if (event.action == MouseAction::Scroll) {
        if (!readInt(json, "amount"_L1, &event.amount, errorString))
            return false;
        if (json.contains("pos"_L1) && !readPosition(json, &event.pos, errorString))
            return false;
        *out = event;
        return true;
    }

    if (!readPosition(json, &event.pos, errorString))
        return false;
    if (event.action == MouseAction::Move) {
        *out = event;
        return true;
    }

    QString button;
    if (!readString(json, "button"_L1, &button, errorString))
        return false;
    if (button == "left"_L1) {
        event.button = Qt::LeftButton;
    } else if (button == "right"_L1) {
        event.button = Qt::RightButton;
    } else if (button == "middle"_L1) {
        event.button = Qt::MiddleButton;
    } else {
        setError(errorString, u"unknown mouse button \"%1\""_s.arg(button));
        return false;
    }

    if (json.contains("sub_action"_L1)) {
        const auto subAction = json.value("sub_action"_L1).toString();
        if (subAction == "down"_L1) {
            event.subAction = ButtonAction::Down;
        } else if (subAction == "up"_L1) {
            event.subAction = ButtonAction::Up;
        } else {
            setError(errorString, u"unknown sub_action \"%1\""_s.arg(subAction));
            return false;
        }
    }
    if (json.contains("clicks"_L1) && !readInt(json, "clicks"_L1, &event.clicks, errorString))
        return false;

    *out = event;
    return true;
}

QJsonObject KeyboardEvent::toJson() const
{
    QString name;
    switch (action) {
    case KeyAction::Down:
        name = u"down"_s;
        break;
    case KeyAction::Up:
        name = u"up"_s;
        break;
    case KeyAction::Press:
        name = u"press"_s;
        break;
    case KeyAction::Write:
        name = u"write"_s;
        break;
    }
    return QJsonObject {
        { "key"_L1, key },
        { "action"_L1, name },
    };
}

bool KeyboardEvent::fromJson(const QJsonObject &json, KeyboardEvent *out, QString *errorString)
{
    KeyboardEvent event;
    QString action;
    if (!readString(json, "key"_L1, &event.key, errorString)
        || !readString(json, "action"_L1, &action, errorString))
        return false;
    if (event.key.isEmpty()) {
        setError(errorString, u"field \"key\" is empty"_s);
        return false;
    }

    if (action == "down"_L1) {
        event.action = KeyAction::Down;
    } else if (action == "up"_L1) {
        event.action = KeyAction::Up;
    } else if (action == "press"_L1) {
        event.action = KeyAction::Press;
    } else if (action == "write"_L1) {
        event.action = KeyAction::Write;
    } else {
        setError(errorString, u"unknown key action \"%1\""_s.arg(action));
        return false;
    }
    *out = event;
    return true;
}

QJsonObject ClipboardData::toJson() const
{
    if (request)
        return QJsonObject { { "request"_L1, true } };
    return QJsonObject { { "data"_L1, data } };
}

bool ClipboardData::fromJson(const QJsonObject &json, ClipboardData *out, QString *errorString)
{
    ClipboardData clipboard;
    clipboard.request = json.value("request"_L1).toBool();
    if (!clipboard.request && !readString(json, "data"_L1, &clipboard.data, errorString))
        return false;
    *out = clipboard;
    return true;
}

QJsonObject AuthRequest::toJson() const
{
    return QJsonObject {
        { "username"_L1, username },
        { "password"_L1, password },
    };
}

bool AuthRequest::fromJson(const QJsonObject &json, AuthRequest *out, QString *errorString)
{
    AuthRequest request;
    if (!readString(json, "username"_L1, &request.username, errorString)
        || !readString(json, "password"_L1, &request.password, errorString))
        return false;
    *out = request;
    return true;
}

QJsonObject AuthResponse::toJson() const
{
    QJsonObject json { { "success"_L1, success } };
    if (!message.isEmpty())
        json.insert("message"_L1, message);
    return json;
}

bool AuthResponse::fromJson(const QJsonObject &json, AuthResponse *out, QString *errorString)
{
    const auto success = json.value("success"_L1);
    if (!success.isBool()) {
        setError(errorString, u"missing or non-boolean field \"success\""_s);
        return false;
    }
    out->success = success.toBool();
    out->message = json.value("message"_L1).toString();
    return true;
}

} // namespace QRdProtocol

QT_END_NAMESPACE
