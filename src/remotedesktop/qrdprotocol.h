// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRDPROTOCOL_H
#define QRDPROTOCOL_H

#include "qtremotedesktopglobal.h"
#include <QtCore/QObject>
#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QPoint>

QT_BEGIN_NAMESPACE

class QIODevice;

namespace QRdProtocol {
Q_NAMESPACE

constexpr quint16 DefaultPort = 50000;
constexpr int HeaderSize = 8;
constexpr quint32 MaximumPayloadLength = 64 * 1024 * 1024;

enum class MessageKind : quint32 {
    ScreenData = 1,
    MouseEvent = 2,
    KeyboardEvent = 3,
    ClipboardData = 4,
    FileTransfer = 5,   ///< Reserved, never produced
    AuthRequest = 6,
    AuthResponse = 7,
    Disconnect = 8,
};
Q_ENUM_NS(MessageKind)

enum class DecodeStatus {
    Ok,
    NeedMoreData,
    EndOfStream,
    TruncatedMessage,
    UnknownMessageKind,
    PayloadTooLarge,
    SerializationError,
    Timeout,    ///< decode() waited in vain on a device that is still open
};
Q_ENUM_NS(DecodeStatus)

enum class MouseAction {
    Move,
    Click,
    Scroll,
    Drag,
};
Q_ENUM_NS(MouseAction)

enum class ButtonAction {
    Full,   ///< Press and release
    Down,
    Up,
};
Q_ENUM_NS(ButtonAction)

enum class KeyAction {
    Down,
    Up,
    Press,
    Write,  ///< key carries literal text to type
};
Q_ENUM_NS(KeyAction)

struct Message
{
    MessageKind kind = MessageKind::Disconnect;
    QJsonObject payload;
};

bool isValidKind(quint32 value);

QByteArray encode(MessageKind kind, const QJsonObject &payload);
DecodeStatus tryDecode(QIODevice *device, Message *message);
DecodeStatus decode(QIODevice *device, Message *message, int msecs = -1);

QString encodeBinary(const QByteArray &data);
QByteArray decodeBinary(const QString &text, bool *ok = nullptr);

// Typed payloads. fromJson() returns false and fills errorString when a
// required field is missing or has the wrong type.

struct ScreenData
{
    QByteArray frame;   ///< zlib-compressed JPEG, hex on the wire

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, ScreenData *out, QString *errorString = nullptr);
};

struct MouseEvent
{
    MouseAction action = MouseAction::Move;
    QPoint pos;
    Qt::MouseButton button = Qt::LeftButton;
    ButtonAction subAction = ButtonAction::Full;
    int amount = 0;
    int clicks = 1;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, MouseEvent *out, QString *errorString = nullptr);
};

struct KeyboardEvent
{
    QString key;
    KeyAction action = KeyAction::Press;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, KeyboardEvent *out, QString *errorString = nullptr);
};

struct ClipboardData
{
    bool request = false;
    QString data;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, ClipboardData *out, QString *errorString = nullptr);
};

struct AuthRequest
{
    QString username;
    QString password;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, AuthRequest *out, QString *errorString = nullptr);
};

struct AuthResponse
{
    bool success = false;
    QString message;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, AuthResponse *out, QString *errorString = nullptr);
};

} // namespace QRdProtocol

QT_END_NAMESPACE

#endif // QRDPROTOCOL_H
