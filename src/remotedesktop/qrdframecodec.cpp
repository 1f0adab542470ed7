// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrdframecodec.h"

#include <csetjmp>
#include <cstdio>
#include <cstdlib>

#include <zlib.h>
#include <jpeglib.h>

QT_BEGIN_NAMESPACE

namespace QRdFrameCodec {

namespace {

/*!
    \internal
    libjpeg reports fatal errors through error_exit(), which by default calls
    exit(). This manager jumps back to the caller instead.
*/
struct JpegErrorManager {
    jpeg_error_mgr base;
    jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr info)
{
    auto *manager = reinterpret_cast<JpegErrorManager *>(info->err);
    (*info->err->format_message)(info, manager->message);
    longjmp(manager->jump, 1);
}

void jpegOutputMessage(j_common_ptr info)
{
    char message[JMSG_LENGTH_MAX];
    (*info->err->format_message)(info, message);
    qCDebug(lcRemoteDesktop) << "libjpeg:" << message;
}

/*!
    \internal
    Runs the libjpeg decoder over \a data into \a image. Kept apart from
    decodeImage() so that no C++ object lives in the frame that setjmp() saves.
*/
bool decompressJpeg(const QByteArray &data, QImage *image, JpegErrorManager *error)
{
    jpeg_decompress_struct info;
    info.err = jpeg_std_error(&error->base);
    error->base.error_exit = jpegErrorExit;
    error->base.output_message = jpegOutputMessage;
    if (setjmp(error->jump)) {
        jpeg_destroy_decompress(&info);
        return false;
    }

    jpeg_create_decompress(&info);
    jpeg_mem_src(&info, reinterpret_cast<unsigned char *>(const_cast<char *>(data.constData())),
                 static_cast<unsigned long>(data.size()));
    jpeg_read_header(&info, TRUE);
    info.out_color_space = JCS_RGB;
    jpeg_start_decompress(&info);

    *image = QImage(static_cast<int>(info.output_width), static_cast<int>(info.output_height),
                    QImage::Format_RGB888);
    if (image->isNull()) {
        qstrncpy(error->message, "cannot allocate the image", sizeof(error->message));
        jpeg_destroy_decompress(&info);
        return false;
    }
    while (info.output_scanline < info.output_height) {
        JSAMPROW row = image->scanLine(static_cast<int>(info.output_scanline));
        jpeg_read_scanlines(&info, &row, 1);
    }
    jpeg_finish_decompress(&info);
    // Truncated or damaged data only raises warnings and is padded by libjpeg
    const long warnings = info.err->num_warnings;
    jpeg_destroy_decompress(&info);
    if (warnings > 0) {
        qstrncpy(error->message, "truncated or corrupt data", sizeof(error->message));
        return false;
    }
    return true;
}

} // namespace

/*!
    Compresses \a data into a zlib stream at compression \a level.
    Returns an empty array if zlib fails.
*/
QByteArray compress(const QByteArray &data, int level)
{
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    QByteArray result(static_cast<qsizetype>(size), Qt::Uninitialized);

    const int ret = compress2(reinterpret_cast<Bytef *>(result.data()), &size,
                              reinterpret_cast<const Bytef *>(data.constData()),
                              static_cast<uLong>(data.size()), level);
    if (ret != Z_OK) {
        qCWarning(lcRemoteDesktop) << "Zlib compression failed with error code:" << ret;
        return QByteArray();
    }
    result.resize(static_cast<qsizetype>(size));
    return result;
}

/*!
    Inflates the zlib stream in \a data. The output size is not known up front,
    so the stream is inflated chunk by chunk.

    If \a ok is not null it is set to false when the stream is corrupt or ends
    before its end marker.
*/
QByteArray decompress(const QByteArray &data, bool *ok)
{
    z_stream stream;
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());

    int ret = inflateInit(&stream);
    if (ret != Z_OK) {
        qCWarning(lcRemoteDesktop) << "Zlib initialization failed with error code:" << ret;
        if (ok)
            *ok = false;
        return QByteArray();
    }

    QByteArray result;
    char chunk[16384];
    do {
        stream.next_out = reinterpret_cast<Bytef *>(chunk);
        stream.avail_out = sizeof(chunk);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
            break;
        result.append(chunk, static_cast<qsizetype>(sizeof(chunk) - stream.avail_out));
    } while (ret != Z_STREAM_END);
    inflateEnd(&stream);

    const bool success = ret == Z_STREAM_END;
    if (!success) {
        qCWarning(lcRemoteDesktop) << "Zlib inflation failed with error code:" << ret;
        result.clear();
    }
    if (ok)
        *ok = success;
    return result;
}

/*!
    Encodes \a image as baseline JPEG. \a quality is clamped to [1, 100].
    Returns an empty array for a null image or when libjpeg fails.
*/
QByteArray encodeImage(const QImage &image, int quality)
{
    if (image.isNull()) {
        qCWarning(lcRemoteDesktop) << "Cannot encode a null image";
        return QByteArray();
    }
    const QImage rgb = image.convertToFormat(QImage::Format_RGB888);
    quality = qBound(1, quality, 100);

    jpeg_compress_struct info;
    JpegErrorManager error;
    unsigned char *buffer = nullptr;
    unsigned long size = 0;

    info.err = jpeg_std_error(&error.base);
    error.base.error_exit = jpegErrorExit;
    if (setjmp(error.jump)) {
        qCWarning(lcRemoteDesktop) << "JPEG encoding failed:" << error.message;
        jpeg_destroy_compress(&info);
        free(buffer);
        return QByteArray();
    }

    jpeg_create_compress(&info);
    jpeg_mem_dest(&info, &buffer, &size);
    info.image_width = static_cast<JDIMENSION>(rgb.width());
    info.image_height = static_cast<JDIMENSION>(rgb.height());
    info.input_components = 3;
    info.in_color_space = JCS_RGB;
    jpeg_set_defaults(&info);
    jpeg_set_quality(&info, quality, TRUE);

    jpeg_start_compress(&info, TRUE);
    while (info.next_scanline < info.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(rgb.constScanLine(static_cast<int>(info.next_scanline)));
        jpeg_write_scanlines(&info, &row, 1);
    }
    jpeg_finish_compress(&info);
    jpeg_destroy_compress(&info);

    QByteArray result(reinterpret_cast<const char *>(buffer), static_cast<qsizetype>(size));
    free(buffer);
    return result;
}

/*!
    Decodes the JPEG in \a data with libjpeg. Returns a null image for empty or
    corrupt input.
*/
QImage decodeImage(const QByteArray &data)
{
    if (data.isEmpty()) {
        qCWarning(lcRemoteDesktop) << "Cannot decode an empty JPEG frame";
        return QImage();
    }

    QImage image;
    JpegErrorManager error;
    error.message[0] = '\0';
    if (!decompressJpeg(data, &image, &error)) {
        qCWarning(lcRemoteDesktop) << "Failed to decode JPEG frame of" << data.size() << "bytes:" << error.message;
        return QImage();
    }
    return image;
}

/*!
    Computes the difference from \a previous to \a next.

    A null \a previous means there is no earlier frame and yields a
    full-replace diff. An empty but non-null \a previous yields a diff that is
    all tail.
*/
Diff diff(const QByteArray &previous, const QByteArray &next)
{
    Diff result;
    if (previous.isNull()) {
        result.fullReplace = true;
        result.replacement = next;
        return result;
    }

    const qsizetype common = qMin(previous.size(), next.size());
    for (qsizetype i = 0; i < common; i++) {
        if (previous.at(i) != next.at(i))
            result.changes.append({ i, next.at(i) });
    }
    if (next.size() > previous.size())
        result.tail = next.mid(previous.size());
    return result;
}

/*!
    Rebuilds the frame described by \a diff on top of \a previous.

    \note When the new frame was shorter than \a previous, the bytes of
    \a previous past the new length are kept. The result then equals the new
    frame followed by the stale remainder of the old one.
*/
QByteArray applyDiff(const QByteArray &previous, const Diff &diff)
{
    if (diff.fullReplace)
        return diff.replacement;

    QByteArray result = previous;
    for (const auto &change : diff.changes) {
        if (change.position < result.size())
            result[change.position] = change.value;
        else
            result.append(change.value);
    }
    result.append(diff.tail);
    return result;
}

} // namespace QRdFrameCodec

QT_END_NAMESPACE
