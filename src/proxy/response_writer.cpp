#include "response_writer.h"
#include "core/log_manager.h"
#include <QMap>

bool ResponseWriter::isWritable(QTcpSocket* socket)
{
    return socket && socket->state() == QAbstractSocket::ConnectedState;
}

QByteArray ResponseWriter::statusText(int status)
{
    static const QMap<int, QByteArray> statusTexts = {
        {100, "Continue"},
        {200, "OK"},
        {201, "Created"},
        {204, "No Content"},
        {304, "Not Modified"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {413, "Payload Too Large"},
        {429, "Too Many Requests"},
        {500, "Internal Server Error"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"},
        {529, "Overloaded"}
    };
    return statusTexts.value(status, QByteArrayLiteral("Unknown"));
}

void ResponseWriter::writeHead(QTcpSocket* socket, int status, const QByteArray& reason,
                               const QList<RawHeader>& headers, bool chunked)
{
    if (!isWritable(socket)) {
        LOG_WARNING(QStringLiteral("ResponseWriter: cannot write response head, socket not connected"));
        return;
    }

    QByteArray head;
    head.append("HTTP/1.1 ");
    head.append(QByteArray::number(status));
    head.append(' ');
    head.append(reason.isEmpty() ? statusText(status) : reason);
    head.append("\r\n");
    for (const RawHeader& h : headers) {
        head.append(h.first);
        head.append(": ");
        head.append(h.second);
        head.append("\r\n");
    }
    if (chunked)
        head.append("Transfer-Encoding: chunked\r\n");
    head.append("Connection: close\r\n");
    head.append("\r\n");

    socket->write(head);
    socket->flush();
}

QByteArray ResponseWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void ResponseWriter::writeChunk(QTcpSocket* socket, const QByteArray& data)
{
    // A zero-length chunk would end the body early.
    if (data.isEmpty() || !isWritable(socket))
        return;
    socket->write(wrapChunked(data));
    socket->flush();
}

void ResponseWriter::writeTerminator(QTcpSocket* socket)
{
    if (!isWritable(socket)) {
        LOG_WARNING(QStringLiteral("ResponseWriter: cannot send terminator, socket not connected"));
        return;
    }

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}

void ResponseWriter::writeContinue(QTcpSocket* socket)
{
    if (!isWritable(socket))
        return;
    socket->write("HTTP/1.1 100 Continue\r\n\r\n");
    socket->flush();
}

void ResponseWriter::writeJson(QTcpSocket* socket, int status, const QByteArray& body)
{
    if (!isWritable(socket))
        return;

    QList<RawHeader> headers;
    headers.append({"Content-Type", "application/json"});
    headers.append({"Content-Length", QByteArray::number(body.size())});
    writeHead(socket, status, statusText(status), headers, false);
    socket->write(body);
    socket->flush();
}

void ResponseWriter::writePreflight(QTcpSocket* socket)
{
    if (!isWritable(socket))
        return;

    QList<RawHeader> headers;
    headers.append({"Access-Control-Allow-Origin", "*"});
    headers.append({"Access-Control-Allow-Methods", "GET, POST, OPTIONS"});
    headers.append({"Access-Control-Allow-Headers", "*"});
    headers.append({"Content-Length", "0"});
    writeHead(socket, 200, statusText(200), headers, false);
}
