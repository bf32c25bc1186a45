#pragma once
#include "semantic/request.h"
#include <QTcpSocket>
#include <QByteArray>

class ResponseWriter {
public:
    // Status line plus headers. With chunked set, a "Transfer-Encoding:
    // chunked" header is added; "Connection: close" is always added.
    static void writeHead(QTcpSocket* socket, int status, const QByteArray& reason,
                          const QList<RawHeader>& headers, bool chunked);
    static void writeChunk(QTcpSocket* socket, const QByteArray& data);
    static void writeTerminator(QTcpSocket* socket);
    static void writeContinue(QTcpSocket* socket);

    // Complete locally generated response with a JSON body.
    static void writeJson(QTcpSocket* socket, int status, const QByteArray& body);
    static void writePreflight(QTcpSocket* socket);

    static QByteArray wrapChunked(const QByteArray& data);
    static QByteArray statusText(int status);

private:
    static bool isWritable(QTcpSocket* socket);
};
