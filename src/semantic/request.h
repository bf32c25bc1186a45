#pragma once
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>

using RawHeader = QPair<QByteArray, QByteArray>;

// One inbound HTTP request, as received. Header names keep their original
// spelling and order; lookups are case-insensitive.
struct ProxyRequest {
    QString method;
    QString target;        // path + query
    QString httpVersion;
    QList<RawHeader> headers;
    QByteArray body;

    QByteArray header(const QByteArray& name) const {
        for (const RawHeader& h : headers) {
            if (h.first.compare(name, Qt::CaseInsensitive) == 0)
                return h.second;
        }
        return {};
    }

    bool hasHeader(const QByteArray& name) const {
        for (const RawHeader& h : headers) {
            if (h.first.compare(name, Qt::CaseInsensitive) == 0)
                return true;
        }
        return false;
    }

    void removeHeader(const QByteArray& name) {
        headers.removeIf([&name](const RawHeader& h) {
            return h.first.compare(name, Qt::CaseInsensitive) == 0;
        });
    }
};
