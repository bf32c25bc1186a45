#pragma once
#include "http_request_parser.h"
#include "config/config_types.h"
#include "semantic/ports.h"
#include <QElapsedTimer>
#include <QObject>
#include <QPointer>
#include <QTcpSocket>

class Pipeline;

// One inbound connection: reads a single request, runs it through the
// pipeline, forwards it upstream and relays the response back as it
// arrives. The connection is closed after the exchange.
class ProxySession : public QObject {
    Q_OBJECT
public:
    ProxySession(QTcpSocket* socket,
                 const Pipeline* pipeline,
                 IExecutor* executor,
                 const RuntimeOptions& options,
                 QObject* parent = nullptr);
    ~ProxySession() override;

    void start();
    void abort();

signals:
    void closed(ProxySession* session);

private slots:
    void onSocketReadyRead();
    void onSocketBytesWritten();
    void onSocketDisconnected();
    void onUpstreamMetaDataChanged();
    void onUpstreamReadyRead();
    void onUpstreamFinished();

private:
    void dispatch(ProxyRequest request);
    bool writeResponseHead();
    void drainUpstream();
    void completeIfDrained();
    void failRequest(const DomainFailure& failure);
    void finish();
    void releaseReply();
    void emitClosed();

    QTcpSocket* m_socket;
    const Pipeline* m_pipeline;
    IExecutor* m_executor;
    RuntimeOptions m_options;
    HttpRequestParser m_parser;
    QPointer<QNetworkReply> m_reply;

    QString m_method;
    QString m_target;
    int m_status = 0;
    qint64 m_relayedBytes = 0;
    QElapsedTimer m_timer;

    bool m_dispatched = false;
    bool m_continueSent = false;
    bool m_headSent = false;
    bool m_bodyAllowed = true;
    bool m_chunked = false;
    bool m_http10 = false;
    bool m_upstreamFinished = false;
    bool m_finishing = false;
    bool m_closedEmitted = false;
};
