#pragma once
#include "semantic/request.h"
#include "semantic/failure.h"

// Incremental HTTP/1.x request framing. Feed bytes as they arrive until
// the state leaves Incomplete.
class HttpRequestParser {
public:
    enum class State { Incomplete, Complete, Error };

    explicit HttpRequestParser(int maxHeaderBytes = 64 * 1024,
                               qint64 maxBodyBytes = 64 * 1024 * 1024);

    State feed(const QByteArray& data);
    State state() const { return m_state; }

    bool headersComplete() const { return m_headersComplete; }
    bool expectsContinue() const;

    // Valid once headersComplete(); the body is filled in on Complete.
    const ProxyRequest& request() const { return m_request; }
    ProxyRequest takeRequest() { return std::move(m_request); }
    const DomainFailure& failure() const { return m_failure; }

private:
    State fail(const QString& code, const QString& msg);
    State failTooLarge();
    State parseHead();
    State parseBody();
    State parseChunkedBody();

    QByteArray m_buffer;
    int m_maxHeaderBytes;
    qint64 m_maxBodyBytes;
    State m_state = State::Incomplete;
    bool m_headersComplete = false;
    bool m_chunked = false;
    qint64 m_contentLength = 0;
    ProxyRequest m_request;
    DomainFailure m_failure;
};
