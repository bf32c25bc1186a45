#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;

    int httpStatus() const;
    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;

    static DomainFailure startupConfig(const QString& code, const QString& msg);
    static DomainFailure malformedRequest(const QString& code, const QString& msg);
    static DomainFailure requestTooLarge(const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
