/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * Contributors: Bea Lam <bea.lam@jollamobile.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License
 * version 2.1 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 *
 */

#include "request.h"

#include <QBuffer>
#include <QNetworkAccessManager>
#include <QStringList>

#include <LogMacros.h>

Request::Request(QNetworkAccessManager *manager,
                 Settings *settings,
                 const QString &requestType,
                 QObject *parent)
    : QObject(parent)
    , mNAManager(manager)
    , REQUEST_TYPE(requestType)
    , mSettings(settings)
    , mNetworkError(QNetworkReply::NoError)
    , mHttpStatus(0)
    , mMinorCode(Buteo::SyncResults::NO_ERROR)
{
    FUNCTION_CALL_TRACE;

    mSelfPointer = this;
}

int Request::errorCode() const
{
    return mMinorCode;
}

QString Request::errorString() const
{
    return mErrorString;
}

QNetworkReply::NetworkError Request::networkError() const
{
    return mNetworkError;
}

int Request::httpStatus() const
{
    return mHttpStatus;
}

QString Request::command() const
{
    return REQUEST_TYPE;
}

int Request::minorCodeFor(QNetworkReply::NetworkError error)
{
    if (error == QNetworkReply::NoError) {
        return Buteo::SyncResults::NO_ERROR;
    }
    if (error == QNetworkReply::SslHandshakeFailedError || error == QNetworkReply::ContentAccessDenied ||
            error == QNetworkReply::AuthenticationRequiredError) {
        return Buteo::SyncResults::AUTHENTICATION_FAILURE;
    } else if (error < 200) {
        // connection and proxy level errors
        return Buteo::SyncResults::CONNECTION_ERROR;
    }
    return Buteo::SyncResults::INTERNAL_ERROR;
}

void Request::finishedWithReplyResult(QNetworkReply *reply)
{
    mNetworkError = reply->error();
    mHttpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (mNetworkError == QNetworkReply::NoError) {
        finishedWithSuccess();
    } else {
        finishedWithError(minorCodeFor(mNetworkError),
                          QString("Network request failed with QNetworkReply::NetworkError: %1, HTTP status %2")
                          .arg(mNetworkError).arg(mHttpStatus));
    }
}

void Request::slotSslErrors(QList<QSslError> errors)
{
    FUNCTION_CALL_TRACE;
    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) {
        return;
    }

    if (mSettings->ignoreSSLErrors()) {
        reply->ignoreSslErrors(errors);
    } else {
        LOG_WARNING(command() << "request failed with SSL error");
    }
}

void Request::finishedWithError(int minorCode, const QString &errorString)
{
    if (minorCode != Buteo::SyncResults::NO_ERROR) {
        LOG_CRITICAL(REQUEST_TYPE << "request failed." << minorCode << errorString);
    }
    mMinorCode = minorCode;
    mErrorString = errorString;
    emit finished();
}

void Request::finishedWithInternalError(const QString &errorString)
{
    finishedWithError(Buteo::SyncResults::INTERNAL_ERROR, errorString.isEmpty() ? QStringLiteral("Internal error") : errorString);
}

void Request::finishedWithSuccess()
{
    mMinorCode = Buteo::SyncResults::NO_ERROR;
    emit finished();
}

void Request::prepareRequest(QNetworkRequest *request, const QString &requestPath)
{
    if (!mSettings->username().isEmpty()) {
        const QByteArray credentials = (mSettings->username() + QChar(':') + mSettings->password()).toUtf8();
        request->setRawHeader("Authorization", "Basic " + credentials.toBase64());
    }
    request->setUrl(mSettings->resolve(requestPath));
}

void Request::sendRequest(const QNetworkRequest &request, const QByteArray &data)
{
    QNetworkReply *reply = 0;
    if (data.isEmpty()) {
        reply = mNAManager->sendCustomRequest(request, REQUEST_TYPE.toLatin1());
    } else {
        QBuffer *buffer = new QBuffer(this);
        buffer->setData(data);
        reply = mNAManager->sendCustomRequest(request, REQUEST_TYPE.toLatin1(), buffer);
    }
    debugRequest(request, data);
    connect(reply, SIGNAL(finished()), this, SLOT(replyFinished()));
    connect(reply, SIGNAL(sslErrors(QList<QSslError>)),
            this, SLOT(slotSslErrors(QList<QSslError>)));
}

void Request::replyFinished()
{
    FUNCTION_CALL_TRACE;

    if (wasDeleted()) {
        LOG_DEBUG(command() << "request was aborted");
        return;
    }

    QNetworkReply *reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply) {
        finishedWithInternalError();
        return;
    }
    const QByteArray data = reply->readAll();
    debugReply(*reply, data);
    handleReply(reply, data);
    reply->deleteLater();
}

bool Request::wasDeleted() const
{
    return mSelfPointer == 0;
}

void Request::debugRequest(const QNetworkRequest &request, const QByteArray &data)
{
    LOG_PROTOCOL(debuggingString(request, data));
}

void Request::debugReply(const QNetworkReply &reply, const QByteArray &data)
{
    LOG_PROTOCOL(debuggingString(reply, data));
}

QString Request::debuggingString(const QNetworkRequest &request, const QByteArray &data)
{
    QStringList text;
    text += "---------------------------------------------------------------------";
    const QList<QByteArray> &rawHeaderList = request.rawHeaderList();
    Q_FOREACH (const QByteArray &rawHeader, rawHeaderList) {
        if (rawHeader.toLower() == "authorization") {
            text += rawHeader + " : <censored>";
        } else {
            text += rawHeader + " : " + request.rawHeader(rawHeader);
        }
    }
    QUrl censoredUrl = request.url();
    censoredUrl.setUserName(QStringLiteral("user"));
    censoredUrl.setPassword(QStringLiteral("pass"));
    text += "URL = " + censoredUrl.toString();
    text += "Request : " + REQUEST_TYPE +  "\n" + data;
    text += "---------------------------------------------------------------------\n";
    return text.join(QChar('\n'));
}

QString Request::debuggingString(const QNetworkReply &reply, const QByteArray &data)
{
    QStringList text;
    text += "---------------------------------------------------------------------";
    text += REQUEST_TYPE + " response status code: " + reply.attribute(QNetworkRequest::HttpStatusCodeAttribute).toString();
    QList<QNetworkReply::RawHeaderPair> headers = reply.rawHeaderPairs();
    text += REQUEST_TYPE + " response headers:";
    for (int i=0; i<headers.count(); i++) {
        text += "\t" + headers[i].first + " : " + headers[i].second;
    }
    if (!data.isEmpty()) {
        text += REQUEST_TYPE + " response data:" + data;
    }
    text += "---------------------------------------------------------------------\n";
    return text.join(QChar('\n'));
}
