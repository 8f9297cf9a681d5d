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

#ifndef REQUEST_H
#define REQUEST_H

#include "settings.h"

#include <SyncResults.h>

#include <QObject>
#include <QPointer>
#include <QNetworkReply>
#include <QSslError>
#include <QNetworkRequest>

class QNetworkAccessManager;

class Request : public QObject
{
    Q_OBJECT
public:
    explicit Request(QNetworkAccessManager *manager,
                     Settings *settings,
                     const QString &requestType,
                     QObject *parent = 0);

    QString command() const;
    int errorCode() const;
    QString errorString() const;
    QNetworkReply::NetworkError networkError() const;
    int httpStatus() const;

    // maps a reply error to a Buteo minor error code
    static int minorCodeFor(QNetworkReply::NetworkError error);

Q_SIGNALS:
    void finished();

protected Q_SLOTS:
    virtual void slotSslErrors(QList<QSslError>);

protected:
    bool wasDeleted() const;

    void prepareRequest(QNetworkRequest *request, const QString &requestPath);
    void sendRequest(const QNetworkRequest &request, const QByteArray &data = QByteArray());

    void finishedWithSuccess();
    void finishedWithError(int minorCode, const QString &errorString);
    void finishedWithInternalError(const QString &errorString = QString());
    void finishedWithReplyResult(QNetworkReply *reply);

    void debugRequest(const QNetworkRequest &request, const QByteArray &data);
    void debugReply(const QNetworkReply &reply, const QByteArray &data);

    QString debuggingString(const QNetworkRequest &request, const QByteArray &data);
    QString debuggingString(const QNetworkReply &reply, const QByteArray &data);

    QNetworkAccessManager *mNAManager;
    const QString REQUEST_TYPE;
    Settings* mSettings;
    QPointer<Request> mSelfPointer;
    QNetworkReply::NetworkError mNetworkError;
    int mHttpStatus;
    int mMinorCode;
    QString mErrorString;

private Q_SLOTS:
    void replyFinished();

private:
    // subclasses consume the reply body; the reply is deleted afterwards
    virtual void handleReply(QNetworkReply *reply, const QByteArray &data) = 0;
};

#endif // REQUEST_H
