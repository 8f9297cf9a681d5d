/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * Contributors: Mani Chandrasekar <maninc@gmail.com>
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


#include "put.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Put::Put(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "PUT", parent)
{
}

void Put::uploadCalendarObject(const QString &uri, const QString &icalData, const QString &eTag)
{
    FUNCTION_CALL_TRACE;

    mUri = uri;
    QByteArray data = icalData.toUtf8();
    if (data.isEmpty()) {
        LOG_WARNING("Error while converting iCal Object to QByteArray");
        finishedWithInternalError(QStringLiteral("Empty iCal data for ") + uri);
        return;
    }

    QNetworkRequest request;
    prepareRequest(&request, uri);
    if (!eTag.isEmpty()) {
        request.setRawHeader("If-Match", eTag.toLatin1());
    }
    request.setHeader(QNetworkRequest::ContentLengthHeader, data.length());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "text/calendar; charset=utf-8");
    sendRequest(request, data);
}

void Put::handleReply(QNetworkReply *reply, const QByteArray &)
{
    FUNCTION_CALL_TRACE;

    // Server may update the etag as soon as the modification is received and send back a new etag
    Q_FOREACH (const QNetworkReply::RawHeaderPair &header, reply->rawHeaderPairs()) {
        if (header.first.toLower() == QByteArray("etag")) {
            mUpdatedETag = QString::fromLatin1(header.second);
        }
    }

    finishedWithReplyResult(reply);
}

QString Put::uri() const
{
    return mUri;
}

QString Put::updatedETag() const
{
    return mUpdatedETag;
}
