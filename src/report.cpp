/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * Contributors: Mani Chandrasekar <maninc@gmail.com>
 *               Stephan Rave <mail@stephanrave.de>
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


#include "report.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Report::Report(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "REPORT", parent)
{
    FUNCTION_CALL_TRACE;
}

void Report::fetchCalendarObjects(const QString &serverPath)
{
    FUNCTION_CALL_TRACE;

    mServerPath = serverPath;
    QByteArray requestData = \
            "<c:calendar-query xmlns:d=\"DAV:\" xmlns:c=\"urn:ietf:params:xml:ns:caldav\">" \
                "<d:prop>" \
                    "<d:getetag />"\
                    "<c:calendar-data />" \
                "</d:prop>"
                "<c:filter>" \
                    "<c:comp-filter name=\"VCALENDAR\">" \
                        "<c:comp-filter name=\"VEVENT\" />" \
                    "</c:comp-filter>" \
                "</c:filter>" \
            "</c:calendar-query>";

    QNetworkRequest request;
    prepareRequest(&request, serverPath);
    request.setRawHeader("Depth", "1");
    request.setRawHeader("Prefer", "return-minimal");
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    sendRequest(request, requestData);
}

void Report::handleReply(QNetworkReply *reply, const QByteArray &data)
{
    FUNCTION_CALL_TRACE;

    if (reply->error() != QNetworkReply::NoError) {
        finishedWithReplyResult(reply);
        return;
    }
    QVariant statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (statusCode.isValid()) {
        int status = statusCode.toInt();
        if (status > 299) {
            finishedWithError(Buteo::SyncResults::INTERNAL_ERROR,
                              QString("Got error status response for REPORT: %1").arg(status));
            return;
        }
    }

    // an empty collection may come back without a body
    if (data.trimmed().isEmpty()) {
        mReceivedResources.clear();
        finishedWithSuccess();
        return;
    }
    Reader reader;
    if (!reader.read(data)) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR, QString("Malformed response body for ") + command());
        return;
    }
    mReceivedResources.clear();
    Q_FOREACH (const Reader::CalendarResource &resource, reader.results()) {
        if (resource.iCalData.isEmpty()) {
            LOG_DEBUG("Skipping" << resource.href << "without calendar data");
            continue;
        }
        mReceivedResources.append(resource);
    }
    LOG_DEBUG("Received" << mReceivedResources.count() << "calendar objects from" << mServerPath);
    finishedWithSuccess();
}

QString Report::serverPath() const
{
    return mServerPath;
}

QList<Reader::CalendarResource> Report::receivedCalendarResources() const
{
    return mReceivedResources;
}
