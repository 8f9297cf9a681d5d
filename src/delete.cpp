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


#include "delete.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Delete::Delete(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "DELETE", parent)
{
    FUNCTION_CALL_TRACE;
}

void Delete::deleteCalendarObject(const QString &href, const QString &eTag)
{
    FUNCTION_CALL_TRACE;

    mHref = href;
    QNetworkRequest request;
    prepareRequest(&request, href);
    if (!eTag.isEmpty()) {
        request.setRawHeader("If-Match", eTag.toLatin1());
    }
    sendRequest(request);
}

void Delete::handleReply(QNetworkReply *reply, const QByteArray &)
{
    FUNCTION_CALL_TRACE;

    // already gone on the server
    if (reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() == 404) {
        LOG_DEBUG("Calendar object" << mHref << "was already deleted from the server");
        finishedWithSuccess();
        return;
    }
    finishedWithReplyResult(reply);
}

QString Delete::href() const
{
    return mHref;
}
