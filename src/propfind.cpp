/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2026 The caldav-sync contributors.
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

#include "propfind.h"
#include "settings.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

Propfind::Propfind(QNetworkAccessManager *manager, Settings *settings, QObject *parent)
    : Request(manager, settings, "PROPFIND", parent)
    , mLookup(UserPrincipal)
{
    FUNCTION_CALL_TRACE;
}

void Propfind::lookupUserPrincipal(const QString &path)
{
    FUNCTION_CALL_TRACE;

    mLookup = UserPrincipal;
    sendPropfind(path, "0",
                 "<d:propfind xmlns:d=\"DAV:\">" \
                     "<d:prop>" \
                         "<d:current-user-principal />" \
                     "</d:prop>" \
                 "</d:propfind>");
}

void Propfind::lookupCalendarHomeSet(const QString &principalPath)
{
    FUNCTION_CALL_TRACE;

    mLookup = CalendarHomeSet;
    sendPropfind(principalPath, "0",
                 "<d:propfind xmlns:d=\"DAV:\" xmlns:c=\"urn:ietf:params:xml:ns:caldav\">" \
                     "<d:prop>" \
                         "<c:calendar-home-set />" \
                     "</d:prop>" \
                 "</d:propfind>");
}

void Propfind::listCalendars(const QString &calendarHomePath)
{
    FUNCTION_CALL_TRACE;

    mLookup = Calendars;
    sendPropfind(calendarHomePath, "1",
                 "<d:propfind xmlns:d=\"DAV:\" xmlns:c=\"urn:ietf:params:xml:ns:caldav\" " \
                         "xmlns:a=\"http://apple.com/ns/ical/\">" \
                     "<d:prop>" \
                         "<d:resourcetype />" \
                         "<d:displayname />" \
                         "<a:calendar-color />" \
                     "</d:prop>" \
                 "</d:propfind>");
}

void Propfind::sendPropfind(const QString &path, const QByteArray &depth, const QByteArray &body)
{
    mPath = path;
    QNetworkRequest request;
    prepareRequest(&request, path);
    request.setRawHeader("Depth", depth);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    sendRequest(request, body);
}

void Propfind::handleReply(QNetworkReply *reply, const QByteArray &data)
{
    FUNCTION_CALL_TRACE;

    if (reply->error() != QNetworkReply::NoError) {
        finishedWithReplyResult(reply);
        return;
    }

    Reader reader;
    if (data.isEmpty() || !reader.read(data)) {
        finishedWithError(Buteo::SyncResults::INTERNAL_ERROR, QString("Malformed response body for ") + command());
        return;
    }

    const QList<Reader::CalendarResource> results = reader.results();
    switch (mLookup) {
    case UserPrincipal:
        Q_FOREACH (const Reader::CalendarResource &resource, results) {
            if (!resource.principalHref.isEmpty()) {
                mUserPrincipal = resource.principalHref;
                break;
            }
        }
        break;
    case CalendarHomeSet:
        Q_FOREACH (const Reader::CalendarResource &resource, results) {
            if (!resource.calendarHomeHref.isEmpty()) {
                mCalendarHome = resource.calendarHomeHref;
                break;
            }
        }
        break;
    case Calendars:
        Q_FOREACH (const Reader::CalendarResource &resource, results) {
            if (resource.isCalendar) {
                mCalendars.append(resource);
            }
        }
        LOG_DEBUG("Found" << mCalendars.count() << "calendars under" << mPath);
        break;
    }
    finishedWithSuccess();
}

Propfind::Lookup Propfind::lookup() const
{
    return mLookup;
}

QString Propfind::userPrincipal() const
{
    return mUserPrincipal;
}

QString Propfind::calendarHome() const
{
    return mCalendarHome;
}

QList<Reader::CalendarResource> Propfind::calendars() const
{
    return mCalendars;
}
