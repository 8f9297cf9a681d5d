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

#include "networkdavclient.h"
#include "propfind.h"
#include "report.h"
#include "put.h"
#include "delete.h"
#include "eventrecord.h"

#include <QNetworkAccessManager>

#include <LogMacros.h>

NetworkDavClient::NetworkDavClient(const Settings &settings, QObject *parent)
    : DavClient(parent)
    , mSettings(settings)
    , mNAManager(new QNetworkAccessManager(this))
{
}

NetworkDavClient::~NetworkDavClient()
{
    // replies of in-flight requests are dropped through Request::wasDeleted()
    QList<Request *> requests = mRequests.toList();
    for (int i = 0; i < requests.count(); i++) {
        requests[i]->deleteLater();
    }
    mRequests.clear();
}

template <typename T>
T *NetworkDavClient::takeRequest()
{
    T *request = qobject_cast<T*>(sender());
    if (request) {
        mRequests.remove(request);
        request->deleteLater();
    }
    return request;
}

QString NetworkDavClient::fallbackCalendarHome() const
{
    return mSettings.serverPath() + QStringLiteral("/caldav.php/") + mSettings.username() + QChar('/');
}

QString NetworkDavClient::calendarHomePath() const
{
    return mCalendarHome.isEmpty() ? fallbackCalendarHome() : mCalendarHome;
}

void NetworkDavClient::login()
{
    FUNCTION_CALL_TRACE;

    Propfind *propfind = new Propfind(mNAManager, &mSettings, this);
    mRequests.insert(propfind);
    connect(propfind, SIGNAL(finished()), this, SLOT(userPrincipalFinished()));
    propfind->lookupUserPrincipal(mSettings.serverPath() + QChar('/'));
}

void NetworkDavClient::userPrincipalFinished()
{
    FUNCTION_CALL_TRACE;

    Propfind *propfind = takeRequest<Propfind>();
    if (!propfind) {
        emit loginFinished(Buteo::SyncResults::INTERNAL_ERROR, QStringLiteral("Unknown request finished"));
        return;
    }

    if (propfind->errorCode() == Buteo::SyncResults::AUTHENTICATION_FAILURE
            || propfind->errorCode() == Buteo::SyncResults::CONNECTION_ERROR) {
        emit loginFinished(propfind->errorCode(), propfind->errorString());
        return;
    }

    if (propfind->errorCode() != Buteo::SyncResults::NO_ERROR || propfind->userPrincipal().isEmpty()) {
        // servers without principal discovery still authenticated the request
        mCalendarHome = fallbackCalendarHome();
        LOG_DEBUG("No user principal found, using calendar home" << mCalendarHome);
        emit loginFinished(Buteo::SyncResults::NO_ERROR, QString());
        return;
    }

    Propfind *homeSet = new Propfind(mNAManager, &mSettings, this);
    mRequests.insert(homeSet);
    connect(homeSet, SIGNAL(finished()), this, SLOT(calendarHomeSetFinished()));
    homeSet->lookupCalendarHomeSet(propfind->userPrincipal());
}

void NetworkDavClient::calendarHomeSetFinished()
{
    FUNCTION_CALL_TRACE;

    Propfind *propfind = takeRequest<Propfind>();
    if (!propfind) {
        emit loginFinished(Buteo::SyncResults::INTERNAL_ERROR, QStringLiteral("Unknown request finished"));
        return;
    }
    if (propfind->errorCode() == Buteo::SyncResults::AUTHENTICATION_FAILURE) {
        emit loginFinished(propfind->errorCode(), propfind->errorString());
        return;
    }

    mCalendarHome = propfind->calendarHome();
    if (mCalendarHome.isEmpty()) {
        mCalendarHome = fallbackCalendarHome();
    }
    LOG_DEBUG("Using calendar home" << mCalendarHome);
    emit loginFinished(Buteo::SyncResults::NO_ERROR, QString());
}

void NetworkDavClient::fetchCalendars()
{
    FUNCTION_CALL_TRACE;

    Propfind *propfind = new Propfind(mNAManager, &mSettings, this);
    mRequests.insert(propfind);
    connect(propfind, SIGNAL(finished()), this, SLOT(calendarListFinished()));
    propfind->listCalendars(calendarHomePath());
}

void NetworkDavClient::calendarListFinished()
{
    FUNCTION_CALL_TRACE;

    Propfind *propfind = takeRequest<Propfind>();
    QList<CalendarInfo> calendars;
    if (!propfind) {
        emit calendarsFetched(Buteo::SyncResults::INTERNAL_ERROR, QStringLiteral("Unknown request finished"), calendars);
        return;
    }
    Q_FOREACH (const Reader::CalendarResource &resource, propfind->calendars()) {
        CalendarInfo info;
        info.path = resource.href;
        info.displayName = resource.displayName;
        info.color = resource.color;
        calendars.append(info);
    }
    emit calendarsFetched(propfind->errorCode(), propfind->errorString(), calendars);
}

void NetworkDavClient::fetchCalendarObjects(const QString &calendarPath)
{
    FUNCTION_CALL_TRACE;

    Report *report = new Report(mNAManager, &mSettings, this);
    mRequests.insert(report);
    connect(report, SIGNAL(finished()), this, SLOT(reportFinished()));
    report->fetchCalendarObjects(calendarPath);
}

void NetworkDavClient::reportFinished()
{
    FUNCTION_CALL_TRACE;

    Report *report = takeRequest<Report>();
    if (!report) {
        return;
    }
    emit calendarObjectsFetched(report->serverPath(), report->errorCode(), report->errorString(),
                                report->receivedCalendarResources());
}

void NetworkDavClient::putCalendarObject(const QString &uri, const QString &icsData, const QString &etag)
{
    FUNCTION_CALL_TRACE;

    Put *put = new Put(mNAManager, &mSettings, this);
    mRequests.insert(put);
    connect(put, SIGNAL(finished()), this, SLOT(putRequestFinished()));
    put->uploadCalendarObject(uri, icsData, etag);
}

void NetworkDavClient::putRequestFinished()
{
    FUNCTION_CALL_TRACE;

    Put *put = takeRequest<Put>();
    if (!put) {
        return;
    }
    emit putFinished(put->uri(), put->errorCode(), put->errorString(), put->updatedETag());
}

void NetworkDavClient::deleteCalendarObject(const QString &uri, const QString &etag)
{
    FUNCTION_CALL_TRACE;

    Delete *del = new Delete(mNAManager, &mSettings, this);
    mRequests.insert(del);
    connect(del, SIGNAL(finished()), this, SLOT(deleteRequestFinished()));
    del->deleteCalendarObject(uri, etag);
}

void NetworkDavClient::deleteRequestFinished()
{
    FUNCTION_CALL_TRACE;

    Delete *del = takeRequest<Delete>();
    if (!del) {
        return;
    }
    emit deleteFinished(del->href(), del->errorCode(), del->errorString());
}

NetworkDavClientFactory::NetworkDavClientFactory(bool ignoreSslErrors)
    : mIgnoreSslErrors(ignoreSslErrors)
{
}

DavClient *NetworkDavClientFactory::createClient(const ServerConnection &connection, QObject *parent)
{
    Settings settings = Settings::fromConnection(connection);
    settings.setIgnoreSSLErrors(mIgnoreSslErrors);
    return new NetworkDavClient(settings, parent);
}
