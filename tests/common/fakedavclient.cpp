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

#include "fakedavclient.h"
#include "eventrecord.h"

#include <QTimer>

#include <SyncResults.h>

FakeDavServer::FakeDavServer()
    : loginResult(Buteo::SyncResults::NO_ERROR)
    , calendarsResult(Buteo::SyncResults::NO_ERROR)
    , fetchObjectsResult(Buteo::SyncResults::NO_ERROR)
    , deleteResult(Buteo::SyncResults::NO_ERROR)
    , returnEtags(true)
    , calendarHome(QStringLiteral("/calendars/jane/"))
    , loginCount(0)
    , etagCounter(0)
{
}

QString FakeDavServer::collectionOf(const QString &href)
{
    return href.left(href.lastIndexOf(QChar('/')) + 1);
}

void FakeDavServer::addObject(const QString &collection, const QString &href, const QString &etag,
                              const QString &iCalData)
{
    QList<Reader::CalendarResource> &resources = objects[collection];
    for (int i = 0; i < resources.count(); ++i) {
        if (resources[i].href == href) {
            resources.removeAt(i);
            break;
        }
    }
    Reader::CalendarResource resource;
    resource.href = href;
    resource.etag = etag;
    resource.status = QStringLiteral("HTTP/1.1 200 OK");
    resource.iCalData = iCalData;
    resources.append(resource);
}

Reader::CalendarResource FakeDavServer::object(const QString &href) const
{
    Q_FOREACH (const Reader::CalendarResource &resource, objects.value(collectionOf(href))) {
        if (resource.href == href) {
            return resource;
        }
    }
    return Reader::CalendarResource();
}

FakeDavClient::FakeDavClient(FakeDavServer *server, QObject *parent)
    : DavClient(parent)
    , mServer(server)
{
}

void FakeDavClient::login()
{
    mServer->loginCount++;
    const int result = mServer->loginResult;
    QTimer::singleShot(0, this, [this, result]() {
        emit loginFinished(result, result == Buteo::SyncResults::NO_ERROR ? QString()
                                                                           : QStringLiteral("login failed"));
    });
}

void FakeDavClient::fetchCalendars()
{
    const int result = mServer->calendarsResult;
    const QList<CalendarInfo> calendars = mServer->calendars;
    QTimer::singleShot(0, this, [this, result, calendars]() {
        if (result == Buteo::SyncResults::NO_ERROR) {
            emit calendarsFetched(result, QString(), calendars);
        } else {
            emit calendarsFetched(result, QStringLiteral("listing failed"), QList<CalendarInfo>());
        }
    });
}

void FakeDavClient::fetchCalendarObjects(const QString &calendarPath)
{
    mServer->fetchedPaths.append(calendarPath);
    const int result = mServer->fetchObjectsResult;
    const QList<Reader::CalendarResource> resources = mServer->objects.value(calendarPath);
    QTimer::singleShot(0, this, [this, calendarPath, result, resources]() {
        emit calendarObjectsFetched(calendarPath, result, QString(),
                                    result == Buteo::SyncResults::NO_ERROR ? resources
                                                                           : QList<Reader::CalendarResource>());
    });
}

void FakeDavClient::putCalendarObject(const QString &uri, const QString &icsData, const QString &etag)
{
    mServer->puts.append(uri);
    mServer->putEtags.append(etag);
    const int result = mServer->putResults.value(uri, Buteo::SyncResults::NO_ERROR);
    QString newEtag;
    if (result == Buteo::SyncResults::NO_ERROR) {
        newEtag = QStringLiteral("\"etag-%1\"").arg(++mServer->etagCounter);
        mServer->addObject(FakeDavServer::collectionOf(uri), uri, newEtag, icsData);
    }
    const QString reportedEtag = mServer->returnEtags ? newEtag : QString();
    QTimer::singleShot(0, this, [this, uri, result, reportedEtag]() {
        emit putFinished(uri, result, result == Buteo::SyncResults::NO_ERROR ? QString()
                                                                             : QStringLiteral("upload failed"),
                         reportedEtag);
    });
}

void FakeDavClient::deleteCalendarObject(const QString &uri, const QString &etag)
{
    Q_UNUSED(etag);

    mServer->deletes.append(uri);
    const int result = mServer->deleteResult;
    if (result == Buteo::SyncResults::NO_ERROR) {
        QList<Reader::CalendarResource> &resources = mServer->objects[FakeDavServer::collectionOf(uri)];
        for (int i = 0; i < resources.count(); ++i) {
            if (resources[i].href == uri) {
                resources.removeAt(i);
                break;
            }
        }
    }
    QTimer::singleShot(0, this, [this, uri, result]() {
        emit deleteFinished(uri, result, result == Buteo::SyncResults::NO_ERROR ? QString()
                                                                                : QStringLiteral("delete failed"));
    });
}

QString FakeDavClient::calendarHomePath() const
{
    return mServer->calendarHome;
}

FakeDavClientFactory::FakeDavClientFactory(FakeDavServer *server)
    : createdCount(0)
    , mServer(server)
{
}

DavClient *FakeDavClientFactory::createClient(const ServerConnection &connection, QObject *parent)
{
    createdCount++;
    lastUsername = connection.username;
    return new FakeDavClient(mServer, parent);
}
