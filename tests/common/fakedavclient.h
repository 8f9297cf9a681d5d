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

#ifndef FAKEDAVCLIENT_H
#define FAKEDAVCLIENT_H

#include "davclient.h"

#include <QHash>
#include <QStringList>

// In-memory CalDAV server shared by every FakeDavClient of a test.
struct FakeDavServer
{
    FakeDavServer();

    void addObject(const QString &collection, const QString &href, const QString &etag, const QString &iCalData);
    Reader::CalendarResource object(const QString &href) const;
    static QString collectionOf(const QString &href);

    int loginResult;
    int calendarsResult;
    int fetchObjectsResult;
    int deleteResult;
    QHash<QString, int> putResults;     // per uri, NO_ERROR if absent
    bool returnEtags;
    QString calendarHome;
    QList<CalendarInfo> calendars;
    QHash<QString, QList<Reader::CalendarResource> > objects;  // per collection

    int loginCount;
    int etagCounter;
    QStringList fetchedPaths;
    QStringList puts;
    QStringList putEtags;
    QStringList deletes;
};

class FakeDavClient : public DavClient
{
    Q_OBJECT

public:
    explicit FakeDavClient(FakeDavServer *server, QObject *parent = 0);

    virtual void login();
    virtual void fetchCalendars();
    virtual void fetchCalendarObjects(const QString &calendarPath);
    virtual void putCalendarObject(const QString &uri, const QString &icsData, const QString &etag = QString());
    virtual void deleteCalendarObject(const QString &uri, const QString &etag = QString());
    virtual QString calendarHomePath() const;

private:
    FakeDavServer *mServer;
};

class FakeDavClientFactory : public DavClientFactory
{
public:
    explicit FakeDavClientFactory(FakeDavServer *server);

    virtual DavClient *createClient(const ServerConnection &connection, QObject *parent = 0);

    int createdCount;
    QString lastUsername;

private:
    FakeDavServer *mServer;
};

#endif // FAKEDAVCLIENT_H
