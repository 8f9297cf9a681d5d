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

#ifndef DAVCLIENT_H
#define DAVCLIENT_H

#include "caldavsync-global.h"
#include "reader.h"

struct ServerConnection;

#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>

struct CalendarInfo
{
    QString path;
    QString displayName;
    QString color;
};

Q_DECLARE_METATYPE(CalendarInfo)

/*
    Asynchronous access to a CalDAV server.

    Every operation reports its outcome through the matching signal, with a
    Buteo::SyncResults minor error code (NO_ERROR on success) and an error
    message.  Signals are never emitted from within the call that started
    the operation.
 */
class CALDAVSYNCSHARED_EXPORT DavClient : public QObject
{
    Q_OBJECT

public:
    explicit DavClient(QObject *parent = 0) : QObject(parent) {}
    virtual ~DavClient() {}

    virtual void login() = 0;
    virtual void fetchCalendars() = 0;
    virtual void fetchCalendarObjects(const QString &calendarPath) = 0;
    // an empty etag creates a new object
    virtual void putCalendarObject(const QString &uri, const QString &icsData,
                                   const QString &etag = QString()) = 0;
    virtual void deleteCalendarObject(const QString &uri, const QString &etag = QString()) = 0;

    // calendar home found by login()
    virtual QString calendarHomePath() const = 0;

Q_SIGNALS:
    void loginFinished(int minorErrorCode, const QString &message);
    void calendarsFetched(int minorErrorCode, const QString &message, const QList<CalendarInfo> &calendars);
    void calendarObjectsFetched(const QString &calendarPath, int minorErrorCode, const QString &message,
                                const QList<Reader::CalendarResource> &resources);
    void putFinished(const QString &uri, int minorErrorCode, const QString &message, const QString &etag);
    void deleteFinished(const QString &uri, int minorErrorCode, const QString &message);
};

class CALDAVSYNCSHARED_EXPORT DavClientFactory
{
public:
    virtual ~DavClientFactory() {}

    virtual DavClient *createClient(const ServerConnection &connection, QObject *parent = 0) = 0;
};

#endif // DAVCLIENT_H
