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

#ifndef STORAGE_H
#define STORAGE_H

#include "caldavsync-global.h"
#include "eventrecord.h"

#include <QList>

/*
    Synchronous access to the locally stored calendars, events and server
    connections.  Readers report database errors through ok; a lookup that
    finds nothing succeeds and returns a record with id (or userId) 0.
 */
class CALDAVSYNCSHARED_EXPORT Storage
{
public:
    virtual ~Storage() {}

    virtual QList<Calendar> calendars(qint64 userId, bool *ok) = 0;
    virtual Calendar calendar(qint64 calendarId, bool *ok) = 0;
    virtual bool createCalendar(Calendar *calendar) = 0;
    virtual bool updateCalendar(const Calendar &calendar) = 0;

    virtual QList<CalendarEventRecord> events(qint64 calendarId, bool *ok) = 0;
    virtual CalendarEventRecord eventByUid(qint64 calendarId, const QString &uid, bool *ok) = 0;
    virtual CalendarEventRecord event(qint64 eventId, bool *ok) = 0;
    // createEvent and updateEvent store every field and bump the revision
    virtual bool createEvent(CalendarEventRecord *event) = 0;
    virtual bool updateEvent(CalendarEventRecord *event) = 0;
    // Stores etag, url, rawData and lastSyncAttempt of event.  The syncStatus
    // is only stored if the revision is still expectedRevision, so that an
    // edit made while an upload was in flight stays pending.
    virtual bool updateEventSyncState(const CalendarEventRecord &event, int expectedRevision) = 0;
    virtual bool deleteEvent(qint64 eventId) = 0;

    virtual ServerConnection serverConnection(qint64 userId, bool *ok) = 0;
    virtual bool updateServerConnection(const ServerConnection &connection) = 0;
    virtual QList<qint64> userIdsWithServerConnection(bool *ok) = 0;

    virtual bool setSessionActive(qint64 userId, bool active) = 0;
    virtual QList<qint64> activeSessionUserIds(bool *ok) = 0;
};

#endif // STORAGE_H
