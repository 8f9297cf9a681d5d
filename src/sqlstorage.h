/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2014 Jolla Ltd. and/or its subsidiary(-ies).
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

#ifndef SQLSTORAGE_H
#define SQLSTORAGE_H

#include "storage.h"

#include <QSqlDatabase>

class CALDAVSYNCSHARED_EXPORT SqlStorage : public Storage
{
public:
    ~SqlStorage();

    // opens or creates the SQLite database; ":memory:" gives a private in-memory store
    static SqlStorage *open(const QString &databaseFile);

    bool isOpen() const;

    virtual QList<Calendar> calendars(qint64 userId, bool *ok);
    virtual Calendar calendar(qint64 calendarId, bool *ok);
    virtual bool createCalendar(Calendar *calendar);
    virtual bool updateCalendar(const Calendar &calendar);

    virtual QList<CalendarEventRecord> events(qint64 calendarId, bool *ok);
    virtual CalendarEventRecord eventByUid(qint64 calendarId, const QString &uid, bool *ok);
    virtual CalendarEventRecord event(qint64 eventId, bool *ok);
    virtual bool createEvent(CalendarEventRecord *event);
    virtual bool updateEvent(CalendarEventRecord *event);
    virtual bool updateEventSyncState(const CalendarEventRecord &event, int expectedRevision);
    virtual bool deleteEvent(qint64 eventId);

    virtual ServerConnection serverConnection(qint64 userId, bool *ok);
    virtual bool updateServerConnection(const ServerConnection &connection);
    virtual QList<qint64> userIdsWithServerConnection(bool *ok);

    virtual bool setSessionActive(qint64 userId, bool active);
    virtual QList<qint64> activeSessionUserIds(bool *ok);

private:
    explicit SqlStorage(const QSqlDatabase &db);
    QList<CalendarEventRecord> selectEvents(const QString &where, const QVariantList &values, bool *ok);

    QSqlDatabase mDatabase;
};

#endif // SQLSTORAGE_H
