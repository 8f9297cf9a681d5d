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

#ifndef EVENTRECORD_H
#define EVENTRECORD_H

#include "caldavsync-global.h"

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

struct Attendee
{
    QString email;
    QString name;
    QString role;
    QString status;
    QString scheduleStatus;
};

struct Resource
{
    QString name;
    QString adminEmail;
    QString type;
};

/*
    A participant of an event is either a person (Attendee) or a bookable
    resource (Resource).  Raw ATTENDEE data is classified into one or the
    other exactly once, when the iCalendar data is parsed.
 */
class CALDAVSYNCSHARED_EXPORT Participant
{
public:
    enum Kind {
        AttendeeKind,
        ResourceKind
    };

    Participant();
    static Participant fromAttendee(const Attendee &attendee);
    static Participant fromResource(const Resource &resource);

    Kind kind() const;
    bool isResource() const;
    QString email() const;

    Attendee attendee() const;
    Resource resource() const;

private:
    Kind mKind;
    Attendee mAttendee;
    Resource mResource;
};

struct CALDAVSYNCSHARED_EXPORT ServerConnection
{
    enum Status {
        Pending,
        Connected,
        Error
    };

    ServerConnection();

    bool isValid() const;

    static QString statusToString(Status status);
    static Status statusFromString(const QString &status);

    qint64 userId;
    QString url;
    QString username;
    QString password;
    int syncInterval;   // seconds
    bool autoSync;
    Status status;
    QDateTime lastSync;
};

struct CALDAVSYNCSHARED_EXPORT Calendar
{
    Calendar();

    bool isLocalOnly() const;

    qint64 id;
    qint64 userId;
    QString name;
    QString color;
    QString url;        // empty for local-only calendars
    QString syncToken;
    bool enabled;
};

struct CALDAVSYNCSHARED_EXPORT CalendarEventRecord
{
    enum SyncStatus {
        Local,      // created locally, never uploaded
        Pending,    // modified locally since the last upload
        Synced,
        Error       // last upload failed, retried on the next pass
    };

    CalendarEventRecord();

    bool isValid() const;
    bool hasRemoteObject() const;

    QList<Participant> participants() const;
    void setParticipants(const QList<Participant> &participants);

    static QString syncStatusToString(SyncStatus status);
    static SyncStatus syncStatusFromString(const QString &status);

    // returns a new identifier of the form <uuid>@<domain>
    static QString generateUid(const QString &domain);

    qint64 id;
    QString uid;
    qint64 calendarId;
    QString title;
    QString description;
    QString location;
    QDateTime startDate;
    QDateTime endDate;
    bool allDay;
    QString timezone;
    QString recurrenceRule;
    QList<Attendee> attendees;
    QList<Resource> resources;
    QString etag;
    QString url;
    QString rawData;
    SyncStatus syncStatus;
    QDateTime lastSyncAttempt;
    int revision;   // bumped on every content change, used to guard sync state updates
};

Q_DECLARE_METATYPE(CalendarEventRecord)

#endif // EVENTRECORD_H
