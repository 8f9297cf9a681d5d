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

#include "eventrecord.h"

#include <QUuid>

Participant::Participant()
    : mKind(AttendeeKind)
{
}

Participant Participant::fromAttendee(const Attendee &attendee)
{
    Participant p;
    p.mKind = AttendeeKind;
    p.mAttendee = attendee;
    return p;
}

Participant Participant::fromResource(const Resource &resource)
{
    Participant p;
    p.mKind = ResourceKind;
    p.mResource = resource;
    return p;
}

Participant::Kind Participant::kind() const
{
    return mKind;
}

bool Participant::isResource() const
{
    return mKind == ResourceKind;
}

QString Participant::email() const
{
    return mKind == ResourceKind ? mResource.adminEmail : mAttendee.email;
}

Attendee Participant::attendee() const
{
    return mAttendee;
}

Resource Participant::resource() const
{
    return mResource;
}


ServerConnection::ServerConnection()
    : userId(0)
    , syncInterval(300)
    , autoSync(true)
    , status(Pending)
{
}

bool ServerConnection::isValid() const
{
    return userId > 0 && !url.isEmpty();
}

QString ServerConnection::statusToString(Status status)
{
    switch (status) {
    case Connected:
        return QStringLiteral("connected");
    case Error:
        return QStringLiteral("error");
    case Pending:
        break;
    }
    return QStringLiteral("pending");
}

ServerConnection::Status ServerConnection::statusFromString(const QString &status)
{
    if (status == QStringLiteral("connected")) {
        return Connected;
    } else if (status == QStringLiteral("error")) {
        return Error;
    }
    return Pending;
}


Calendar::Calendar()
    : id(0)
    , userId(0)
    , color(QStringLiteral("#3788d8"))
    , enabled(true)
{
}

bool Calendar::isLocalOnly() const
{
    return url.isEmpty();
}


CalendarEventRecord::CalendarEventRecord()
    : id(0)
    , calendarId(0)
    , allDay(false)
    , timezone(QStringLiteral("UTC"))
    , syncStatus(Local)
    , revision(0)
{
}

bool CalendarEventRecord::isValid() const
{
    return !uid.isEmpty() && startDate.isValid();
}

bool CalendarEventRecord::hasRemoteObject() const
{
    return !url.isEmpty() && !etag.isEmpty();
}

QList<Participant> CalendarEventRecord::participants() const
{
    QList<Participant> ret;
    Q_FOREACH (const Attendee &attendee, attendees) {
        ret.append(Participant::fromAttendee(attendee));
    }
    Q_FOREACH (const Resource &resource, resources) {
        ret.append(Participant::fromResource(resource));
    }
    return ret;
}

void CalendarEventRecord::setParticipants(const QList<Participant> &participants)
{
    attendees.clear();
    resources.clear();
    Q_FOREACH (const Participant &participant, participants) {
        if (participant.isResource()) {
            resources.append(participant.resource());
        } else {
            attendees.append(participant.attendee());
        }
    }
}

QString CalendarEventRecord::syncStatusToString(SyncStatus status)
{
    switch (status) {
    case Pending:
        return QStringLiteral("pending");
    case Synced:
        return QStringLiteral("synced");
    case Error:
        return QStringLiteral("error");
    case Local:
        break;
    }
    return QStringLiteral("local");
}

CalendarEventRecord::SyncStatus CalendarEventRecord::syncStatusFromString(const QString &status)
{
    if (status == QStringLiteral("pending")) {
        return Pending;
    } else if (status == QStringLiteral("synced")) {
        return Synced;
    } else if (status == QStringLiteral("error")) {
        return Error;
    }
    return Local;
}

QString CalendarEventRecord::generateUid(const QString &domain)
{
    QString local = QUuid::createUuid().toString();
    local = local.mid(1, local.length() - 2);   // strip the braces
    return local + QChar('@') + (domain.isEmpty() ? QStringLiteral("caldavclient.local") : domain);
}
