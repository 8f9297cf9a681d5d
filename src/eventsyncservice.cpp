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

#include "eventsyncservice.h"
#include "davclient.h"
#include "icsserializer.h"
#include "notifier.h"
#include "storage.h"
#include "syncjobregistry.h"

#include <SyncResults.h>
#include <LogMacros.h>

EventSyncService::EventSyncService(Storage *storage, SyncJobRegistry *registry, DavClientFactory *clientFactory,
                                   Notifier *notifier, const QString &uidDomain, QObject *parent)
    : QObject(parent)
    , mStorage(storage)
    , mRegistry(registry)
    , mClientFactory(clientFactory)
    , mNotifier(notifier)
    , mUidDomain(uidDomain)
{
}

EventSyncService::~EventSyncService()
{
    Q_FOREACH (DavClient *client, mRemoteDeletes.keys()) {
        QObject::disconnect(client, 0, this, 0);
        client->deleteLater();
    }
    mRemoteDeletes.clear();
}

bool EventSyncService::ownsCalendar(qint64 userId, qint64 calendarId)
{
    bool ok = false;
    Calendar calendar = mStorage->calendar(calendarId, &ok);
    return ok && calendar.id != 0 && calendar.userId == userId;
}

bool EventSyncService::loadOwnedEvent(qint64 userId, qint64 eventId, CalendarEventRecord *event)
{
    bool ok = false;
    *event = mStorage->event(eventId, &ok);
    if (!ok || event->id == 0) {
        LOG_WARNING("Event" << eventId << "not found");
        return false;
    }
    if (!ownsCalendar(userId, event->calendarId)) {
        LOG_WARNING("Event" << eventId << "does not belong to user" << userId);
        return false;
    }
    return true;
}

void EventSyncService::requestSync(qint64 userId, qint64 calendarId, bool preserveLocalDeletes)
{
    SyncOptions options;
    options.forceRefresh = true;
    options.calendarId = calendarId;
    options.preserveLocalDeletes = preserveLocalDeletes;
    if (!mRegistry->syncNow(userId, options)) {
        LOG_DEBUG("No sync possible for user" << userId << ", change stays local");
    }
}

bool EventSyncService::createEventWithSync(qint64 userId, CalendarEventRecord *record)
{
    FUNCTION_CALL_TRACE;

    if (!ownsCalendar(userId, record->calendarId)) {
        LOG_WARNING("Calendar" << record->calendarId << "does not belong to user" << userId);
        return false;
    }

    CalendarEventRecord event = *record;
    event.id = 0;
    if (event.uid.trimmed().isEmpty()) {
        event.uid = CalendarEventRecord::generateUid(mUidDomain);
    }
    if (event.timezone.isEmpty()) {
        event.timezone = QStringLiteral("UTC");
    }
    event.etag.clear();
    event.url.clear();
    event.rawData.clear();
    event.syncStatus = CalendarEventRecord::Local;
    if (!mStorage->createEvent(&event)) {
        LOG_WARNING("Unable to store new event" << event.uid);
        return false;
    }
    LOG_DEBUG("Created event" << event.id << "with uid" << event.uid);

    *record = event;
    mNotifier->notify(userId, event.id, Notifier::EventCreated);
    requestSync(userId, event.calendarId, false);
    return true;
}

bool EventSyncService::updateEventWithSync(qint64 userId, qint64 eventId, const CalendarEventRecord &changes,
                                           CalendarEventRecord *updated)
{
    FUNCTION_CALL_TRACE;

    CalendarEventRecord event;
    if (!loadOwnedEvent(userId, eventId, &event)) {
        return false;
    }
    if (!changes.uid.isEmpty() && changes.uid != event.uid) {
        LOG_WARNING("Ignoring uid change of event" << eventId << "from" << event.uid << "to" << changes.uid);
    }

    event.title = changes.title;
    event.description = changes.description;
    event.location = changes.location;
    event.startDate = changes.startDate;
    event.endDate = changes.endDate;
    event.allDay = changes.allDay;
    if (!changes.timezone.isEmpty()) {
        event.timezone = changes.timezone;
    }
    event.recurrenceRule = changes.recurrenceRule;
    event.attendees = changes.attendees;
    event.resources = changes.resources;
    event.syncStatus = event.hasRemoteObject() ? CalendarEventRecord::Pending : CalendarEventRecord::Local;

    if (!mStorage->updateEvent(&event)) {
        LOG_WARNING("Unable to update event" << eventId);
        return false;
    }
    if (updated) {
        *updated = event;
    }
    mNotifier->notify(userId, event.id, Notifier::EventUpdated);
    requestSync(userId, event.calendarId, false);
    return true;
}

bool EventSyncService::cancelEventWithSync(qint64 userId, qint64 eventId)
{
    FUNCTION_CALL_TRACE;

    CalendarEventRecord event;
    if (!loadOwnedEvent(userId, eventId, &event)) {
        return false;
    }

    QString original = event.rawData;
    if (original.trimmed().isEmpty()) {
        bool ok = false;
        const ServerConnection connection = mStorage->serverConnection(userId, &ok);
        original = IcsSerializer::generateICalEvent(event, connection.username);
    }
    const QString cancellation = IcsSerializer::transformIcsForCancellation(original, event);

    if (!event.url.isEmpty()) {
        startRemoteDelete(event, userId, true);
    }

    if (!mStorage->deleteEvent(event.id)) {
        LOG_WARNING("Unable to delete event" << eventId);
        return false;
    }
    LOG_DEBUG("Cancelled event" << event.uid);
    mNotifier->notify(userId, event.id, Notifier::EventDeleted);
    emit cancellationReady(userId, event.uid, cancellation);
    return true;
}

bool EventSyncService::deleteEventFromServer(qint64 userId, qint64 eventId)
{
    FUNCTION_CALL_TRACE;

    CalendarEventRecord event;
    if (!loadOwnedEvent(userId, eventId, &event)) {
        return false;
    }
    if (event.url.isEmpty()) {
        LOG_DEBUG("Event" << eventId << "was never uploaded");
        return true;
    }
    return startRemoteDelete(event, userId, false);
}

bool EventSyncService::startRemoteDelete(const CalendarEventRecord &event, qint64 userId, bool resyncOnFailure)
{
    bool ok = false;
    const ServerConnection connection = mStorage->serverConnection(userId, &ok);
    if (!ok || !connection.isValid()) {
        LOG_WARNING("No server connection for user" << userId << ", cannot delete" << event.url);
        return false;
    }

    DavClient *client = mClientFactory->createClient(connection, this);
    connect(client, SIGNAL(deleteFinished(QString,int,QString)),
            this, SLOT(deleteFinished(QString,int,QString)));

    RemoteDelete remoteDelete;
    remoteDelete.userId = userId;
    remoteDelete.eventId = event.id;
    remoteDelete.calendarId = event.calendarId;
    remoteDelete.resyncOnFailure = resyncOnFailure;
    mRemoteDeletes.insert(client, remoteDelete);

    LOG_DEBUG("Deleting" << event.url << "from server");
    client->deleteCalendarObject(event.url, event.etag);
    return true;
}

void EventSyncService::deleteFinished(const QString &uri, int minorErrorCode, const QString &message)
{
    DavClient *client = qobject_cast<DavClient *>(sender());
    if (!client || !mRemoteDeletes.contains(client)) {
        return;
    }
    const RemoteDelete remoteDelete = mRemoteDeletes.take(client);
    QObject::disconnect(client, 0, this, 0);
    client->deleteLater();

    const bool success = minorErrorCode == Buteo::SyncResults::NO_ERROR;
    if (!success) {
        LOG_WARNING("Unable to delete" << uri << "from server:" << message);
        if (remoteDelete.resyncOnFailure) {
            // the next pull deletes the object that is gone locally
            requestSync(remoteDelete.userId, remoteDelete.calendarId, true);
        }
    }
    emit remoteDeleteFinished(remoteDelete.userId, remoteDelete.eventId, success);
}

bool EventSyncService::forceBidirectionalSync(qint64 userId, qint64 calendarId)
{
    FUNCTION_CALL_TRACE;

    SyncOptions options;
    options.forceRefresh = true;
    options.calendarId = calendarId;
    options.preserveLocalDeletes = true;
    return mRegistry->syncNow(userId, options);
}
