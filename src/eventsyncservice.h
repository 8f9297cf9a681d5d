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

#ifndef EVENTSYNCSERVICE_H
#define EVENTSYNCSERVICE_H

#include "caldavsync-global.h"
#include "eventrecord.h"

#include <QHash>
#include <QObject>

class Storage;
class Notifier;
class DavClient;
class DavClientFactory;
class SyncJobRegistry;

/*
    Local event operations that are pushed to the server right away.

    Every operation stores the change locally first and then asks the
    registry for a forced sync of the affected calendar, so the change
    reaches the server even if a pass is already running.
 */
class CALDAVSYNCSHARED_EXPORT EventSyncService : public QObject
{
    Q_OBJECT

public:
    EventSyncService(Storage *storage, SyncJobRegistry *registry, DavClientFactory *clientFactory,
                     Notifier *notifier, const QString &uidDomain = QString(), QObject *parent = 0);
    ~EventSyncService();

    // On success record holds the stored event.
    bool createEventWithSync(qint64 userId, CalendarEventRecord *record);
    // Applies the content fields of changes.  The uid of the stored event is kept.
    bool updateEventWithSync(qint64 userId, qint64 eventId, const CalendarEventRecord &changes,
                             CalendarEventRecord *updated = 0);
    bool cancelEventWithSync(qint64 userId, qint64 eventId);
    bool deleteEventFromServer(qint64 userId, qint64 eventId);
    bool forceBidirectionalSync(qint64 userId, qint64 calendarId = 0);

Q_SIGNALS:
    // RFC5546 CANCEL message to be mailed to the participants
    void cancellationReady(qint64 userId, const QString &uid, const QString &icsData);
    void remoteDeleteFinished(qint64 userId, qint64 eventId, bool success);

private Q_SLOTS:
    void deleteFinished(const QString &uri, int minorErrorCode, const QString &message);

private:
    struct RemoteDelete {
        qint64 userId;
        qint64 eventId;
        qint64 calendarId;
        bool resyncOnFailure;
    };

    bool loadOwnedEvent(qint64 userId, qint64 eventId, CalendarEventRecord *event);
    bool ownsCalendar(qint64 userId, qint64 calendarId);
    bool startRemoteDelete(const CalendarEventRecord &event, qint64 userId, bool resyncOnFailure);
    void requestSync(qint64 userId, qint64 calendarId, bool preserveLocalDeletes);

    Storage *mStorage;
    SyncJobRegistry *mRegistry;
    DavClientFactory *mClientFactory;
    Notifier *mNotifier;
    QString mUidDomain;
    QHash<DavClient *, RemoteDelete> mRemoteDeletes;
};

#endif // EVENTSYNCSERVICE_H
