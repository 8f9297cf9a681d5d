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

#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include "caldavsync-global.h"
#include "davclient.h"
#include "eventrecord.h"
#include "icsparser.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSet>

class Storage;
class Notifier;

struct CALDAVSYNCSHARED_EXPORT SyncOptions
{
    SyncOptions()
        : forceRefresh(false), calendarId(0), preserveLocalEvents(false), preserveLocalDeletes(false) {}

    bool forceRefresh;
    qint64 calendarId;          // 0 syncs every remote calendar
    bool preserveLocalEvents;   // local and error records are not overwritten by the pull
    bool preserveLocalDeletes;  // remote objects unknown locally are deleted from the server
};

/*
    Runs sync passes between the local store and the CalDAV server for one user.

    A pass logs in, resolves the calendars to sync and, for each calendar in
    turn, pulls the remote objects into the store, then pushes the local
    additions and modifications.  If an update was pushed, the calendar is
    pulled once more so that the store reflects what the server made of it.

    Only a failed login or a failed calendar listing ends the pass with an
    error.  Failures for a single calendar or event are logged and skipped.
 */
class CALDAVSYNCSHARED_EXPORT SyncOrchestrator : public QObject
{
    Q_OBJECT

public:
    SyncOrchestrator(qint64 userId, Storage *storage, DavClientFactory *clientFactory,
                     Notifier *notifier, const QString &uidDomain = QString(), QObject *parent = 0);
    ~SyncOrchestrator();

    // Starts a pass.  Returns true if a pass was started or one is already
    // running, false if the user has no server connection.
    bool syncNow(const SyncOptions &options = SyncOptions());

    bool isRunning() const;
    qint64 userId() const;

Q_SIGNALS:
    void finished(int minorErrorCode, const QString &message);

private Q_SLOTS:
    void loginFinished(int minorErrorCode, const QString &message);
    void calendarsFetched(int minorErrorCode, const QString &message, const QList<CalendarInfo> &calendars);
    void calendarObjectsFetched(const QString &calendarPath, int minorErrorCode, const QString &message,
                                const QList<Reader::CalendarResource> &resources);
    void putFinished(const QString &uri, int minorErrorCode, const QString &message, const QString &etag);
    void deleteFinished(const QString &uri, int minorErrorCode, const QString &message);

private:
    struct Upload {
        qint64 eventId;
        int revision;
        QString ics;
        QString previousEtag;
        bool isUpdate;
    };

    void resolveCalendarFromId();
    void reconcileCalendars(const QList<CalendarInfo> &remoteCalendars);
    void syncNextCalendar();
    void pullCalendarObjects(const QList<Reader::CalendarResource> &resources);
    void pushLocalEvents();
    void calendarRequestsFinished();
    void finishCalendar();
    void emitFinished(int minorErrorCode, const QString &message);
    void markUploadFailed(const Upload &upload);

    QString absoluteUrl(const QString &path) const;
    QString collectionUrl(const Calendar &calendar) const;

    qint64 mUserId;
    Storage *mStorage;
    DavClientFactory *mClientFactory;
    Notifier *mNotifier;
    IcsParser mParser;
    QPointer<DavClient> mClient;

    // state of the current pass
    SyncOptions mOptions;
    ServerConnection mConnection;
    QList<Calendar> mPendingCalendars;
    Calendar mCurrentCalendar;
    QString mCurrentPath;
    QHash<QString, Upload> mUploads;
    QSet<QString> mDeletes;
    bool mFollowUpPull;
    bool mFollowUpNeeded;
    bool mRunning;
};

#endif // SYNCORCHESTRATOR_H
