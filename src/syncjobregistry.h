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

#ifndef SYNCJOBREGISTRY_H
#define SYNCJOBREGISTRY_H

#include "caldavsync-global.h"
#include "syncorchestrator.h"

#include <QDateTime>
#include <QHash>
#include <QObject>

#include <SyncResults.h>

class Storage;
class Notifier;
class DavClientFactory;
class Scheduler;
class Ticker;

struct CALDAVSYNCSHARED_EXPORT SyncStatus
{
    SyncStatus()
        : configured(false), syncing(false), interval(300), inProgress(false), autoSync(false) {}

    bool configured;
    bool syncing;       // the periodic ticker is armed
    QDateTime lastSync;
    int interval;       // seconds
    bool inProgress;    // a pass is running
    bool autoSync;
};

/*
    Owns one sync job per user and schedules its passes.

    A job is created when a user session starts (setupSyncForUser) and is
    destroyed when the last session of that user ends.  Each job has its own
    periodic ticker, and a global ticker regularly drops jobs of users
    without an active session and syncs the others.

    At most one pass per user runs at a time.  A forced request made while a
    pass is running is queued and started when the running pass finishes;
    only the newest forced request is kept.  A pass already running is
    never cancelled, stopping a job only disarms its ticker.
 */
class CALDAVSYNCSHARED_EXPORT SyncJobRegistry : public QObject
{
    Q_OBJECT

public:
    SyncJobRegistry(Storage *storage, DavClientFactory *clientFactory, Scheduler *scheduler,
                    Notifier *notifier, const QString &uidDomain = QString(), QObject *parent = 0);
    ~SyncJobRegistry();

    void setDefaultSyncInterval(int seconds);
    int defaultSyncInterval() const;

    bool setupSyncForUser(qint64 userId, const ServerConnection &connection);
    bool handleUserLogout(qint64 userId);

    bool startSync(qint64 userId);
    bool stopSync(qint64 userId);
    bool syncNow(qint64 userId, const SyncOptions &options = SyncOptions());

    SyncStatus getSyncStatus(qint64 userId) const;
    Buteo::SyncResults syncResults(qint64 userId) const;
    bool hasJob(qint64 userId) const;
    int sessionCount(qint64 userId) const;

    bool updateSyncInterval(qint64 userId, int seconds);
    bool updateAutoSync(qint64 userId, bool enabled);

    void startGlobalSync(int intervalSeconds = 60);

Q_SIGNALS:
    void syncFinished(qint64 userId, bool success);

public Q_SLOTS:
    // Stops every ticker.  Passes already running finish on their own.
    void shutdownAll();
    void globalTick();

private Q_SLOTS:
    void jobTick();
    void passFinished(int minorErrorCode, const QString &message);

private:
    struct SyncJob {
        SyncJob();

        qint64 userId;
        int interval;
        Ticker *ticker;
        SyncOrchestrator *orchestrator;
        QDateTime lastSync;
        bool stopRequested;
        bool autoSync;
        int sessionCount;
        bool hasQueuedPass;
        SyncOptions queuedOptions;
        Buteo::SyncResults results;
    };

    SyncJob *createJob(const ServerConnection &connection);
    void destroyJob(SyncJob *job);
    void armTicker(SyncJob *job);
    bool runPass(SyncJob *job, const SyncOptions &options);

    Storage *mStorage;
    DavClientFactory *mClientFactory;
    Scheduler *mScheduler;
    Notifier *mNotifier;
    QString mUidDomain;
    int mDefaultSyncInterval;
    Ticker *mGlobalTicker;
    QHash<qint64, SyncJob *> mJobs;
};

#endif // SYNCJOBREGISTRY_H
