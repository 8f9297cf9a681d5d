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

#ifndef NETWORKDAVCLIENT_H
#define NETWORKDAVCLIENT_H

#include "davclient.h"
#include "settings.h"

#include <QSet>

class QNetworkAccessManager;
class Request;

class CALDAVSYNCSHARED_EXPORT NetworkDavClient : public DavClient
{
    Q_OBJECT

public:
    explicit NetworkDavClient(const Settings &settings, QObject *parent = 0);
    ~NetworkDavClient();

    virtual void login();
    virtual void fetchCalendars();
    virtual void fetchCalendarObjects(const QString &calendarPath);
    virtual void putCalendarObject(const QString &uri, const QString &icsData,
                                   const QString &etag = QString());
    virtual void deleteCalendarObject(const QString &uri, const QString &etag = QString());

    virtual QString calendarHomePath() const;

private Q_SLOTS:
    void userPrincipalFinished();
    void calendarHomeSetFinished();
    void calendarListFinished();
    void reportFinished();
    void putRequestFinished();
    void deleteRequestFinished();

private:
    template <typename T> T *takeRequest();
    QString fallbackCalendarHome() const;

    Settings mSettings;
    QNetworkAccessManager *mNAManager;
    QSet<Request *> mRequests;
    QString mCalendarHome;
};

class CALDAVSYNCSHARED_EXPORT NetworkDavClientFactory : public DavClientFactory
{
public:
    explicit NetworkDavClientFactory(bool ignoreSslErrors = false);

    virtual DavClient *createClient(const ServerConnection &connection, QObject *parent = 0);

private:
    bool mIgnoreSslErrors;
};

#endif // NETWORKDAVCLIENT_H
