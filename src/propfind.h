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

#ifndef PROPFIND_H
#define PROPFIND_H

#include "request.h"
#include "reader.h"

#include <QList>

class QNetworkAccessManager;
class Settings;

// Calendar discovery: user principal, calendar home and calendar collections.
class Propfind : public Request
{
    Q_OBJECT

public:
    enum Lookup {
        UserPrincipal,
        CalendarHomeSet,
        Calendars
    };

    explicit Propfind(QNetworkAccessManager *manager, Settings *settings, QObject *parent = 0);

    void lookupUserPrincipal(const QString &path);
    void lookupCalendarHomeSet(const QString &principalPath);
    void listCalendars(const QString &calendarHomePath);

    Lookup lookup() const;

    // results, valid once finished() was emitted without error
    QString userPrincipal() const;
    QString calendarHome() const;
    QList<Reader::CalendarResource> calendars() const;

private:
    virtual void handleReply(QNetworkReply *reply, const QByteArray &data);
    void sendPropfind(const QString &path, const QByteArray &depth, const QByteArray &body);

    Lookup mLookup;
    QString mPath;
    QString mUserPrincipal;
    QString mCalendarHome;
    QList<Reader::CalendarResource> mCalendars;
};

#endif // PROPFIND_H
