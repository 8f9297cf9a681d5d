/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * Contributors: Mani Chandrasekar <maninc@gmail.com>
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

#ifndef READER_H
#define READER_H

#include "caldavsync-global.h"

#include <QList>
#include <QMetaType>
#include <QString>

class QXmlStreamReader;

// Reads the multistatus body of PROPFIND and REPORT replies.
class CALDAVSYNCSHARED_EXPORT Reader
{
public:
    struct CalendarResource {
        CalendarResource() : isCalendar(false) {}

        QString href;
        QString etag;
        QString status;
        QString iCalData;

        // collection properties
        QString displayName;
        QString color;
        bool isCalendar;
        QString principalHref;
        QString calendarHomeHref;
    };

    Reader();
    ~Reader();

    bool read(const QByteArray &data);
    QList<CalendarResource> results() const;

private:
    void readMultiStatus();
    void readResponse();
    void readPropStat(CalendarResource *resource);
    void readProp(CalendarResource *resource);
    QString readHref();

private:
    QXmlStreamReader *mReader;
    QList<CalendarResource> mResults;
};

Q_DECLARE_METATYPE(Reader::CalendarResource)

#endif // READER_H
