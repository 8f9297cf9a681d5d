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

#ifndef ICSCOMPONENTREADER_H
#define ICSCOMPONENTREADER_H

#include "caldavsync-global.h"

#include <QDateTime>
#include <QList>
#include <QString>

// The VEVENT fields a standards-conformant iCalendar parser extracted.
struct ParsedComponent
{
    struct ParsedAttendee {
        QString email;
        QString name;
        QString role;
        QString status;
    };

    ParsedComponent()
        : startIsDate(false), startAtMidnight(false), endAtMidnight(false), hasEnd(false) {}

    QString uid;
    QString summary;
    QString description;
    QString location;
    QDateTime start;        // UTC, or midnight UTC of the date for date-only values
    QDate startWallDate;    // calendar date of DTSTART in its own zone
    bool startIsDate;
    bool startAtMidnight;   // wall-clock time of DTSTART in its own zone is 00:00:00
    QDateTime end;          // exclusive
    QDate endWallDate;
    bool endAtMidnight;
    bool hasEnd;
    QString recurrenceRule;
    QList<ParsedAttendee> attendees;
};

class CALDAVSYNCSHARED_EXPORT IcsComponentReader
{
public:
    virtual ~IcsComponentReader() {}

    // Parses the first master VEVENT of icsData into component.
    // Returns false if the data is rejected or contains no VEVENT.
    virtual bool read(const QString &icsData, ParsedComponent *component) = 0;
};

class CALDAVSYNCSHARED_EXPORT KCalCoreComponentReader : public IcsComponentReader
{
public:
    virtual bool read(const QString &icsData, ParsedComponent *component);
};

// Last-resort reader: scans the VEVENT property lines directly.  Used when
// the iCalendar parser rejects data even after repair.
class CALDAVSYNCSHARED_EXPORT PropertyScanComponentReader : public IcsComponentReader
{
public:
    virtual bool read(const QString &icsData, ParsedComponent *component);
};

#endif // ICSCOMPONENTREADER_H
