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

#ifndef ICSSERIALIZER_H
#define ICSSERIALIZER_H

#include "caldavsync-global.h"
#include "eventrecord.h"

#include <QDateTime>
#include <QString>

class CALDAVSYNCSHARED_EXPORT IcsSerializer
{
public:
    struct FormatOptions {
        FormatOptions() : sequence(-1), preserveAttendees(false) {}

        QString method;         // METHOD override, e.g. REQUEST or CANCEL
        QString status;         // STATUS override inside the VEVENT
        int sequence;           // SEQUENCE override, ignored if negative
        QString organizer;      // ORGANIZER address override
        bool preserveAttendees; // keep duplicate ATTENDEE lines
    };

    /*
        Returns the iCalendar data to upload for record.

        If the record holds iCalendar data from an earlier sync, that data is
        used as a template: only the properties the record owns are replaced
        and all other lines, including vendor extensions, are kept.  The
        SEQUENCE is incremented when a pending modification of an already
        uploaded event is serialized.  Otherwise a new VCALENDAR is built
        with username as the organizer.
     */
    static QString generateICalEvent(const CalendarEventRecord &record, const QString &username,
                                     const QDateTime &timestamp = QDateTime());

    // RFC5546 CANCEL message for the event described by originalIcs
    static QString transformIcsForCancellation(const QString &originalIcs,
                                               const CalendarEventRecord &record,
                                               const QDateTime &timestamp = QDateTime());

    // Cleans up iCalendar data before it is sent out as an invitation.
    static QString sanitizeAndFormatIcs(const QString &icsData,
                                        const FormatOptions &options = FormatOptions());

    static QString foldLine(const QString &line);
    static QString escapeText(const QString &text);

    // SEQUENCE of the first VEVENT, or -1 if there is none
    static int sequenceOf(const QString &icsData);

    static QString attendeeLine(const Attendee &attendee);
    static QString resourceLine(const Resource &resource);

private:
    IcsSerializer();
};

#endif // ICSSERIALIZER_H
