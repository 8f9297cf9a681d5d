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

#ifndef ICSPARSER_H
#define ICSPARSER_H

#include "caldavsync-global.h"
#include "eventrecord.h"

#include <QList>
#include <QString>

class IcsComponentReader;

/*
    Converts iCalendar data received from a server into a CalendarEventRecord.

    The data is first run through the pre-clean repair pipeline and handed to
    the component reader (KCalCore by default).  If the reader rejects it, the
    aggressive repair pipeline is applied and the reader is tried once more.
    If that still fails, the VEVENT properties are scanned directly, so that a
    record is only lost when it has neither usable dates nor a summary.
 */
class CALDAVSYNCSHARED_EXPORT IcsParser
{
public:
    // takes ownership of reader; a KCalCoreComponentReader is used if it is null
    explicit IcsParser(IcsComponentReader *reader = 0, const QString &uidDomain = QString());
    ~IcsParser();

    bool parse(const QString &icsData, CalendarEventRecord *record,
               const QString &etag = QString(), const QString &url = QString());

    // Participants found by scanning ATTENDEE lines of the raw text.
    static QList<Participant> scanParticipants(const QString &icsData);

    static bool looksLikeResource(const QString &cuType, const QString &role,
                                  const QString &name, const QString &email);

private:
    Q_DISABLE_COPY(IcsParser)

    IcsComponentReader *mReader;
    QString mUidDomain;
};

#endif // ICSPARSER_H
