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

#ifndef ICSREPAIR_H
#define ICSREPAIR_H

#include "caldavsync-global.h"

#include <QList>
#include <QString>
#include <QStringList>

/*
    Text-level repairs for iCalendar data produced by non-conformant clients.

    Every pass is a pure function from ICS text to ICS text, and every pass
    returns CRLF separated lines.  Passes are grouped into two pipelines:
    the pre-clean pipeline, always run before handing the data to the
    iCalendar parser, and the aggressive pipeline, run only when the parser
    rejected the pre-cleaned data.
 */
class CALDAVSYNCSHARED_EXPORT IcsRepair
{
public:
    typedef QString (*PassFunction)(const QString &icsData);

    struct Pass {
        const char *name;
        PassFunction apply;
    };

    static QList<Pass> preCleanPipeline();
    static QList<Pass> aggressivePipeline();
    static QString run(const QList<Pass> &pipeline, const QString &icsData);

    // pre-clean passes
    static QString normalizeLineEndings(const QString &icsData);
    static QString unfoldContinuationLines(const QString &icsData);
    static QString unfoldBrokenAttendeeLines(const QString &icsData);
    static QString splitScheduleStatusFromRRule(const QString &icsData);
    static QString fixDoubleMailto(const QString &icsData);

    // aggressive passes
    static QString extractParticipantsFromRRule(const QString &icsData);
    static QString truncateRRuleParameters(const QString &icsData);
    static QString stripDanglingMailto(const QString &icsData);

    // helpers shared with the parser and serializer
    static QStringList lines(const QString &icsData);
    static QString joinLines(const QStringList &lines);
    static bool looksLikePropertyLine(const QString &line);

private:
    IcsRepair();
};

#endif // ICSREPAIR_H
