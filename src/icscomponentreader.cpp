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

#include "icscomponentreader.h"
#include "icsrepair.h"

#include <QRegularExpression>
#include <QStringList>
#include <QTimeZone>

#include <icalformat.h>
#include <memorycalendar.h>
#include <event.h>
#include <attendee.h>
#include <recurrence.h>
#include <recurrencerule.h>

#include <LogMacros.h>

namespace {
    QString roleToString(KCalCore::Attendee::Role role)
    {
        switch (role) {
        case KCalCore::Attendee::OptParticipant:
            return QStringLiteral("OPT-PARTICIPANT");
        case KCalCore::Attendee::NonParticipant:
            return QStringLiteral("NON-PARTICIPANT");
        case KCalCore::Attendee::Chair:
            return QStringLiteral("CHAIR");
        case KCalCore::Attendee::ReqParticipant:
            break;
        }
        return QStringLiteral("REQ-PARTICIPANT");
    }

    QString statusToString(KCalCore::Attendee::PartStat status)
    {
        switch (status) {
        case KCalCore::Attendee::Accepted:
            return QStringLiteral("ACCEPTED");
        case KCalCore::Attendee::Declined:
            return QStringLiteral("DECLINED");
        case KCalCore::Attendee::Tentative:
            return QStringLiteral("TENTATIVE");
        case KCalCore::Attendee::Delegated:
            return QStringLiteral("DELEGATED");
        case KCalCore::Attendee::Completed:
            return QStringLiteral("COMPLETED");
        case KCalCore::Attendee::InProcess:
            return QStringLiteral("IN-PROCESS");
        case KCalCore::Attendee::None:
            return QString();
        case KCalCore::Attendee::NeedsAction:
            break;
        }
        return QStringLiteral("NEEDS-ACTION");
    }

    QDateTime toUtc(const KDateTime &dt)
    {
        if (dt.isDateOnly()) {
            return QDateTime(dt.date(), QTime(0, 0, 0), Qt::UTC);
        }
        QDateTime utc = dt.toUtc().dateTime();
        utc.setTimeSpec(Qt::UTC);
        return utc;
    }
}

bool KCalCoreComponentReader::read(const QString &icsData, ParsedComponent *component)
{
    KCalCore::ICalFormat iCalFormat;
    KCalCore::MemoryCalendar::Ptr cal(new KCalCore::MemoryCalendar(KDateTime::UTC));
    if (!iCalFormat.fromString(cal, icsData)) {
        LOG_WARNING("unable to parse iCal data");
        return false;
    }

    KCalCore::Event::List events = cal->events();
    if (events.isEmpty()) {
        LOG_WARNING("iCal data doesn't contain a VEVENT");
        return false;
    }
    LOG_DEBUG("iCal data contains" << events.count() << "VEVENT instances");

    // exceptions (RECURRENCE-ID) share the uid of the series; use the series itself
    KCalCore::Event::Ptr event = events.first();
    Q_FOREACH (const KCalCore::Event::Ptr &candidate, events) {
        if (!candidate->hasRecurrenceId()) {
            event = candidate;
            break;
        }
    }

    component->uid = event->uid();
    component->summary = event->summary();
    component->description = event->description();
    component->location = event->location();

    KDateTime dtStart = event->dtStart();
    if (dtStart.isValid()) {
        component->start = toUtc(dtStart);
        component->startWallDate = dtStart.date();
        component->startIsDate = dtStart.isDateOnly() || event->allDay();
        component->startAtMidnight = dtStart.isDateOnly() || dtStart.time() == QTime(0, 0, 0);
    }

    if (event->hasEndDate()) {
        KDateTime dtEnd = event->dtEnd();
        if (dtEnd.isValid()) {
            if (dtEnd.isDateOnly()) {
                // kcalcore reports the end of all-day events as the inclusive last day
                component->end = toUtc(dtEnd).addDays(1);
                component->endWallDate = dtEnd.date().addDays(1);
                component->endAtMidnight = true;
            } else {
                component->end = toUtc(dtEnd);
                component->endWallDate = dtEnd.date();
                component->endAtMidnight = dtEnd.time() == QTime(0, 0, 0);
            }
            component->hasEnd = component->end > component->start;
        }
    }

    if (event->recurs()) {
        KCalCore::RecurrenceRule *rule = event->recurrence()->defaultRRuleConst();
        if (rule) {
            QString rrule = iCalFormat.toString(rule).trimmed();
            if (rrule.startsWith(QStringLiteral("RRULE:"), Qt::CaseInsensitive)) {
                rrule = rrule.mid(6);
            }
            component->recurrenceRule = rrule;
        }
    }

    Q_FOREACH (const KCalCore::Attendee::Ptr &attendee, event->attendees()) {
        if (attendee.isNull() || attendee->email().isEmpty()) {
            continue;
        }
        ParsedComponent::ParsedAttendee parsed;
        parsed.email = attendee->email();
        parsed.name = attendee->name();
        parsed.role = roleToString(attendee->role());
        parsed.status = statusToString(attendee->status());
        component->attendees.append(parsed);
    }

    return true;
}

namespace {
    // value of a property line, or an empty string
    QString propertyValue(const QStringList &lines, const QString &name, QString *params = 0)
    {
        Q_FOREACH (const QString &line, lines) {
            if (!line.startsWith(name, Qt::CaseInsensitive) || line.length() <= name.length()) {
                continue;
            }
            const QChar next = line.at(name.length());
            if (next != QChar(':') && next != QChar(';')) {
                continue;
            }
            int colon = line.indexOf(QChar(':'), name.length());
            if (colon < 0) {
                continue;
            }
            if (params) {
                *params = line.mid(name.length(), colon - name.length());
            }
            return line.mid(colon + 1).trimmed();
        }
        return QString();
    }

    // undoes TEXT value escaping
    QString unescapedText(const QString &value)
    {
        QString ret;
        ret.reserve(value.length());
        for (int i = 0; i < value.length(); ++i) {
            const QChar c = value.at(i);
            if (c != QChar('\\') || i + 1 == value.length()) {
                ret.append(c);
                continue;
            }
            const QChar next = value.at(++i);
            if (next == QChar('n') || next == QChar('N')) {
                ret.append(QChar('\n'));
            } else if (next == QChar('\\') || next == QChar(';') || next == QChar(',')) {
                ret.append(next);
            } else {
                ret.append(c);
                ret.append(next);
            }
        }
        return ret;
    }

    bool readDateTime(const QString &value, const QString &params, QDateTime *utc, QDate *wallDate,
                      bool *isDate, bool *atMidnight)
    {
        if (value.length() == 8) {
            QDate date = QDate::fromString(value, QStringLiteral("yyyyMMdd"));
            if (!date.isValid()) {
                return false;
            }
            *utc = QDateTime(date, QTime(0, 0, 0), Qt::UTC);
            *wallDate = date;
            *isDate = true;
            *atMidnight = true;
            return true;
        }
        const bool isUtc = value.endsWith(QChar('Z'));
        QDateTime dt = QDateTime::fromString(isUtc ? value.left(value.length() - 1) : value,
                                             QStringLiteral("yyyyMMddTHHmmss"));
        if (!dt.isValid()) {
            return false;
        }
        *wallDate = dt.date();
        *atMidnight = dt.time() == QTime(0, 0, 0);
        *isDate = false;
        static const QRegularExpression tzid(QStringLiteral("TZID=\"?([^\";:]+)\"?"));
        QRegularExpressionMatch match = tzid.match(params);
        if (isUtc) {
            dt.setTimeSpec(Qt::UTC);
        } else if (match.hasMatch() && QTimeZone(match.captured(1).toLatin1()).isValid()) {
            dt.setTimeZone(QTimeZone(match.captured(1).toLatin1()));
        } else {
            dt.setTimeSpec(Qt::UTC);
        }
        *utc = dt.toUTC();
        return true;
    }
}

bool PropertyScanComponentReader::read(const QString &icsData, ParsedComponent *component)
{
    QStringList eventLines;
    bool inEvent = false;
    Q_FOREACH (const QString &line, IcsRepair::lines(IcsRepair::unfoldContinuationLines(icsData))) {
        if (line.startsWith(QStringLiteral("BEGIN:VEVENT"), Qt::CaseInsensitive)) {
            inEvent = true;
        } else if (line.startsWith(QStringLiteral("END:VEVENT"), Qt::CaseInsensitive)) {
            break;
        } else if (inEvent) {
            eventLines.append(line);
        }
    }
    if (!inEvent) {
        return false;
    }

    component->uid = propertyValue(eventLines, QStringLiteral("UID"));
    component->summary = unescapedText(propertyValue(eventLines, QStringLiteral("SUMMARY")));
    component->location = unescapedText(propertyValue(eventLines, QStringLiteral("LOCATION")));
    component->description = unescapedText(propertyValue(eventLines, QStringLiteral("DESCRIPTION")));

    QString params;
    QString value = propertyValue(eventLines, QStringLiteral("DTSTART"), &params);
    if (!value.isEmpty()) {
        readDateTime(value, params, &component->start, &component->startWallDate,
                     &component->startIsDate, &component->startAtMidnight);
    }
    value = propertyValue(eventLines, QStringLiteral("DTEND"), &params);
    bool endIsDate = false;
    if (!value.isEmpty() && readDateTime(value, params, &component->end, &component->endWallDate,
                                         &endIsDate, &component->endAtMidnight)) {
        component->hasEnd = component->start.isValid() && component->end > component->start;
    }
    component->recurrenceRule = propertyValue(eventLines, QStringLiteral("RRULE"));
    return true;
}
