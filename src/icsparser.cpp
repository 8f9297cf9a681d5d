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

#include "icsparser.h"
#include "icscomponentreader.h"
#include "icsrepair.h"
#include "rrulesanitizer.h"

#include <QHash>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <LogMacros.h>

namespace {
    const QString UNTITLED_EVENT = QStringLiteral("Untitled Event");

    int valueSeparator(const QString &line)
    {
        bool quoted = false;
        for (int i = 0; i < line.length(); ++i) {
            if (line[i] == QChar('"')) {
                quoted = !quoted;
            } else if (line[i] == QChar(':') && !quoted) {
                return i;
            }
        }
        return -1;
    }

    QString unquote(const QString &value)
    {
        QString ret = value.trimmed();
        if (ret.length() >= 2 && ret.startsWith(QChar('"')) && ret.endsWith(QChar('"'))) {
            ret = ret.mid(1, ret.length() - 2);
        }
        return ret;
    }

    QHash<QString, QString> attendeeParameters(const QString &paramsText)
    {
        static const QRegularExpression param(QStringLiteral(";([A-Za-z][A-Za-z-]*)=(\"[^\"]*\"|[^;]*)"));
        QHash<QString, QString> ret;
        QRegularExpressionMatchIterator it = param.globalMatch(paramsText);
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            const QString name = match.captured(1).toUpper();
            if (!ret.contains(name)) {
                ret.insert(name, unquote(match.captured(2)));
            }
        }
        return ret;
    }

    QString attendeeAddress(const QString &value)
    {
        QString address = value.trimmed();
        if (address.startsWith(QStringLiteral("mailto:"), Qt::CaseInsensitive)) {
            address = address.mid(7);
        }
        return address.trimmed();
    }

    QString timezoneOf(const QString &icsData)
    {
        static const QRegularExpression tzid(QStringLiteral("^DTSTART;[^:\\r\\n]*TZID=\"?([^\";:\\r\\n]+)\"?"),
                                             QRegularExpression::MultilineOption
                                             | QRegularExpression::CaseInsensitiveOption);
        QRegularExpressionMatch match = tzid.match(icsData);
        return match.hasMatch() ? match.captured(1).trimmed() : QStringLiteral("UTC");
    }

    QString rawRecurrenceRule(const QString &icsData)
    {
        static const QRegularExpression rrule(QStringLiteral("^RRULE:([^\\r\\n]*)"),
                                              QRegularExpression::MultilineOption
                                              | QRegularExpression::CaseInsensitiveOption);
        QRegularExpressionMatch match = rrule.match(icsData);
        return match.hasMatch() ? match.captured(1).trimmed() : QString();
    }

    QDateTime wallMidnight(const QDate &date)
    {
        return QDateTime(date, QTime(0, 0, 0), Qt::UTC);
    }
}

IcsParser::IcsParser(IcsComponentReader *reader, const QString &uidDomain)
    : mReader(reader ? reader : new KCalCoreComponentReader)
    , mUidDomain(uidDomain)
{
}

IcsParser::~IcsParser()
{
    delete mReader;
}

bool IcsParser::looksLikeResource(const QString &cuType, const QString &role,
                                  const QString &name, const QString &email)
{
    if (cuType.compare(QStringLiteral("RESOURCE"), Qt::CaseInsensitive) == 0
            || cuType.compare(QStringLiteral("ROOM"), Qt::CaseInsensitive) == 0) {
        return true;
    }
    if (role.compare(QStringLiteral("NON-PARTICIPANT"), Qt::CaseInsensitive) == 0) {
        return true;
    }
    static const QRegularExpression keywords(QStringLiteral("room|projector|chair"),
                                             QRegularExpression::CaseInsensitiveOption);
    return keywords.match(name).hasMatch() || keywords.match(email).hasMatch();
}

QList<Participant> IcsParser::scanParticipants(const QString &icsData)
{
    QList<Participant> ret;
    const QString unfolded = IcsRepair::unfoldContinuationLines(icsData);
    Q_FOREACH (const QString &line, IcsRepair::lines(unfolded)) {
        if (!line.startsWith(QStringLiteral("ATTENDEE"), Qt::CaseInsensitive)) {
            continue;
        }
        int sep = valueSeparator(line);
        if (sep < 0) {
            continue;
        }
        const QString email = attendeeAddress(line.mid(sep + 1));
        if (email.isEmpty() || !email.contains(QChar('@'))) {
            continue;
        }
        const QHash<QString, QString> params = attendeeParameters(line.left(sep));
        const QString name = params.value(QStringLiteral("CN"));
        const QString role = params.value(QStringLiteral("ROLE"));
        if (looksLikeResource(params.value(QStringLiteral("CUTYPE")), role, name, email)) {
            Resource resource;
            resource.name = name.isEmpty() ? email : name;
            resource.adminEmail = email;
            resource.type = params.value(QStringLiteral("X-RESOURCE-TYPE"),
                                         params.value(QStringLiteral("RESOURCE-TYPE")));
            ret.append(Participant::fromResource(resource));
        } else {
            Attendee attendee;
            attendee.email = email;
            attendee.name = name;
            attendee.role = role;
            attendee.status = params.value(QStringLiteral("PARTSTAT"));
            attendee.scheduleStatus = params.value(QStringLiteral("SCHEDULE-STATUS"));
            ret.append(Participant::fromAttendee(attendee));
        }
    }
    return ret;
}

bool IcsParser::parse(const QString &icsData, CalendarEventRecord *record,
                      const QString &etag, const QString &url)
{
    FUNCTION_CALL_TRACE;

    if (!icsData.contains(QStringLiteral("BEGIN:VEVENT"), Qt::CaseInsensitive)) {
        LOG_WARNING("iCal data doesn't contain a VEVENT");
        return false;
    }

    const QString preCleaned = IcsRepair::run(IcsRepair::preCleanPipeline(), icsData);
    QString cleaned = preCleaned;
    ParsedComponent component;
    bool ok = mReader->read(cleaned, &component);
    if (!ok) {
        LOG_DEBUG("Retrying parse after aggressive repair");
        cleaned = IcsRepair::run(IcsRepair::aggressivePipeline(), cleaned);
        component = ParsedComponent();
        ok = mReader->read(cleaned, &component);
    }
    if (!ok) {
        LOG_WARNING("iCal parser rejected repaired data, scanning properties directly");
        PropertyScanComponentReader scanner;
        component = ParsedComponent();
        ok = scanner.read(cleaned, &component);
    }
    if (!ok) {
        return false;
    }

    const QString summary = component.summary.trimmed();
    if (!component.start.isValid() && summary.isEmpty()) {
        LOG_WARNING("Dropping calendar object without dates or summary" << url);
        return false;
    }

    CalendarEventRecord ret;
    ret.uid = component.uid.trimmed();
    if (ret.uid.isEmpty()) {
        ret.uid = CalendarEventRecord::generateUid(mUidDomain);
        LOG_DEBUG("Generated uid" << ret.uid << "for calendar object" << url);
    }
    ret.title = summary.isEmpty() ? UNTITLED_EVENT : summary;
    ret.description = component.description;
    ret.location = component.location;

    if (component.start.isValid()) {
        ret.allDay = component.startIsDate || component.startAtMidnight;
        if (ret.allDay) {
            ret.startDate = wallMidnight(component.startWallDate);
            if (component.hasEnd) {
                QDate endDate = component.endAtMidnight ? component.endWallDate
                                                        : component.endWallDate.addDays(1);
                if (endDate <= component.startWallDate) {
                    endDate = component.startWallDate.addDays(1);
                }
                ret.endDate = wallMidnight(endDate);
            } else {
                ret.endDate = ret.startDate.addDays(1);
            }
        } else {
            ret.startDate = component.start;
            ret.endDate = component.hasEnd ? component.end : component.start.addSecs(3600);
        }
    } else {
        // summary without usable dates: schedule a one hour slot at the current hour
        QDateTime now = QDateTime::currentDateTimeUtc();
        ret.startDate = QDateTime(now.date(), QTime(now.time().hour(), 0, 0), Qt::UTC);
        ret.endDate = ret.startDate.addSecs(3600);
    }
    ret.timezone = timezoneOf(cleaned);

    const QString rawRule = rawRecurrenceRule(cleaned);
    const QString sanitizedRaw = RRuleSanitizer::sanitize(rawRule);
    if (!rawRule.isEmpty() && sanitizedRaw != rawRule) {
        // the parser cannot be trusted with a corrupted rule
        ret.recurrenceRule = sanitizedRaw;
    } else if (component.recurrenceRule.startsWith(QStringLiteral("FREQ="), Qt::CaseInsensitive)) {
        ret.recurrenceRule = component.recurrenceRule;
    } else {
        ret.recurrenceRule = sanitizedRaw;
    }

    const QList<Participant> scanned = scanParticipants(cleaned);
    QList<Participant> participants;
    if (!component.attendees.isEmpty()) {
        QHash<QString, Participant> scannedByEmail;
        Q_FOREACH (const Participant &participant, scanned) {
            scannedByEmail.insert(participant.email().toLower(), participant);
        }
        Q_FOREACH (const ParsedComponent::ParsedAttendee &parsed, component.attendees) {
            const QString key = parsed.email.toLower();
            const bool known = scannedByEmail.contains(key);
            const Participant raw = scannedByEmail.value(key);
            if ((known && raw.isResource())
                    || looksLikeResource(QString(), parsed.role, parsed.name, parsed.email)) {
                Resource resource = raw.isResource() ? raw.resource() : Resource();
                resource.adminEmail = parsed.email;
                if (!parsed.name.isEmpty()) {
                    resource.name = parsed.name;
                } else if (resource.name.isEmpty()) {
                    resource.name = parsed.email;
                }
                participants.append(Participant::fromResource(resource));
            } else {
                Attendee attendee;
                attendee.email = parsed.email;
                attendee.name = parsed.name;
                attendee.role = parsed.role;
                attendee.status = parsed.status;
                if (known) {
                    attendee.scheduleStatus = raw.attendee().scheduleStatus;
                }
                participants.append(Participant::fromAttendee(attendee));
            }
        }
    } else {
        participants = scanned;
    }

    QSet<QString> resourceEmails;
    QList<Participant> resources;
    Q_FOREACH (const Participant &participant, participants) {
        if (participant.isResource() && !resourceEmails.contains(participant.email().toLower())) {
            resourceEmails.insert(participant.email().toLower());
            resources.append(participant);
        }
    }
    QSet<QString> attendeeEmails;
    QList<Participant> classified;
    Q_FOREACH (const Participant &participant, participants) {
        const QString key = participant.email().toLower();
        if (participant.isResource() || resourceEmails.contains(key) || attendeeEmails.contains(key)) {
            continue;
        }
        attendeeEmails.insert(key);
        classified.append(participant);
    }
    classified += resources;
    ret.setParticipants(classified);

    ret.etag = etag;
    ret.url = url;
    ret.rawData = preCleaned;
    ret.syncStatus = CalendarEventRecord::Synced;

    // keep the local identity of the target record
    ret.id = record->id;
    ret.calendarId = record->calendarId;
    ret.revision = record->revision;
    *record = ret;
    return true;
}
