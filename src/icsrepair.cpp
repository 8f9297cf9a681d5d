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

#include "icsrepair.h"
#include "rrulesanitizer.h"

#include <QRegularExpression>

#include <LogMacros.h>

namespace {
    bool isRRuleLine(const QString &line)
    {
        return line.startsWith(QStringLiteral("RRULE:"), Qt::CaseInsensitive);
    }

    bool isAttendeeLine(const QString &line)
    {
        return line.startsWith(QStringLiteral("ATTENDEE"), Qt::CaseInsensitive);
    }

    // Index of the colon separating the property name and parameters from the value,
    // skipping colons inside quoted parameter values.
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

    // true if an ATTENDEE line is missing its calendar address
    bool attendeeIsIncomplete(const QString &line)
    {
        int sep = valueSeparator(line);
        if (sep < 0) {
            return true;
        }
        const QString value = line.mid(sep + 1).trimmed();
        return value.isEmpty() || value.compare(QStringLiteral("mailto:"), Qt::CaseInsensitive) == 0;
    }

    QString participantLine(const QString &paramsText, const QString &address)
    {
        static const QRegularExpression paramPattern(QStringLiteral("([A-Za-z][A-Za-z-]*)=(\"[^\"]*\"|[^;:]*)"));
        static const QRegularExpression gluedType(
                QStringLiteral("^([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[a-z]{2,})([A-Z][A-Za-z]*)$"));

        QString email = address;
        QString resourceType;
        QRegularExpressionMatch glued = gluedType.match(address);
        if (glued.hasMatch()) {
            email = glued.captured(1);
            resourceType = glued.captured(2);
        }

        QString line = QStringLiteral("ATTENDEE");
        bool hasCuType = false;
        QRegularExpressionMatchIterator it = paramPattern.globalMatch(paramsText);
        while (it.hasNext()) {
            QRegularExpressionMatch param = it.next();
            const QString name = param.captured(1).toUpper();
            if (name == QStringLiteral("ATTENDEE") || name == QStringLiteral("RRULE")
                    || name == QStringLiteral("FREQ") || name == QStringLiteral("BYDAY")
                    || name == QStringLiteral("INTERVAL") || name == QStringLiteral("COUNT")
                    || name == QStringLiteral("UNTIL")) {
                continue;
            }
            hasCuType |= name == QStringLiteral("CUTYPE");
            line += QChar(';') + name + QChar('=') + param.captured(2);
        }
        if (!resourceType.isEmpty()) {
            if (!hasCuType) {
                line += QStringLiteral(";CUTYPE=RESOURCE");
            }
            line += QStringLiteral(";X-RESOURCE-TYPE=") + resourceType;
        }
        return line + QStringLiteral(":mailto:") + email;
    }
}

QList<IcsRepair::Pass> IcsRepair::preCleanPipeline()
{
    Pass passes[] = {
        { "normalizeLineEndings", &IcsRepair::normalizeLineEndings },
        { "unfoldContinuationLines", &IcsRepair::unfoldContinuationLines },
        { "unfoldBrokenAttendeeLines", &IcsRepair::unfoldBrokenAttendeeLines },
        { "splitScheduleStatusFromRRule", &IcsRepair::splitScheduleStatusFromRRule },
        { "fixDoubleMailto", &IcsRepair::fixDoubleMailto }
    };
    QList<Pass> pipeline;
    for (unsigned i = 0; i < sizeof(passes) / sizeof(passes[0]); ++i) {
        pipeline.append(passes[i]);
    }
    return pipeline;
}

QList<IcsRepair::Pass> IcsRepair::aggressivePipeline()
{
    Pass passes[] = {
        { "extractParticipantsFromRRule", &IcsRepair::extractParticipantsFromRRule },
        { "truncateRRuleParameters", &IcsRepair::truncateRRuleParameters },
        { "stripDanglingMailto", &IcsRepair::stripDanglingMailto }
    };
    QList<Pass> pipeline;
    for (unsigned i = 0; i < sizeof(passes) / sizeof(passes[0]); ++i) {
        pipeline.append(passes[i]);
    }
    return pipeline;
}

QString IcsRepair::run(const QList<Pass> &pipeline, const QString &icsData)
{
    QString data = icsData;
    Q_FOREACH (const Pass &pass, pipeline) {
        QString repaired = pass.apply(data);
        if (repaired != data) {
            LOG_DEBUG("ICS repair pass" << pass.name << "modified the data");
        }
        data = repaired;
    }
    return data;
}

QStringList IcsRepair::lines(const QString &icsData)
{
    QString data = icsData;
    data.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    data.replace(QChar('\r'), QChar('\n'));
    QStringList ret = data.split(QChar('\n'));
    while (!ret.isEmpty() && ret.last().isEmpty()) {
        ret.removeLast();
    }
    return ret;
}

QString IcsRepair::joinLines(const QStringList &lines)
{
    if (lines.isEmpty()) {
        return QString();
    }
    return lines.join(QStringLiteral("\r\n")) + QStringLiteral("\r\n");
}

bool IcsRepair::looksLikePropertyLine(const QString &line)
{
    static const QRegularExpression property(QStringLiteral("^[A-Za-z][A-Za-z0-9-]*[;:]"));
    return property.match(line).hasMatch();
}

QString IcsRepair::normalizeLineEndings(const QString &icsData)
{
    QStringList ret;
    Q_FOREACH (const QString &line, lines(icsData)) {
        if (!line.trimmed().isEmpty()) {
            ret.append(line);
        }
    }
    return joinLines(ret);
}

QString IcsRepair::unfoldContinuationLines(const QString &icsData)
{
    QStringList ret;
    Q_FOREACH (const QString &line, lines(icsData)) {
        if (!ret.isEmpty() && (line.startsWith(QChar(' ')) || line.startsWith(QChar('\t')))) {
            ret.last().append(line.mid(1));
        } else {
            ret.append(line);
        }
    }
    return joinLines(ret);
}

QString IcsRepair::unfoldBrokenAttendeeLines(const QString &icsData)
{
    const QStringList input = lines(icsData);
    QStringList ret;
    for (int i = 0; i < input.size(); ++i) {
        QString line = input[i];
        if (isAttendeeLine(line)) {
            while (i + 1 < input.size()) {
                const QString &next = input[i + 1];
                if (next.trimmed().isEmpty()) {
                    break;
                }
                if (next.startsWith(QChar(' ')) || next.startsWith(QChar('\t'))) {
                    line += next.mid(1);
                } else if (attendeeIsIncomplete(line) || !looksLikePropertyLine(next)) {
                    // continuation emitted without the leading whitespace
                    line += next.trimmed();
                } else {
                    break;
                }
                ++i;
            }
        }
        ret.append(line);
    }
    return joinLines(ret);
}

QString IcsRepair::splitScheduleStatusFromRRule(const QString &icsData)
{
    QStringList ret;
    Q_FOREACH (const QString &line, lines(icsData)) {
        int idx = isRRuleLine(line) ? line.indexOf(QStringLiteral("SCHEDULE-STATUS"), 0, Qt::CaseInsensitive) : -1;
        if (idx < 0) {
            ret.append(line);
            continue;
        }
        QString rule = line.left(idx);
        while (rule.endsWith(QChar(';')) || rule.endsWith(QChar(':'))) {
            rule.chop(1);
        }
        if (rule.length() > 6) {
            ret.append(rule);
        }
        const QString leaked = line.mid(idx);
        if (leaked.contains(QStringLiteral("mailto:"), Qt::CaseInsensitive)) {
            // the leaked parameters belong to an attendee whose line got merged here
            ret.append(QStringLiteral("ATTENDEE;") + leaked);
        }
    }
    return joinLines(ret);
}

QString IcsRepair::fixDoubleMailto(const QString &icsData)
{
    static const QRegularExpression doubleMailto(QStringLiteral("mailto:(\\s*:)+"),
                                                 QRegularExpression::CaseInsensitiveOption);
    QString data = icsData;
    data.replace(doubleMailto, QStringLiteral("mailto:"));
    return joinLines(lines(data));
}

QString IcsRepair::extractParticipantsFromRRule(const QString &icsData)
{
    static const QRegularExpression participantStart(
            QStringLiteral("(;(CN|CUTYPE|ROLE|PARTSTAT|RSVP|SCHEDULE-STATUS|EMAIL|X-[A-Z-]+)=|ATTENDEE|mailto:)"),
            QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression address(QStringLiteral("mailto:([^\\s;:,]+)"),
                                            QRegularExpression::CaseInsensitiveOption);

    QStringList ret;
    Q_FOREACH (const QString &line, lines(icsData)) {
        if (!isRRuleLine(line)) {
            ret.append(line);
            continue;
        }
        const QString value = line.mid(6);
        QRegularExpressionMatch start = participantStart.match(value);
        if (!start.hasMatch()) {
            ret.append(line);
            continue;
        }

        QString rule = value.left(start.capturedStart());
        while (rule.endsWith(QChar(';')) || rule.endsWith(QChar(':'))) {
            rule.chop(1);
        }
        if (!rule.isEmpty()) {
            ret.append(QStringLiteral("RRULE:") + rule);
        }

        const QString tail = value.mid(start.capturedStart());
        int consumed = 0;
        QRegularExpressionMatchIterator it = address.globalMatch(tail);
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            const QString params = tail.mid(consumed, match.capturedStart() - consumed);
            ret.append(participantLine(params, match.captured(1)));
            consumed = match.capturedEnd();
        }
        LOG_DEBUG("Moved participant data out of RRULE:" << line);
    }
    return joinLines(ret);
}

QString IcsRepair::truncateRRuleParameters(const QString &icsData)
{
    QStringList ret;
    Q_FOREACH (const QString &line, lines(icsData)) {
        if (!isRRuleLine(line)) {
            ret.append(line);
            continue;
        }
        const QString rule = RRuleSanitizer::sanitize(line);
        if (!rule.isEmpty()) {
            ret.append(QStringLiteral("RRULE:") + rule);
        } else {
            LOG_WARNING("Dropping unrecoverable recurrence rule:" << line);
        }
    }
    return joinLines(ret);
}

QString IcsRepair::stripDanglingMailto(const QString &icsData)
{
    static const QRegularExpression bareMailto(QStringLiteral("^\\s*:?mailto:"),
                                               QRegularExpression::CaseInsensitiveOption);
    QStringList ret;
    Q_FOREACH (const QString &line, lines(icsData)) {
        if (bareMailto.match(line).hasMatch()) {
            continue;
        }
        if (isAttendeeLine(line) && attendeeIsIncomplete(line)) {
            continue;
        }
        ret.append(line);
    }
    return joinLines(ret);
}
