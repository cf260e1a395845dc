/*
 * This file is part of caldavserver package
 *
 * Copyright (C) 2025 caldavserver contributors
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
 */

#include "incidencehandler.h"
#include "logging_p.h"

#include <KCalendarCore/MemoryCalendar>
#include <KCalendarCore/ICalFormat>

using namespace CalDav;

namespace {
    void setError(QString *errorMessage, const QString &message)
    {
        if (errorMessage)
            *errorMessage = message;
    }
}

QString IncidenceHandler::toIcs(const KCalendarCore::Incidence::List &incidences)
{
    KCalendarCore::MemoryCalendar::Ptr memoryCalendar(new KCalendarCore::MemoryCalendar(QTimeZone::utc()));
    for (const KCalendarCore::Incidence::Ptr &incidence : incidences) {
        // The calendar takes ownership of what it stores, keep the
        // caller's copy untouched.
        KCalendarCore::Incidence::Ptr copy(incidence->clone());
        if (!memoryCalendar->addIncidence(copy)) {
            qCWarning(lcCalDav) << "Unable to add incidence to in-memory calendar for export:"
                                << incidence->uid() << incidence->recurrenceId().toString();
            return QString();
        }
    }

    KCalendarCore::ICalFormat icalFormat;
    return icalFormat.toString(memoryCalendar, QString(), false);
}

bool IncidenceHandler::fromIcs(const QString &data, KCalendarCore::Incidence::List *incidences,
                               QString *errorMessage)
{
    KCalendarCore::MemoryCalendar::Ptr memoryCalendar(new KCalendarCore::MemoryCalendar(QTimeZone::utc()));
    KCalendarCore::ICalFormat icalFormat;
    if (!icalFormat.fromString(memoryCalendar, data)) {
        setError(errorMessage, QStringLiteral("cannot parse iCalendar data"));
        return false;
    }

    KCalendarCore::Incidence::List parsed = memoryCalendar->incidences();
    if (parsed.isEmpty()) {
        setError(errorMessage, QStringLiteral("no calendar component in iCalendar data"));
        return false;
    }

    // Keep the master first, the exceptions after it.
    KCalendarCore::Incidence::List sorted;
    const QString uid = parsed.first()->uid();
    for (const KCalendarCore::Incidence::Ptr &incidence : parsed) {
        if (incidence->uid() != uid) {
            setError(errorMessage, QStringLiteral("calendar object resources must hold a single UID"));
            return false;
        }
        if (incidence->hasRecurrenceId())
            sorted.append(incidence);
        else
            sorted.prepend(incidence);
    }

    qCDebug(lcCalDav) << "Parsed" << sorted.count() << "incidences for UID" << uid;
    if (incidences)
        *incidences = sorted;
    return true;
}
