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

#ifndef INCIDENCEHANDLER_H
#define INCIDENCEHANDLER_H

#include <QString>

#include <KCalendarCore/Incidence>

#include "caldavexport.h"

namespace CalDav {

class CALDAV_EXPORT IncidenceHandler
{
public:
    // Serializes one calendar object resource, the master incidence
    // followed by its exceptions, as a VCALENDAR.
    static QString toIcs(const KCalendarCore::Incidence::List &incidences);

    // Parses a calendar object resource. All incidences must share
    // the same UID, and at least one must be present.
    static bool fromIcs(const QString &data, KCalendarCore::Incidence::List *incidences,
                        QString *errorMessage = nullptr);

private:
    IncidenceHandler();
    ~IncidenceHandler();
};
}

#endif
