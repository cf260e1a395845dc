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

#include "davtypes.h"

QStringList CalDav::privilegeNames(Privileges privileges)
{
    QStringList set;
    if (privileges == ALL_PRIVILEGES) {
        set.append(QStringLiteral("all"));
        return set;
    }
    if (privileges & READ)
        set.append(QStringLiteral("read"));
    if (privileges & WRITE)
        set.append(QStringLiteral("write"));
    if (privileges & WRITE_PROPERTIES)
        set.append(QStringLiteral("write-properties"));
    if (privileges & WRITE_CONTENT)
        set.append(QStringLiteral("write-content"));
    if (privileges & UNLOCK)
        set.append(QStringLiteral("unlock"));
    if (privileges & READ_ACL)
        set.append(QStringLiteral("read-acl"));
    if (privileges & READ_CURRENT_USER_SET)
        set.append(QStringLiteral("read-current-user-privilege-set"));
    if (privileges & WRITE_ACL)
        set.append(QStringLiteral("write-acl"));
    if (privileges & BIND)
        set.append(QStringLiteral("bind"));
    if (privileges & UNBIND)
        set.append(QStringLiteral("unbind"));
    return set;
}

QString CalDav::Resource::typeName(Type type)
{
    switch (type) {
    case ServiceRoot:
        return QStringLiteral("ServiceRoot");
    case Principal:
        return QStringLiteral("Principal");
    case HomeSet:
        return QStringLiteral("HomeSet");
    case Collection:
        return QStringLiteral("Collection");
    case Object:
        return QStringLiteral("Object");
    default:
        return QStringLiteral("Unknown");
    }
}

QString CalDav::componentName(const KCalendarCore::IncidenceBase &incidence)
{
    switch (incidence.type()) {
    case KCalendarCore::IncidenceBase::TypeEvent:
        return QStringLiteral("VEVENT");
    case KCalendarCore::IncidenceBase::TypeTodo:
        return QStringLiteral("VTODO");
    case KCalendarCore::IncidenceBase::TypeJournal:
        return QStringLiteral("VJOURNAL");
    case KCalendarCore::IncidenceBase::TypeFreeBusy:
        return QStringLiteral("VFREEBUSY");
    default:
        return QString();
    }
}

QString CalDav::CalendarObject::uid() const
{
    return incidences.isEmpty() ? QString() : incidences.first()->uid();
}

QString CalDav::CalendarObject::componentName() const
{
    return incidences.isEmpty() ? QString() : CalDav::componentName(*incidences.first());
}
