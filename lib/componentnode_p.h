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

#ifndef COMPONENTNODE_P_H
#define COMPONENTNODE_P_H

#include <QString>
#include <QList>
#include <QHash>
#include <QDateTime>

#include <KCalendarCore/Incidence>
#include <KCalendarCore/Alarm>

#include "davtypes.h"
#include "filter.h"

namespace CalDav {

struct PropertyInstance {
    QString value;
    // Parameter names are upper-cased.
    QHash<QString, QString> parameters;
};

/* Read-only view of a calendar object as the RFC 5545 component tree:
   a VCALENDAR holding incidences, themselves holding VALARMs. */
class ComponentNode
{
public:
    static ComponentNode calendar(const CalendarObject &object);

    QString name() const;
    QList<ComponentNode> children() const;
    QList<PropertyInstance> properties(const QString &name) const;
    bool overlaps(const TimeRange &range) const;

private:
    enum Kind {
        CalendarKind,
        IncidenceKind,
        AlarmKind
    };

    ComponentNode(Kind kind) : mKind(kind) {}

    QList<PropertyInstance> incidenceProperties(const QString &name) const;
    QList<PropertyInstance> alarmProperties(const QString &name) const;
    bool incidenceOverlaps(const TimeRange &range) const;
    bool alarmOverlaps(const TimeRange &range) const;

    Kind mKind;
    KCalendarCore::Incidence::List mIncidences;
    KCalendarCore::Incidence::Ptr mIncidence;
    // Recurrence ids of the overrides of a recurring master, in UTC.
    QList<QDateTime> mOverridden;
    KCalendarCore::Alarm::Ptr mAlarm;
};
}

#endif
