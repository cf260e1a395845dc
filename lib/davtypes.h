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

#ifndef DAVTYPES_H
#define DAVTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QFlags>

#include <KCalendarCore/Incidence>

#include "caldavexport.h"

namespace CalDav {
enum Privilege {
    NO_PRIVILEGE = 0,
    READ = 1,
    WRITE = 2,
    WRITE_PROPERTIES = 4,
    WRITE_CONTENT = 8,
    UNLOCK = 16,
    READ_ACL = 32,
    READ_CURRENT_USER_SET = 64,
    WRITE_ACL = 128,
    BIND = 256,
    UNBIND = 512,
    ALL_PRIVILEGES = 1023
};
Q_DECLARE_FLAGS(Privileges, Privilege)
Q_DECLARE_OPERATORS_FOR_FLAGS(Privileges)

CALDAV_EXPORT QStringList privilegeNames(Privileges privileges);

struct CALDAV_EXPORT Resource {
    enum Type {
        Unknown,
        ServiceRoot,
        Principal,
        HomeSet,
        Collection,
        Object
    };

    QString userId;
    QString calendarId;
    QString objectId;
    Type type = Unknown;
    // Path this resource was parsed from, if any.
    QString uri;

    Resource() {}
    Resource(Type type, const QString &user = QString(),
             const QString &calendar = QString(),
             const QString &object = QString())
        : userId(user), calendarId(calendar), objectId(object), type(type) {}

    // Identity comparison, the cached uri is not part of it.
    bool operator==(const Resource &other) const
    {
        return type == other.type
            && userId == other.userId
            && calendarId == other.calendarId
            && objectId == other.objectId;
    }
    bool operator!=(const Resource &other) const
    {
        return !(*this == other);
    }

    static QString typeName(Type type);
};

struct CALDAV_EXPORT User {
    QString id;
    QString displayName;
    // used for calendar-user-address-set
    QString userAddress;
    // #RRGGBB
    QString preferredColor;
    // IANA name, like Europe/Paris
    QString preferredTimezone;
};

struct CALDAV_EXPORT Calendar {
    QString id;
    QString path;
    QString ctag;
    QString etag;
    QString displayName;
    QString description;
    QString color;
    QString timezone;
    QDateTime lastModified;
    QStringList supportedComponents = QStringList() << QStringLiteral("VEVENT");
    bool readOnly = false;

    bool supports(const QString &component) const
    {
        return supportedComponents.contains(component, Qt::CaseInsensitive);
    }
};

struct CALDAV_EXPORT CalendarObject {
    QString id;
    QString path;
    QString etag;
    QDateTime lastModified;
    // The master incidence and its exceptions, sharing one UID.
    KCalendarCore::Incidence::List incidences;

    QString uid() const;
    // VEVENT, VTODO, VJOURNAL or VFREEBUSY of the first incidence.
    QString componentName() const;
};

CALDAV_EXPORT QString componentName(const KCalendarCore::IncidenceBase &incidence);
}

#endif
