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

#ifndef DAVREQUEST_H
#define DAVREQUEST_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QDomElement>

#include "caldavexport.h"
#include "davtypes.h"
#include "filter.h"
#include "properties.h"

namespace CalDav {

// Which properties a PROPFIND or REPORT asks for.
struct CALDAV_EXPORT PropertyRequest {
    enum Kind {
        AllProp,
        PropName,
        Prop
    };

    Kind kind = AllProp;
    // Lower-cased catalog names, unknown names are dropped.
    QStringList names;

    PropertyMap emptyMap() const;

    // Reads <prop>, <allprop> and <propname> children of element.
    static PropertyRequest fromElement(const QDomElement &element);
    // An empty body is an allprop request.
    static bool fromData(const QByteArray &data, PropertyRequest *request,
                         QString *errorMessage = nullptr);

    static QStringList allPropNames();
};

struct CALDAV_EXPORT ReportRequest {
    enum Kind {
        Unsupported,
        CalendarQuery,
        CalendarMultiget
    };

    Kind kind = Unsupported;
    QString name;
    PropertyRequest properties;
    // calendar-query only.
    Filter filter;
    // calendar-multiget only.
    QStringList hrefs;

    static bool fromData(const QByteArray &data, ReportRequest *request,
                         QString *errorMessage = nullptr);
};

// Body of MKCALENDAR, or of an extended MKCOL.
struct CALDAV_EXPORT MkCalendarRequest {
    Calendar calendar;

    static bool fromData(const QByteArray &data, MkCalendarRequest *request,
                         QString *errorMessage = nullptr);
};
}

#endif
