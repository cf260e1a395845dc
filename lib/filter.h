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

#ifndef FILTER_H
#define FILTER_H

#include <QString>
#include <QList>
#include <QDateTime>
#include <QDomElement>

#include "caldavexport.h"

namespace CalDav {

struct CALDAV_EXPORT TextMatch {
    QString collation = QStringLiteral("i;unicode-casemap");
    QString matchType = QStringLiteral("contains");
    bool negate = false;
    QString value;

    bool matches(const QString &text) const;
};

// Invalid boundaries are unbounded.
struct CALDAV_EXPORT TimeRange {
    QDateTime start;
    QDateTime end;

    bool overlaps(const QDateTime &from, const QDateTime &to) const;
    bool contains(const QDateTime &at) const;
};

struct CALDAV_EXPORT ParamFilter {
    QString name;
    bool isNotDefined = false;
    bool hasTextMatch = false;
    TextMatch textMatch;
};

struct CALDAV_EXPORT PropFilter {
    QString name;
    QString test = QStringLiteral("anyof");
    bool isNotDefined = false;
    bool hasTextMatch = false;
    TextMatch textMatch;
    QList<ParamFilter> paramFilters;
};

// A comp-filter node. A default constructed filter is null
// and matches everything.
struct CALDAV_EXPORT Filter {
    QString component;
    QString test = QStringLiteral("anyof");
    bool isNotDefined = false;
    bool hasTimeRange = false;
    TimeRange timeRange;
    QList<PropFilter> propFilters;
    QList<Filter> children;

    bool isNull() const { return component.isEmpty(); }
    bool isAllOf() const { return test.compare(QStringLiteral("allof"), Qt::CaseInsensitive) == 0; }

    // Reads the <filter> child of a calendar-query element.
    static Filter fromQuery(const QDomElement &query);
    // Reads the <filter> element itself.
    static Filter fromElement(const QDomElement &filter);
    static bool fromData(const QByteArray &data, Filter *filter,
                         QString *errorMessage = nullptr);

    // YYYYMMDDThhmmssZ, an invalid QDateTime on error.
    static QDateTime parseTimestamp(const QString &value);
    static QString formatTimestamp(const QDateTime &value);
};
}

#endif
