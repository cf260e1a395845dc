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

#include "filter.h"
#include "xmlutils_p.h"
#include "logging_p.h"

#include <QDomDocument>

using namespace CalDav;

namespace {
    const QString TIMESTAMP_FORMAT = QStringLiteral("yyyyMMdd'T'HHmmss'Z'");

    TextMatch parseTextMatch(const QDomElement &element)
    {
        TextMatch match;
        if (element.hasAttribute(QStringLiteral("collation")))
            match.collation = element.attribute(QStringLiteral("collation"));
        if (element.hasAttribute(QStringLiteral("match-type")))
            match.matchType = element.attribute(QStringLiteral("match-type"));
        match.negate = element.attribute(QStringLiteral("negate-condition"), QStringLiteral("no")) == QStringLiteral("yes");
        match.value = element.text();
        return match;
    }

    TimeRange parseTimeRange(const QDomElement &element)
    {
        TimeRange range;
        // Malformed values leave the boundary open.
        range.start = Filter::parseTimestamp(element.attribute(QStringLiteral("start")));
        range.end = Filter::parseTimestamp(element.attribute(QStringLiteral("end")));
        return range;
    }

    ParamFilter parseParamFilter(const QDomElement &element)
    {
        ParamFilter filter;
        filter.name = element.attribute(QStringLiteral("name"));
        if (!Xml::firstChild(element, QStringLiteral("is-not-defined")).isNull()) {
            filter.isNotDefined = true;
            return filter;
        }
        const QDomElement textMatch = Xml::firstChild(element, QStringLiteral("text-match"));
        if (!textMatch.isNull()) {
            filter.hasTextMatch = true;
            filter.textMatch = parseTextMatch(textMatch);
        }
        return filter;
    }

    PropFilter parsePropFilter(const QDomElement &element)
    {
        PropFilter filter;
        filter.name = element.attribute(QStringLiteral("name"));
        filter.test = element.attribute(QStringLiteral("test"), QStringLiteral("anyof"));
        if (!Xml::firstChild(element, QStringLiteral("is-not-defined")).isNull()) {
            filter.isNotDefined = true;
            return filter;
        }
        const QDomElement textMatch = Xml::firstChild(element, QStringLiteral("text-match"));
        if (!textMatch.isNull()) {
            filter.hasTextMatch = true;
            filter.textMatch = parseTextMatch(textMatch);
        }
        for (const QDomElement &param : Xml::children(element, QStringLiteral("param-filter"))) {
            filter.paramFilters.append(parseParamFilter(param));
        }
        return filter;
    }

    Filter parseCompFilter(const QDomElement &element)
    {
        Filter filter;
        filter.component = element.attribute(QStringLiteral("name"));
        filter.test = element.attribute(QStringLiteral("test"), QStringLiteral("anyof"));
        if (!Xml::firstChild(element, QStringLiteral("is-not-defined")).isNull()) {
            filter.isNotDefined = true;
            return filter;
        }
        const QDomElement timeRange = Xml::firstChild(element, QStringLiteral("time-range"));
        if (!timeRange.isNull()) {
            filter.hasTimeRange = true;
            filter.timeRange = parseTimeRange(timeRange);
        }
        for (const QDomElement &prop : Xml::children(element, QStringLiteral("prop-filter"))) {
            filter.propFilters.append(parsePropFilter(prop));
        }
        for (const QDomElement &comp : Xml::children(element, QStringLiteral("comp-filter"))) {
            filter.children.append(parseCompFilter(comp));
        }
        return filter;
    }
}

bool TextMatch::matches(const QString &text) const
{
    const Qt::CaseSensitivity cs =
        collation.compare(QStringLiteral("i;octet"), Qt::CaseInsensitive) == 0
        ? Qt::CaseSensitive : Qt::CaseInsensitive;

    bool found;
    if (matchType == QStringLiteral("equals")) {
        found = text.compare(value, cs) == 0;
    } else if (matchType == QStringLiteral("starts-with")) {
        found = text.startsWith(value, cs);
    } else if (matchType == QStringLiteral("ends-with")) {
        found = text.endsWith(value, cs);
    } else {
        found = text.contains(value, cs);
    }
    return found != negate;
}

bool TimeRange::overlaps(const QDateTime &from, const QDateTime &to) const
{
    return (!end.isValid() || from < end)
        && (!start.isValid() || to > start);
}

bool TimeRange::contains(const QDateTime &at) const
{
    return (!start.isValid() || at >= start)
        && (!end.isValid() || at < end);
}

QDateTime Filter::parseTimestamp(const QString &value)
{
    if (value.isEmpty())
        return QDateTime();
    QDateTime stamp = QDateTime::fromString(value, TIMESTAMP_FORMAT);
    if (!stamp.isValid()) {
        qCDebug(lcCalDav) << "Ignoring malformed time-range boundary" << value;
        return QDateTime();
    }
    stamp.setTimeSpec(Qt::UTC);
    return stamp;
}

QString Filter::formatTimestamp(const QDateTime &value)
{
    return value.toUTC().toString(TIMESTAMP_FORMAT);
}

Filter Filter::fromElement(const QDomElement &filter)
{
    if (filter.isNull())
        return Filter();
    const QDomElement root = Xml::firstChild(filter, QStringLiteral("comp-filter"));
    if (root.isNull())
        return Filter();
    return parseCompFilter(root);
}

Filter Filter::fromQuery(const QDomElement &query)
{
    return fromElement(Xml::firstChild(query, QStringLiteral("filter")));
}

bool Filter::fromData(const QByteArray &data, Filter *filter, QString *errorMessage)
{
    QDomDocument doc;
    QString parseError;
    int line = 0;
    if (!doc.setContent(data, false, &parseError, &line)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("malformed filter body, line %1: %2").arg(line).arg(parseError);
        return false;
    }
    const QDomElement root = doc.documentElement();
    const Filter parsed = Xml::hasLocalName(root, QStringLiteral("filter"))
        ? fromElement(root) : fromQuery(root);
    if (filter)
        *filter = parsed;
    return true;
}
