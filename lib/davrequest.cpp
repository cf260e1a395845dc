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

#include "davrequest.h"
#include "xmlutils_p.h"
#include "logging_p.h"

#include <QDomDocument>

using namespace CalDav;

namespace {
    bool parseDocument(const QByteArray &data, QDomDocument *document, QString *errorMessage)
    {
        QString parseError;
        int line = 0;
        int column = 0;
        if (!document->setContent(data, false, &parseError, &line, &column)) {
            if (errorMessage)
                *errorMessage = QStringLiteral("malformed XML body at %1:%2: %3")
                    .arg(line).arg(column).arg(parseError);
            return false;
        }
        return true;
    }

    void setError(QString *errorMessage, const QString &message)
    {
        if (errorMessage)
            *errorMessage = message;
    }
}

QStringList PropertyRequest::allPropNames()
{
    return QStringList()
        << QStringLiteral("displayname")
        << QStringLiteral("resourcetype")
        << QStringLiteral("getcontenttype")
        << QStringLiteral("getetag")
        << QStringLiteral("getlastmodified")
        << QStringLiteral("current-user-principal");
}

PropertyMap PropertyRequest::emptyMap() const
{
    PropertyMap map;
    const QStringList requested = kind == AllProp ? (allPropNames() + names) : names;
    for (const QString &name : requested)
        map.insert(name, PropertyResult());
    return map;
}

PropertyRequest PropertyRequest::fromElement(const QDomElement &element)
{
    PropertyRequest request;
    if (!Xml::firstChild(element, QStringLiteral("propname")).isNull()) {
        request.kind = PropName;
        return request;
    }

    QDomElement prop = Xml::firstChild(element, QStringLiteral("prop"));
    if (!Xml::firstChild(element, QStringLiteral("allprop")).isNull()) {
        request.kind = AllProp;
        prop = Xml::firstChild(element, QStringLiteral("include"));
    } else if (!prop.isNull()) {
        request.kind = Prop;
    }

    for (const QDomElement &child : Xml::children(prop)) {
        const QString name = Xml::localName(child);
        if (!PropertyCatalog::contains(name)) {
            qCDebug(lcCalDav) << "Skipping unknown property" << child.tagName();
            continue;
        }
        if (!request.names.contains(name))
            request.names.append(name);
    }
    return request;
}

bool PropertyRequest::fromData(const QByteArray &data, PropertyRequest *request, QString *errorMessage)
{
    if (data.trimmed().isEmpty()) {
        *request = PropertyRequest();
        return true;
    }
    QDomDocument document;
    if (!parseDocument(data, &document, errorMessage))
        return false;
    const QDomElement root = document.documentElement();
    if (!Xml::hasLocalName(root, QStringLiteral("propfind"))) {
        setError(errorMessage, QStringLiteral("expected a propfind element, got %1").arg(root.tagName()));
        return false;
    }
    *request = fromElement(root);
    return true;
}

bool ReportRequest::fromData(const QByteArray &data, ReportRequest *request, QString *errorMessage)
{
    QDomDocument document;
    if (!parseDocument(data, &document, errorMessage))
        return false;

    const QDomElement root = document.documentElement();
    ReportRequest report;
    report.name = Xml::localName(root);
    report.properties = PropertyRequest::fromElement(root);
    if (report.name == QStringLiteral("calendar-query")) {
        report.kind = CalendarQuery;
        report.filter = Filter::fromQuery(root);
    } else if (report.name == QStringLiteral("calendar-multiget")) {
        report.kind = CalendarMultiget;
        for (const QDomElement &href : Xml::children(root, QStringLiteral("href"))) {
            // Kept encoded, segments are decoded once when the path is parsed.
            const QString path = href.text().trimmed();
            if (!path.isEmpty())
                report.hrefs.append(path);
        }
    } else {
        report.kind = Unsupported;
    }

    *request = report;
    return true;
}

bool MkCalendarRequest::fromData(const QByteArray &data, MkCalendarRequest *request, QString *errorMessage)
{
    MkCalendarRequest mk;
    if (data.trimmed().isEmpty()) {
        *request = mk;
        return true;
    }

    QDomDocument document;
    if (!parseDocument(data, &document, errorMessage))
        return false;
    const QDomElement root = document.documentElement();
    if (!Xml::hasLocalName(root, QStringLiteral("mkcalendar"))
        && !Xml::hasLocalName(root, QStringLiteral("mkcol"))) {
        setError(errorMessage, QStringLiteral("invalid MKCALENDAR request: missing mkcalendar element"));
        return false;
    }

    const QDomElement prop = Xml::firstChild(Xml::firstChild(root, QStringLiteral("set")),
                                             QStringLiteral("prop"));
    for (const QDomElement &child : Xml::children(prop)) {
        const QString name = Xml::localName(child);
        if (name == QStringLiteral("displayname")) {
            mk.calendar.displayName = child.text();
        } else if (name == QStringLiteral("calendar-description")) {
            mk.calendar.description = child.text();
        } else if (name == QStringLiteral("calendar-timezone") || name == QStringLiteral("timezone")) {
            mk.calendar.timezone = child.text();
        } else if (name == QStringLiteral("calendar-color") || name == QStringLiteral("color")) {
            mk.calendar.color = child.text().trimmed();
        } else if (name == QStringLiteral("supported-calendar-component-set")) {
            QStringList components;
            for (const QDomElement &comp : Xml::children(child, QStringLiteral("comp"))) {
                const QString component = comp.attribute(QStringLiteral("name")).toUpper();
                if (!component.isEmpty())
                    components.append(component);
            }
            if (!components.isEmpty())
                mk.calendar.supportedComponents = components;
        } else {
            qCDebug(lcCalDav) << "Ignoring MKCALENDAR property" << child.tagName();
        }
    }

    *request = mk;
    return true;
}
