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

#include "xmlutils_p.h"

const QString CalDav::Xml::DAV_NS = QStringLiteral("DAV:");
const QString CalDav::Xml::CALDAV_NS = QStringLiteral("urn:ietf:params:xml:ns:caldav");
const QString CalDav::Xml::CALENDARSERVER_NS = QStringLiteral("http://calendarserver.org/ns/");
const QString CalDav::Xml::GOOGLE_NS = QStringLiteral("http://schemas.google.com/gCal/2005");
const QString CalDav::Xml::APPLE_NS = QStringLiteral("http://apple.com/ns/ical/");

QString CalDav::Xml::localName(const QDomElement &element)
{
    const QString tag = element.tagName();
    const int colon = tag.lastIndexOf(QLatin1Char(':'));
    return (colon >= 0 ? tag.mid(colon + 1) : tag).toLower();
}

bool CalDav::Xml::hasLocalName(const QDomElement &element, const QString &name)
{
    return localName(element) == name.toLower();
}

QDomElement CalDav::Xml::firstChild(const QDomElement &parent, const QString &name)
{
    for (QDomElement child = parent.firstChildElement();
         !child.isNull(); child = child.nextSiblingElement()) {
        if (hasLocalName(child, name))
            return child;
    }
    return QDomElement();
}

QList<QDomElement> CalDav::Xml::children(const QDomElement &parent, const QString &name)
{
    QList<QDomElement> result;
    for (QDomElement child = parent.firstChildElement();
         !child.isNull(); child = child.nextSiblingElement()) {
        if (name.isEmpty() || hasLocalName(child, name))
            result.append(child);
    }
    return result;
}
