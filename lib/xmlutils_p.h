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

#ifndef XMLUTILS_P_H
#define XMLUTILS_P_H

#include <QString>
#include <QList>
#include <QDomElement>

namespace CalDav {
namespace Xml {
    extern const QString DAV_NS;
    extern const QString CALDAV_NS;
    extern const QString CALENDARSERVER_NS;
    extern const QString GOOGLE_NS;
    extern const QString APPLE_NS;

    // Tag name without its namespace prefix, lower-cased.
    QString localName(const QDomElement &element);
    bool hasLocalName(const QDomElement &element, const QString &name);
    QDomElement firstChild(const QDomElement &parent, const QString &name);
    QList<QDomElement> children(const QDomElement &parent, const QString &name = QString());
}
}

#endif
