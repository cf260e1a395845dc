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

#ifndef MULTISTATUS_H
#define MULTISTATUS_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QDomDocument>

#include "caldavexport.h"
#include "properties.h"

namespace CalDav {

/* Renders the outcome of one resource as a <d:multistatus> document
   holding a single <d:response>. */
class CALDAV_EXPORT MultistatusBuilder
{
public:
    static QDomDocument build(const QString &href, const PropertyMap &properties);
    static QDomDocument buildStatus(const QString &href, int statusCode);
    static QDomDocument buildNames(const QString &href, const QStringList &names);
    // A <d:multistatus> without any response.
    static QDomDocument buildEmpty();

    static QString statusLine(int statusCode);

private:
    static QDomDocument createDocument(QDomElement *root);
};

class CALDAV_EXPORT MultistatusMerger
{
public:
    static bool merge(const QList<QDomDocument> &documents, QDomDocument *merged,
                      QString *errorMessage = nullptr);
};
}

#endif
