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

#ifndef PATHCODEC_H
#define PATHCODEC_H

#include <QString>

#include "caldavexport.h"
#include "davtypes.h"

namespace CalDav {

/* Maps request paths like /<prefix>/alice/cal/work/event.ics to
   typed resources, and back. */
class CALDAV_EXPORT PathCodec
{
public:
    explicit PathCodec(const QString &prefix = QString());

    QString prefix() const;

    bool parsePath(const QString &path, Resource *resource,
                   QString *errorMessage = nullptr) const;
    bool encodePath(const Resource &resource, QString *path,
                    QString *errorMessage = nullptr) const;

    // Convenience, returns an empty string on failure.
    QString href(const Resource &resource) const;

private:
    QString mPrefix;
};
}

#endif
