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

#include "storage.h"

QString CalDav::Storage::statusMessage(Status status)
{
    switch (status) {
    case NoError:
        return QString();
    case NotFound:
        return QStringLiteral("resource not found");
    case InvalidInput:
        return QStringLiteral("invalid input parameters");
    case PermissionDenied:
        return QStringLiteral("permission denied");
    case Conflict:
        return QStringLiteral("resource conflict");
    default:
        return QStringLiteral("storage unavailable");
    }
}
