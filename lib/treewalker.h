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

#ifndef TREEWALKER_H
#define TREEWALKER_H

#include <QList>
#include <QString>

#include "caldavexport.h"
#include "davtypes.h"
#include "pathcodec.h"
#include "storage.h"
#include "cancellation.h"

namespace CalDav {

class CALDAV_EXPORT TreeWalker
{
public:
    enum Error {
        NoError,
        StorageError,
        PathError,
        Cancelled
    };

    // Deepest possible subtree, from a home set down to its objects.
    static const int INFINITE_DEPTH = 3;

    explicit TreeWalker(Storage *storage, const CancellationToken *token = nullptr);

    // Appends the descendants of parent, depth first, each resource
    // followed by its own subtree.
    bool fetchChildren(int depth, const Resource &parent, QList<Resource> *children);

    bool hasError() const;
    Error error() const;
    QString errorMessage() const;

private:
    bool expand(int depth, const Resource &parent, QList<Resource> *children);
    bool fail(Error error, const QString &message);

    Storage *mStorage;
    const CancellationToken *mToken;
    Error mError = NoError;
    QString mErrorMessage;
};
}

#endif
