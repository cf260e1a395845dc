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

#include "multistatus.h"
#include "xmlutils_p.h"
#include "logging_p.h"

#include <QSet>

using namespace CalDav;

namespace {
    const PropertyResult::Error GROUP_ORDER[] = {
        PropertyResult::NoError,
        PropertyResult::NotFound,
        PropertyResult::Forbidden,
        PropertyResult::Internal,
        PropertyResult::BadRequest
    };

    QDomElement appendElement(QDomDocument &document, QDomElement &parent,
                              const QString &name, const QString &text = QString())
    {
        QDomElement element = document.createElement(QStringLiteral("d:") + name);
        if (!text.isNull())
            element.appendChild(document.createTextNode(text));
        parent.appendChild(element);
        return element;
    }

    QDomElement appendResponse(QDomDocument &document, QDomElement &root, const QString &href)
    {
        QDomElement response = appendElement(document, root, QStringLiteral("response"));
        appendElement(document, response, QStringLiteral("href"), href);
        return response;
    }
}

QString MultistatusBuilder::statusLine(int statusCode)
{
    QString reason;
    switch (statusCode) {
    case 200:
        reason = QStringLiteral("OK");
        break;
    case 400:
        reason = QStringLiteral("Bad Request");
        break;
    case 403:
        reason = QStringLiteral("Forbidden");
        break;
    case 404:
        reason = QStringLiteral("Not Found");
        break;
    default:
        reason = QStringLiteral("Internal Server Error");
        break;
    }
    return QStringLiteral("HTTP/1.1 %1 %2").arg(statusCode).arg(reason);
}

QDomDocument MultistatusBuilder::createDocument(QDomElement *root)
{
    QDomDocument document;
    document.appendChild(document.createProcessingInstruction(QStringLiteral("xml"),
                                                              QStringLiteral("version=\"1.0\" encoding=\"UTF-8\"")));
    *root = document.createElement(QStringLiteral("d:multistatus"));
    const QList<QPair<QString, QString> > namespaces = PropertyCatalog::namespaces();
    for (const QPair<QString, QString> &ns : namespaces)
        root->setAttribute(QStringLiteral("xmlns:") + ns.first, ns.second);
    document.appendChild(*root);
    return document;
}

QDomDocument MultistatusBuilder::build(const QString &href, const PropertyMap &properties)
{
    QDomElement root;
    QDomDocument document = createDocument(&root);
    QDomElement response = appendResponse(document, root, href);

    for (PropertyResult::Error group : GROUP_ORDER) {
        QDomElement propstat;
        QDomElement prop;
        for (PropertyMap::const_iterator it = properties.constBegin(); it != properties.constEnd(); ++it) {
            const PropertyResult &result = it.value();
            const PropertyResult::Error error = result.isOk() ? PropertyResult::NoError : result.error();
            if (error != group)
                continue;
            if (propstat.isNull()) {
                propstat = appendElement(document, response, QStringLiteral("propstat"));
                prop = appendElement(document, propstat, QStringLiteral("prop"));
            }
            if (result.isOk())
                prop.appendChild(result.property()->toElement(document));
            else
                prop.appendChild(document.createElement(PropertyCatalog::qualifiedName(it.key())));
        }
        if (!propstat.isNull()) {
            appendElement(document, propstat, QStringLiteral("status"),
                          statusLine(PropertyResult::httpStatus(group)));
        }
    }
    return document;
}

QDomDocument MultistatusBuilder::buildStatus(const QString &href, int statusCode)
{
    QDomElement root;
    QDomDocument document = createDocument(&root);
    QDomElement response = appendResponse(document, root, href);
    appendElement(document, response, QStringLiteral("status"), statusLine(statusCode));
    return document;
}

QDomDocument MultistatusBuilder::buildNames(const QString &href, const QStringList &names)
{
    QDomElement root;
    QDomDocument document = createDocument(&root);
    QDomElement response = appendResponse(document, root, href);
    QDomElement propstat = appendElement(document, response, QStringLiteral("propstat"));
    QDomElement prop = appendElement(document, propstat, QStringLiteral("prop"));
    for (const QString &name : names)
        prop.appendChild(document.createElement(PropertyCatalog::qualifiedName(name)));
    appendElement(document, propstat, QStringLiteral("status"), statusLine(200));
    return document;
}

QDomDocument MultistatusBuilder::buildEmpty()
{
    QDomElement root;
    return createDocument(&root);
}

bool MultistatusMerger::merge(const QList<QDomDocument> &documents, QDomDocument *merged,
                              QString *errorMessage)
{
    if (documents.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("no documents to merge");
        return false;
    }
    if (documents.count() == 1) {
        *merged = documents.first();
        return true;
    }

    QDomDocument result;
    result.appendChild(result.createProcessingInstruction(QStringLiteral("xml"),
                                                          QStringLiteral("version=\"1.0\" encoding=\"UTF-8\"")));
    QDomElement root;
    QSet<QString> declared;
    int responses = 0;

    for (const QDomDocument &document : documents) {
        if (document.isNull())
            continue;
        const QDomElement source = document.documentElement();
        if (source.isNull())
            continue;
        if (root.isNull()) {
            root = result.createElement(source.tagName());
            result.appendChild(root);
        }

        const QDomNamedNodeMap attributes = source.attributes();
        for (int i = 0; i < attributes.count(); ++i) {
            const QDomAttr attribute = attributes.item(i).toAttr();
            if (!attribute.name().startsWith(QStringLiteral("xmlns")) || declared.contains(attribute.name()))
                continue;
            declared.insert(attribute.name());
            root.setAttribute(attribute.name(), attribute.value());
        }

        for (const QDomElement &response : Xml::children(source, QStringLiteral("response"))) {
            root.appendChild(result.importNode(response, true));
            ++responses;
        }
    }

    if (root.isNull())
        root = result.appendChild(result.createElement(QStringLiteral("d:multistatus"))).toElement();
    qCDebug(lcCalDav) << "Merged" << responses << "responses from" << documents.count() << "documents";
    *merged = result;
    return true;
}
