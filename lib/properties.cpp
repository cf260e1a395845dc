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

#include "properties.h"
#include "filter.h"
#include "xmlutils_p.h"

#include <QHash>
#include <QLocale>

using namespace CalDav;

namespace {
    struct CatalogEntry {
        const char *name;
        const char *prefix;
    };

    const CatalogEntry PROPERTIES[] = {
        // WebDAV
        {"displayname", "d"},
        {"resourcetype", "d"},
        {"getetag", "d"},
        {"getlastmodified", "d"},
        {"getcontenttype", "d"},
        {"owner", "d"},
        {"current-user-principal", "d"},
        {"principal-url", "d"},
        {"supported-report-set", "d"},
        {"acl", "d"},
        {"current-user-privilege-set", "d"},
        {"quota-available-bytes", "d"},
        {"quota-used-bytes", "d"},
        // CalDAV
        {"calendar-description", "cal"},
        {"calendar-timezone", "cal"},
        {"calendar-data", "cal"},
        {"supported-calendar-component-set", "cal"},
        {"supported-calendar-data", "cal"},
        {"max-resource-size", "cal"},
        {"min-date-time", "cal"},
        {"max-date-time", "cal"},
        {"max-instances", "cal"},
        {"max-attendees-per-instance", "cal"},
        {"calendar-home-set", "cal"},
        {"schedule-inbox-url", "cal"},
        {"schedule-outbox-url", "cal"},
        {"schedule-default-calendar-url", "cal"},
        {"calendar-user-address-set", "cal"},
        {"calendar-user-type", "cal"},
        // CalendarServer and Apple
        {"getctag", "cs"},
        {"calendar-changes", "cs"},
        {"shared-url", "cs"},
        {"invite", "cs"},
        {"notification-url", "cs"},
        {"auto-schedule", "cs"},
        {"calendar-proxy-read-for", "cs"},
        {"calendar-proxy-write-for", "cs"},
        {"calendar-color", "ical"},
        // Google
        {"color", "g"},
        {"timezone", "g"},
        {"hidden", "g"},
        {"selected", "g"},
    };

    const CatalogEntry CHILD_ELEMENTS[] = {
        {"collection", "d"},
        {"principal", "d"},
        {"href", "d"},
        {"ace", "d"},
        {"grant", "d"},
        {"deny", "d"},
        {"privilege", "d"},
        {"supported-report", "d"},
        {"report", "d"},
        {"calendar", "cal"},
        {"comp", "cal"},
        {"calendar-query", "cal"},
        {"calendar-multiget", "cal"},
        {"free-busy-query", "cal"},
    };

    template <size_t N>
    QHash<QString, QString> buildTable(const CatalogEntry (&entries)[N])
    {
        QHash<QString, QString> table;
        for (const CatalogEntry &entry : entries)
            table.insert(QString::fromLatin1(entry.name), QString::fromLatin1(entry.prefix));
        return table;
    }

    const QHash<QString, QString> &propertyPrefixes()
    {
        static const QHash<QString, QString> prefixes = buildTable(PROPERTIES);
        return prefixes;
    }

    const QHash<QString, QString> &childPrefixes()
    {
        static const QHash<QString, QString> prefixes = buildTable(CHILD_ELEMENTS);
        return prefixes;
    }

    QDomElement appendChild(QDomDocument &document, QDomElement &parent, const QString &name,
                            const QString &text = QString())
    {
        QDomElement child = document.createElement(PropertyCatalog::qualifiedName(name));
        if (!text.isNull())
            child.appendChild(document.createTextNode(text));
        parent.appendChild(child);
        return child;
    }

    void appendPrivileges(QDomDocument &document, QDomElement &parent, const QStringList &privileges)
    {
        for (const QString &privilege : privileges) {
            QDomElement element = appendChild(document, parent, QStringLiteral("privilege"));
            appendChild(document, element, privilege);
        }
    }
}

Property::Property(const QString &name)
    : mName(name)
{
}

Property::~Property()
{
}

QString Property::name() const
{
    return mName;
}

QDomElement Property::toElement(QDomDocument &document) const
{
    QDomElement element = document.createElement(PropertyCatalog::qualifiedName(mName));
    fill(document, element);
    return element;
}

TextProperty::TextProperty(const QString &name, const QString &value)
    : Property(name), mValue(value)
{
}

QString TextProperty::value() const
{
    return mValue;
}

void TextProperty::fill(QDomDocument &document, QDomElement &element) const
{
    element.appendChild(document.createTextNode(mValue));
}

HrefProperty::HrefProperty(const QString &name, const QString &href)
    : Property(name), mHref(href)
{
}

QString HrefProperty::href() const
{
    return mHref;
}

void HrefProperty::fill(QDomDocument &document, QDomElement &element) const
{
    appendChild(document, element, QStringLiteral("href"), mHref);
}

HrefListProperty::HrefListProperty(const QString &name, const QStringList &hrefs)
    : Property(name), mHrefs(hrefs)
{
}

QStringList HrefListProperty::hrefs() const
{
    return mHrefs;
}

void HrefListProperty::fill(QDomDocument &document, QDomElement &element) const
{
    for (const QString &href : mHrefs)
        appendChild(document, element, QStringLiteral("href"), href);
}

IntegerProperty::IntegerProperty(const QString &name, qint64 value)
    : Property(name), mValue(value)
{
}

qint64 IntegerProperty::value() const
{
    return mValue;
}

void IntegerProperty::fill(QDomDocument &document, QDomElement &element) const
{
    element.appendChild(document.createTextNode(QString::number(mValue)));
}

BooleanProperty::BooleanProperty(const QString &name, bool value)
    : Property(name), mValue(value)
{
}

bool BooleanProperty::value() const
{
    return mValue;
}

void BooleanProperty::fill(QDomDocument &document, QDomElement &element) const
{
    element.appendChild(document.createTextNode(mValue ? QStringLiteral("true") : QStringLiteral("false")));
}

DateTimeProperty::DateTimeProperty(const QString &name, const QDateTime &value, Format format)
    : Property(name), mValue(value), mFormat(format)
{
}

QDateTime DateTimeProperty::value() const
{
    return mValue;
}

QString DateTimeProperty::toHttpDate(const QDateTime &value)
{
    return QLocale::c().toString(value.toUTC(), QStringLiteral("ddd, dd MMM yyyy HH:mm:ss 'GMT'"));
}

void DateTimeProperty::fill(QDomDocument &document, QDomElement &element) const
{
    const QString text = mFormat == HttpDate ? toHttpDate(mValue) : Filter::formatTimestamp(mValue);
    element.appendChild(document.createTextNode(text));
}

ResourceTypeProperty::ResourceTypeProperty(Kind kind, const QString &objectType)
    : Property(QStringLiteral("resourcetype")), mKind(kind), mObjectType(objectType)
{
}

ResourceTypeProperty::Kind ResourceTypeProperty::kind() const
{
    return mKind;
}

void ResourceTypeProperty::fill(QDomDocument &document, QDomElement &element) const
{
    switch (mKind) {
    case Principal:
        appendChild(document, element, QStringLiteral("principal"));
        break;
    case HomeSet:
        appendChild(document, element, QStringLiteral("collection"));
        appendChild(document, element, QStringLiteral("calendar-home-set"));
        break;
    case Calendar:
        appendChild(document, element, QStringLiteral("collection"));
        appendChild(document, element, QStringLiteral("calendar"));
        break;
    case CalendarObject:
        if (!mObjectType.isEmpty()) {
            QDomElement type = document.createElement(QStringLiteral("d:") + mObjectType.toLower());
            element.appendChild(type);
        }
        break;
    case Plain:
        appendChild(document, element, QStringLiteral("collection"));
        break;
    }
}

SupportedReportSetProperty::SupportedReportSetProperty(const QStringList &reports)
    : Property(QStringLiteral("supported-report-set")), mReports(reports)
{
}

void SupportedReportSetProperty::fill(QDomDocument &document, QDomElement &element) const
{
    for (const QString &report : mReports) {
        QDomElement supported = appendChild(document, element, QStringLiteral("supported-report"));
        QDomElement wrapper = appendChild(document, supported, QStringLiteral("report"));
        appendChild(document, wrapper, report);
    }
}

AclProperty::AclProperty(const QList<Ace> &aces)
    : Property(QStringLiteral("acl")), mAces(aces)
{
}

QList<AclProperty::Ace> AclProperty::aces() const
{
    return mAces;
}

void AclProperty::fill(QDomDocument &document, QDomElement &element) const
{
    for (const Ace &ace : mAces) {
        QDomElement aceElement = appendChild(document, element, QStringLiteral("ace"));
        QDomElement principal = appendChild(document, aceElement, QStringLiteral("principal"));
        appendChild(document, principal, QStringLiteral("href"), ace.principal);
        if (!ace.grant.isEmpty()) {
            QDomElement grant = appendChild(document, aceElement, QStringLiteral("grant"));
            appendPrivileges(document, grant, ace.grant);
        }
        if (!ace.deny.isEmpty()) {
            QDomElement deny = appendChild(document, aceElement, QStringLiteral("deny"));
            appendPrivileges(document, deny, ace.deny);
        }
    }
}

PrivilegeSetProperty::PrivilegeSetProperty(const QStringList &privileges)
    : Property(QStringLiteral("current-user-privilege-set")), mPrivileges(privileges)
{
}

QStringList PrivilegeSetProperty::privileges() const
{
    return mPrivileges;
}

void PrivilegeSetProperty::fill(QDomDocument &document, QDomElement &element) const
{
    appendPrivileges(document, element, mPrivileges);
}

ComponentSetProperty::ComponentSetProperty(const QStringList &components)
    : Property(QStringLiteral("supported-calendar-component-set")), mComponents(components)
{
}

QStringList ComponentSetProperty::components() const
{
    return mComponents;
}

void ComponentSetProperty::fill(QDomDocument &document, QDomElement &element) const
{
    for (const QString &component : mComponents) {
        QDomElement comp = appendChild(document, element, QStringLiteral("comp"));
        comp.setAttribute(QStringLiteral("name"), component);
    }
}

SupportedCalendarDataProperty::SupportedCalendarDataProperty(const QString &contentType,
                                                             const QString &version)
    : Property(QStringLiteral("supported-calendar-data"))
    , mContentType(contentType), mVersion(version)
{
}

void SupportedCalendarDataProperty::fill(QDomDocument &document, QDomElement &element) const
{
    QDomElement data = appendChild(document, element, QStringLiteral("calendar-data"));
    data.setAttribute(QStringLiteral("content-type"), mContentType);
    if (!mVersion.isEmpty())
        data.setAttribute(QStringLiteral("version"), mVersion);
}

PropertyResult::PropertyResult()
    : mError(NotFound)
{
}

PropertyResult::PropertyResult(const Property::Ptr &property, Error error)
    : mProperty(property), mError(error)
{
}

PropertyResult PropertyResult::ok(const Property::Ptr &property)
{
    return PropertyResult(property, NoError);
}

PropertyResult PropertyResult::failure(Error error)
{
    return PropertyResult(Property::Ptr(), error == NoError ? Internal : error);
}

bool PropertyResult::isOk() const
{
    return mError == NoError && !mProperty.isNull();
}

PropertyResult::Error PropertyResult::error() const
{
    return mError;
}

Property::Ptr PropertyResult::property() const
{
    return mProperty;
}

int PropertyResult::httpStatus(Error error)
{
    switch (error) {
    case NoError:
        return 200;
    case NotFound:
        return 404;
    case Forbidden:
        return 403;
    case BadRequest:
        return 400;
    default:
        return 500;
    }
}

bool PropertyCatalog::contains(const QString &name)
{
    return propertyPrefixes().contains(name.toLower());
}

QStringList PropertyCatalog::names()
{
    QStringList list;
    for (const CatalogEntry &entry : PROPERTIES)
        list.append(QString::fromLatin1(entry.name));
    return list;
}

QString PropertyCatalog::prefix(const QString &name)
{
    const QString key = name.toLower();
    QHash<QString, QString>::const_iterator it = propertyPrefixes().constFind(key);
    if (it != propertyPrefixes().constEnd())
        return it.value();
    return childPrefixes().value(key, QStringLiteral("d"));
}

QString PropertyCatalog::namespaceUri(const QString &prefix)
{
    const QList<QPair<QString, QString> > list = namespaces();
    for (const QPair<QString, QString> &ns : list) {
        if (ns.first == prefix)
            return ns.second;
    }
    return QString();
}

QString PropertyCatalog::qualifiedName(const QString &name)
{
    return prefix(name) + QLatin1Char(':') + name;
}

QList<QPair<QString, QString> > PropertyCatalog::namespaces()
{
    QList<QPair<QString, QString> > list;
    list << qMakePair(QStringLiteral("d"), Xml::DAV_NS)
         << qMakePair(QStringLiteral("cal"), Xml::CALDAV_NS)
         << qMakePair(QStringLiteral("cs"), Xml::CALENDARSERVER_NS)
         << qMakePair(QStringLiteral("g"), Xml::GOOGLE_NS)
         << qMakePair(QStringLiteral("ical"), Xml::APPLE_NS);
    return list;
}
