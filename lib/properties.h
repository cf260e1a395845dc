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

#ifndef PROPERTIES_H
#define PROPERTIES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QPair>
#include <QMap>
#include <QSharedPointer>
#include <QDomDocument>
#include <QDomElement>

#include "caldavexport.h"

namespace CalDav {

/* A DAV property value. Each value renders itself as a prefixed
   element, the prefix being fixed per name by PropertyCatalog. */
class CALDAV_EXPORT Property
{
public:
    typedef QSharedPointer<Property> Ptr;

    explicit Property(const QString &name);
    virtual ~Property();

    QString name() const;
    QDomElement toElement(QDomDocument &document) const;

protected:
    virtual void fill(QDomDocument &document, QDomElement &element) const = 0;

private:
    QString mName;
};

class CALDAV_EXPORT TextProperty : public Property
{
public:
    TextProperty(const QString &name, const QString &value);
    QString value() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QString mValue;
};

class CALDAV_EXPORT HrefProperty : public Property
{
public:
    HrefProperty(const QString &name, const QString &href);
    QString href() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QString mHref;
};

class CALDAV_EXPORT HrefListProperty : public Property
{
public:
    HrefListProperty(const QString &name, const QStringList &hrefs);
    QStringList hrefs() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QStringList mHrefs;
};

class CALDAV_EXPORT IntegerProperty : public Property
{
public:
    IntegerProperty(const QString &name, qint64 value);
    qint64 value() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    qint64 mValue;
};

class CALDAV_EXPORT BooleanProperty : public Property
{
public:
    BooleanProperty(const QString &name, bool value);
    bool value() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    bool mValue;
};

class CALDAV_EXPORT DateTimeProperty : public Property
{
public:
    enum Format {
        HttpDate,       // Wed, 05 Apr 2025 14:30:00 GMT
        CompactUtc      // 20250405T143000Z
    };

    DateTimeProperty(const QString &name, const QDateTime &value, Format format);
    QDateTime value() const;

    static QString toHttpDate(const QDateTime &value);

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QDateTime mValue;
    Format mFormat;
};

class CALDAV_EXPORT ResourceTypeProperty : public Property
{
public:
    enum Kind {
        Principal,
        HomeSet,
        Calendar,
        CalendarObject,
        Plain
    };

    explicit ResourceTypeProperty(Kind kind, const QString &objectType = QString());
    Kind kind() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    Kind mKind;
    QString mObjectType;
};

class CALDAV_EXPORT SupportedReportSetProperty : public Property
{
public:
    // Report element names, like calendar-query.
    explicit SupportedReportSetProperty(const QStringList &reports);

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QStringList mReports;
};

class CALDAV_EXPORT AclProperty : public Property
{
public:
    struct Ace {
        QString principal;
        QStringList grant;
        QStringList deny;
    };

    explicit AclProperty(const QList<Ace> &aces);
    QList<Ace> aces() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QList<Ace> mAces;
};

class CALDAV_EXPORT PrivilegeSetProperty : public Property
{
public:
    explicit PrivilegeSetProperty(const QStringList &privileges);
    QStringList privileges() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QStringList mPrivileges;
};

class CALDAV_EXPORT ComponentSetProperty : public Property
{
public:
    explicit ComponentSetProperty(const QStringList &components);
    QStringList components() const;

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QStringList mComponents;
};

class CALDAV_EXPORT SupportedCalendarDataProperty : public Property
{
public:
    SupportedCalendarDataProperty(const QString &contentType, const QString &version);

protected:
    void fill(QDomDocument &document, QDomElement &element) const override;

private:
    QString mContentType;
    QString mVersion;
};

class CALDAV_EXPORT PropertyResult
{
public:
    enum Error {
        NoError,
        NotFound,
        Forbidden,
        Internal,
        BadRequest
    };

    // A default result is a NotFound failure.
    PropertyResult();

    static PropertyResult ok(const Property::Ptr &property);
    static PropertyResult failure(Error error);

    bool isOk() const;
    Error error() const;
    Property::Ptr property() const;

    static int httpStatus(Error error);

private:
    PropertyResult(const Property::Ptr &property, Error error);

    Property::Ptr mProperty;
    Error mError;
};

// Lower-cased property name to outcome.
typedef QMap<QString, PropertyResult> PropertyMap;

class CALDAV_EXPORT PropertyCatalog
{
public:
    static bool contains(const QString &name);
    static QStringList names();
    // Prefix of a property or of a child element, "d" when unknown.
    static QString prefix(const QString &name);
    static QString namespaceUri(const QString &prefix);
    static QString qualifiedName(const QString &name);
    // Prefix and namespace pairs, in declaration order.
    static QList<QPair<QString, QString> > namespaces();
};
}

#endif
