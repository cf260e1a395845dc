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

#include "matcher.h"
#include "componentnode_p.h"
#include "logging_p.h"

using namespace CalDav;

namespace {
    bool matchParamFilter(const ParamFilter &filter, const PropertyInstance &property)
    {
        const QString key = filter.name.toUpper();
        const bool defined = property.parameters.contains(key);
        if (filter.isNotDefined)
            return !defined;
        if (!defined)
            return false;
        return !filter.hasTextMatch || filter.textMatch.matches(property.parameters.value(key));
    }

    bool matchPropertyInstance(const PropFilter &filter, const PropertyInstance &property)
    {
        if (filter.hasTextMatch && !filter.textMatch.matches(property.value))
            return false;
        for (const ParamFilter &param : filter.paramFilters) {
            if (!matchParamFilter(param, property))
                return false;
        }
        return true;
    }

    bool matchPropFilter(const PropFilter &filter, const ComponentNode &component)
    {
        const QList<PropertyInstance> instances = component.properties(filter.name);
        if (filter.isNotDefined)
            return instances.isEmpty();
        for (const PropertyInstance &instance : instances) {
            if (matchPropertyInstance(filter, instance))
                return true;
        }
        return false;
    }

    bool matchCompFilter(const Filter &filter, const ComponentNode &parent);

    bool matchComponent(const Filter &filter, const ComponentNode &component)
    {
        if (filter.hasTimeRange && !component.overlaps(filter.timeRange))
            return false;

        if (filter.propFilters.isEmpty() && filter.children.isEmpty())
            return true;

        const bool allOf = filter.isAllOf();
        for (const PropFilter &prop : filter.propFilters) {
            const bool matched = matchPropFilter(prop, component);
            if (allOf && !matched)
                return false;
            if (!allOf && matched)
                return true;
        }
        for (const Filter &child : filter.children) {
            const bool matched = matchCompFilter(child, component);
            if (allOf && !matched)
                return false;
            if (!allOf && matched)
                return true;
        }
        return allOf;
    }

    // A comp-filter applies to the children of parent carrying its name.
    bool matchCompFilter(const Filter &filter, const ComponentNode &parent)
    {
        bool found = false;
        for (const ComponentNode &child : parent.children()) {
            if (child.name().compare(filter.component, Qt::CaseInsensitive) != 0)
                continue;
            found = true;
            if (!filter.isNotDefined && matchComponent(filter, child))
                return true;
        }
        return filter.isNotDefined && !found;
    }
}

bool Matcher::matches(const Filter &filter, const CalendarObject &object)
{
    if (filter.isNull())
        return true;

    const ComponentNode root = ComponentNode::calendar(object);
    if (root.name().compare(filter.component, Qt::CaseInsensitive) != 0) {
        qCDebug(lcCalDav) << "Filter root" << filter.component << "does not select a calendar";
        return filter.isNotDefined;
    }
    if (filter.isNotDefined)
        return false;
    return matchComponent(filter, root);
}
