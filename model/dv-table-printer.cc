/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024 Pu Yang
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation;
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 * Authors: Pu Yang  <puyang@uvic.ca>
 */

#include "dv-table-printer.h"

#include "ns3/assert.h"

#include <string>

namespace ns3
{
namespace dvsim
{

namespace
{
const char* const COLUMN_SEPARATOR = "    ";
const char* const HEADER_INDENT = "     ";
} // namespace

TablePrinter::TablePrinter(const RouterSet& routers)
    : m_routers(routers)
{
}

std::string
TablePrinter::FormatCost(uint32_t cost)
{
    if (cost == DISTINFINITY)
    {
        return "INF";
    }
    return std::to_string(cost);
}

void
TablePrinter::PrintDistanceTables(std::ostream& os, uint32_t round, const DistanceTable& table) const
{
    for (uint32_t node = 0; node < table.GetNRouters(); node++)
    {
        PrintDistanceTable(os, round, table, node);
    }
}

void
TablePrinter::PrintDistanceTable(std::ostream& os,
                                 uint32_t round,
                                 const DistanceTable& table,
                                 uint32_t node) const
{
    const uint32_t nRouters = table.GetNRouters();
    NS_ASSERT_MSG(nRouters == m_routers.GetNRouters(), "table does not match the router set");

    os << std::endl
       << "Distance Table of router " << m_routers.GetLabel(node) << " at t=" << round << ":"
       << std::endl;

    os << HEADER_INDENT;
    bool first = true;
    for (uint32_t dest = 0; dest < nRouters; dest++)
    {
        if (dest == node)
        {
            continue;
        }
        os << (first ? "" : COLUMN_SEPARATOR) << m_routers.GetLabel(dest);
        first = false;
    }
    os << std::endl;

    for (uint32_t via = 0; via < nRouters; via++)
    {
        if (via == node)
        {
            continue;
        }
        os << m_routers.GetLabel(via);
        for (uint32_t dest = 0; dest < nRouters; dest++)
        {
            if (dest == node)
            {
                continue;
            }
            os << COLUMN_SEPARATOR << FormatCost(table.Get(node, via, dest));
        }
        os << std::endl;
    }
}

void
TablePrinter::PrintRoutingTables(std::ostream& os,
                                 const DistanceTable& distances,
                                 const RoutingTable& routes) const
{
    const uint32_t nRouters = routes.GetNRouters();
    NS_ASSERT_MSG(nRouters == m_routers.GetNRouters() && distances.GetNRouters() == nRouters,
                  "tables do not match the router set");

    for (uint32_t node = 0; node < nRouters; node++)
    {
        os << std::endl << "Routing Table of router " << m_routers.GetLabel(node) << ":" << std::endl;
        for (uint32_t dest = 0; dest < nRouters; dest++)
        {
            if (dest == node)
            {
                continue;
            }
            uint32_t nextHop = routes.GetNextHop(node, dest);
            uint32_t cost = distances.Get(node, node, dest);
            if (nextHop == NO_ROUTER || cost == DISTINFINITY)
            {
                continue;
            }
            os << m_routers.GetLabel(dest) << "," << m_routers.GetLabel(nextHop) << "," << cost
               << std::endl;
        }
    }
}

} // namespace dvsim
} // namespace ns3
