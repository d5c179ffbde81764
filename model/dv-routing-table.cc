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

#include "dv-routing-table.h"

#include "dv-topology.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvRoutingTable");

namespace dvsim
{

RoutingTable::RoutingTable()
    : m_nRouters(0),
      m_nextHop()
{
}

RoutingTable::RoutingTable(uint32_t nRouters)
    : m_nRouters(nRouters),
      m_nextHop(static_cast<size_t>(nRouters) * nRouters, NO_ROUTER)
{
    NS_LOG_FUNCTION(this << nRouters);
}

uint32_t
RoutingTable::GetNRouters() const
{
    return m_nRouters;
}

void
RoutingTable::Initialize(const Topology& topology)
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(topology.GetNRouters() == m_nRouters,
                  "topology has " << topology.GetNRouters() << " routers, table has "
                                  << m_nRouters);
    std::fill(m_nextHop.begin(), m_nextHop.end(), NO_ROUTER);
    for (uint32_t n = 0; n < m_nRouters; n++)
    {
        for (const auto& link : topology.GetNeighbors(n))
        {
            SetNextHop(n, link.first, link.first);
        }
    }
}

uint32_t
RoutingTable::GetNextHop(uint32_t node, uint32_t dest) const
{
    NS_ASSERT_MSG(node < m_nRouters && dest < m_nRouters,
                  "entry (" << node << ", " << dest << ") out of range");
    return m_nextHop[static_cast<size_t>(node) * m_nRouters + dest];
}

void
RoutingTable::SetNextHop(uint32_t node, uint32_t dest, uint32_t nextHop)
{
    NS_ASSERT_MSG(node < m_nRouters && dest < m_nRouters,
                  "entry (" << node << ", " << dest << ") out of range");
    NS_ASSERT_MSG(nextHop == NO_ROUTER || nextHop < m_nRouters,
                  "next hop " << nextHop << " out of range");
    m_nextHop[static_cast<size_t>(node) * m_nRouters + dest] = nextHop;
}

bool
RoutingTable::operator==(const RoutingTable& other) const
{
    return m_nRouters == other.m_nRouters && m_nextHop == other.m_nextHop;
}

} // namespace dvsim
} // namespace ns3
