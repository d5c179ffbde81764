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

#include "dv-distance-table.h"

#include "dv-topology.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvDistanceTable");

namespace dvsim
{

DistanceTable::DistanceTable()
    : m_nRouters(0),
      m_costs()
{
}

DistanceTable::DistanceTable(uint32_t nRouters)
    : m_nRouters(nRouters),
      m_costs(static_cast<size_t>(nRouters) * nRouters * nRouters, DISTINFINITY)
{
    NS_LOG_FUNCTION(this << nRouters);
}

uint32_t
DistanceTable::GetNRouters() const
{
    return m_nRouters;
}

void
DistanceTable::Initialize(const Topology& topology)
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(topology.GetNRouters() == m_nRouters,
                  "topology has " << topology.GetNRouters() << " routers, table has "
                                  << m_nRouters);
    std::fill(m_costs.begin(), m_costs.end(), DISTINFINITY);
    for (uint32_t n = 0; n < m_nRouters; n++)
    {
        for (const auto& link : topology.GetNeighbors(n))
        {
            Set(n, link.first, link.first, link.second);
            Set(n, n, link.first, link.second);
        }
    }
}

size_t
DistanceTable::Index(uint32_t node, uint32_t via, uint32_t dest) const
{
    NS_ASSERT_MSG(node < m_nRouters && via < m_nRouters && dest < m_nRouters,
                  "entry (" << node << ", " << via << ", " << dest << ") out of range");
    return (static_cast<size_t>(node) * m_nRouters + via) * m_nRouters + dest;
}

uint32_t
DistanceTable::Get(uint32_t node, uint32_t via, uint32_t dest) const
{
    return m_costs[Index(node, via, dest)];
}

void
DistanceTable::Set(uint32_t node, uint32_t via, uint32_t dest, uint32_t cost)
{
    m_costs[Index(node, via, dest)] = cost;
}

uint32_t
DistanceTable::GetBestEstimate(uint32_t node, uint32_t dest) const
{
    uint32_t best = DISTINFINITY;
    for (uint32_t via = 0; via < m_nRouters; via++)
    {
        uint32_t cost = Get(node, via, dest);
        if (cost < best)
        {
            best = cost;
        }
    }
    return best;
}

bool
DistanceTable::operator==(const DistanceTable& other) const
{
    return m_nRouters == other.m_nRouters && m_costs == other.m_costs;
}

} // namespace dvsim
} // namespace ns3
