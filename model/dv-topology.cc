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

#include "dv-topology.h"

#include "ns3/assert.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvTopology");

namespace dvsim
{

std::ostream&
operator<<(std::ostream& os, LinkStatus status)
{
    switch (status)
    {
    case LinkStatus::OK:
        return os << "OK";
    case LinkStatus::INVALID_COST:
        return os << "INVALID_COST";
    case LinkStatus::UNKNOWN_ROUTER:
        return os << "UNKNOWN_ROUTER";
    case LinkStatus::SELF_LOOP:
        return os << "SELF_LOOP";
    }
    return os << "UNKNOWN(" << static_cast<int>(status) << ")";
}

NS_OBJECT_ENSURE_REGISTERED(Topology);

TypeId
Topology::GetTypeId()
{
    static TypeId tid = TypeId("ns3::dvsim::Topology")
                            .SetParent<Object>()
                            .SetGroupName("Dvsim")
                            .AddConstructor<Topology>();
    return tid;
}

Topology::Topology()
    : m_adjacency()
{
    NS_LOG_FUNCTION(this);
}

Topology::~Topology()
{
    NS_LOG_FUNCTION(this);
}

void
Topology::SetNRouters(uint32_t nRouters)
{
    NS_LOG_FUNCTION(this << nRouters);
    m_adjacency.assign(nRouters, AdjacencyMap_t());
}

uint32_t
Topology::GetNRouters() const
{
    return m_adjacency.size();
}

LinkStatus
Topology::CheckLink(uint32_t a, uint32_t b, int64_t cost) const
{
    if (a >= m_adjacency.size() || b >= m_adjacency.size())
    {
        return LinkStatus::UNKNOWN_ROUTER;
    }
    if (a == b)
    {
        return LinkStatus::SELF_LOOP;
    }
    if (cost == DELETE_LINK)
    {
        return LinkStatus::OK;
    }
    if (cost <= 0 || cost >= static_cast<int64_t>(DISTINFINITY))
    {
        return LinkStatus::INVALID_COST;
    }
    return LinkStatus::OK;
}

LinkStatus
Topology::SetLink(uint32_t a, uint32_t b, int64_t cost)
{
    NS_LOG_FUNCTION(this << a << b << cost);
    LinkStatus status = CheckLink(a, b, cost);
    if (status != LinkStatus::OK)
    {
        NS_LOG_ERROR("Rejecting link " << a << "-" << b << " cost " << cost << ": " << status);
        return status;
    }

    if (cost == DELETE_LINK)
    {
        if (m_adjacency[a].erase(b) > 0)
        {
            NS_LOG_LOGIC("Removed link " << a << "-" << b);
        }
        m_adjacency[b].erase(a);
        return LinkStatus::OK;
    }

    NS_LOG_LOGIC("Link " << a << "-" << b << " now costs " << cost);
    m_adjacency[a][b] = static_cast<uint32_t>(cost);
    m_adjacency[b][a] = static_cast<uint32_t>(cost);
    return LinkStatus::OK;
}

LinkStatus
Topology::RemoveLink(uint32_t a, uint32_t b)
{
    return SetLink(a, b, DELETE_LINK);
}

bool
Topology::HasLink(uint32_t a, uint32_t b) const
{
    if (a >= m_adjacency.size())
    {
        return false;
    }
    return m_adjacency[a].find(b) != m_adjacency[a].end();
}

uint32_t
Topology::GetCost(uint32_t a, uint32_t b) const
{
    if (a >= m_adjacency.size())
    {
        return DISTINFINITY;
    }
    AdjacencyMap_t::const_iterator ci = m_adjacency[a].find(b);
    if (ci == m_adjacency[a].end())
    {
        return DISTINFINITY;
    }
    return ci->second;
}

const std::map<uint32_t, uint32_t>&
Topology::GetNeighbors(uint32_t node) const
{
    NS_ASSERT_MSG(node < m_adjacency.size(), "router index " << node << " out of range");
    return m_adjacency[node];
}

uint32_t
Topology::GetNLinks() const
{
    uint32_t n = 0;
    for (uint32_t i = 0; i < m_adjacency.size(); i++)
    {
        n += m_adjacency[i].size();
    }
    return n / 2;
}

uint64_t
Topology::GetTotalCost() const
{
    uint64_t total = 0;
    for (uint32_t i = 0; i < m_adjacency.size(); i++)
    {
        for (const auto& link : m_adjacency[i])
        {
            // count each undirected link once
            if (link.first > i)
            {
                total += link.second;
            }
        }
    }
    return total;
}

} // namespace dvsim
} // namespace ns3
