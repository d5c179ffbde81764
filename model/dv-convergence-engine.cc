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

#include "dv-convergence-engine.h"

#include "ns3/assert.h"
#include "ns3/log.h"
#include "ns3/trace-source-accessor.h"
#include "ns3/uinteger.h"

#include <vector>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvConvergenceEngine");

namespace dvsim
{

NS_OBJECT_ENSURE_REGISTERED(ConvergenceEngine);

TypeId
ConvergenceEngine::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::dvsim::ConvergenceEngine")
            .SetParent<Object>()
            .SetGroupName("Dvsim")
            .AddConstructor<ConvergenceEngine>()
            .AddAttribute("MaxRounds",
                          "The maximum number of sweeps in one convergence phase before the "
                          "phase is reported as not converged",
                          UintegerValue(1000),
                          MakeUintegerAccessor(&ConvergenceEngine::m_maxRounds),
                          MakeUintegerChecker<uint32_t>(1))
            .AddAttribute("InfinityMetric",
                          "The smallest cost treated as unreachable.  0 derives the limit from "
                          "the topology: any cost above the sum of all link costs is unreachable",
                          UintegerValue(0),
                          MakeUintegerAccessor(&ConvergenceEngine::m_infinityMetric),
                          MakeUintegerChecker<uint32_t>())
            .AddTraceSource("RoundComplete",
                            "The distance table was initialized or a relaxation sweep completed",
                            MakeTraceSourceAccessor(&ConvergenceEngine::m_roundCompleteTrace),
                            "ns3::dvsim::ConvergenceEngine::RoundCompleteCallback");
    return tid;
}

ConvergenceEngine::ConvergenceEngine()
    : m_topology(nullptr),
      m_maxRounds(1000),
      m_infinityMetric(0)
{
    NS_LOG_FUNCTION(this);
}

ConvergenceEngine::~ConvergenceEngine()
{
    NS_LOG_FUNCTION(this);
}

void
ConvergenceEngine::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_topology = nullptr;
    Object::DoDispose();
}

void
ConvergenceEngine::SetTopology(Ptr<const Topology> topology)
{
    NS_LOG_FUNCTION(this << topology);
    m_topology = topology;
}

Ptr<const Topology>
ConvergenceEngine::GetTopology() const
{
    return m_topology;
}

uint32_t
ConvergenceEngine::GetMetricCeiling() const
{
    if (m_infinityMetric != 0)
    {
        return m_infinityMetric - 1;
    }
    NS_ASSERT_MSG(m_topology, "no topology set");
    uint64_t total = m_topology->GetTotalCost();
    if (total >= DISTINFINITY)
    {
        return DISTINFINITY - 1;
    }
    return static_cast<uint32_t>(total);
}

void
ConvergenceEngine::InitializeTables(DistanceTable& distances, RoutingTable& routes)
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(m_topology, "no topology set");
    distances.Initialize(*m_topology);
    routes.Initialize(*m_topology);
    NS_LOG_INFO("Tables initialized from " << m_topology->GetNLinks() << " links");
    m_roundCompleteTrace(0, distances);
}

bool
ConvergenceEngine::Sweep(DistanceTable& distances, RoutingTable& routes) const
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(m_topology, "no topology set");
    const uint32_t nRouters = distances.GetNRouters();
    NS_ASSERT_MSG(m_topology->GetNRouters() == nRouters && routes.GetNRouters() == nRouters,
                  "topology and tables disagree on the number of routers");

    const uint32_t ceiling = GetMetricCeiling();
    DistanceTable nextDistances(nRouters);
    RoutingTable nextRoutes(nRouters);
    bool changed = false;

    // what every router advertises this round, taken from the previous snapshot
    std::vector<uint32_t> advertised(static_cast<size_t>(nRouters) * nRouters, DISTINFINITY);
    for (uint32_t via = 0; via < nRouters; via++)
    {
        for (uint32_t dest = 0; dest < nRouters; dest++)
        {
            advertised[static_cast<size_t>(via) * nRouters + dest] =
                distances.GetBestEstimate(via, dest);
        }
    }

    for (uint32_t node = 0; node < nRouters; node++)
    {
        for (uint32_t dest = 0; dest < nRouters; dest++)
        {
            if (dest == node)
            {
                continue;
            }

            uint32_t bestCost = DISTINFINITY;
            uint32_t bestHop = NO_ROUTER;
            for (uint32_t via = 0; via < nRouters; via++)
            {
                if (via == node)
                {
                    continue;
                }
                uint32_t linkCost = m_topology->GetCost(node, via);
                uint32_t cost = linkCost;
                if (via != dest && linkCost != DISTINFINITY)
                {
                    // only the aggregate advertised by the neighbor is visible
                    cost = AddCost(linkCost, advertised[static_cast<size_t>(via) * nRouters + dest]);
                }
                if (cost > ceiling)
                {
                    cost = DISTINFINITY;
                }
                nextDistances.Set(node, via, dest, cost);
                if (cost < bestCost)
                {
                    bestCost = cost;
                    bestHop = via;
                }
            }

            uint32_t oldHop = routes.GetNextHop(node, dest);
            if (bestCost == DISTINFINITY)
            {
                bestHop = NO_ROUTER;
            }
            else if (oldHop != NO_ROUTER && nextDistances.Get(node, oldHop, dest) == bestCost)
            {
                bestHop = oldHop;
            }

            uint32_t oldCost = distances.Get(node, node, dest);
            if (oldCost != bestCost || oldHop != bestHop)
            {
                NS_LOG_LOGIC("Router " << node << " dest " << dest << ": cost " << oldCost
                                       << " -> " << bestCost << ", next hop " << oldHop
                                       << " -> " << bestHop);
                changed = true;
            }
            nextDistances.Set(node, node, dest, bestCost);
            nextRoutes.SetNextHop(node, dest, bestHop);
        }
    }

    distances = std::move(nextDistances);
    routes = std::move(nextRoutes);
    return changed;
}

ConvergenceResult
ConvergenceEngine::Converge(DistanceTable& distances, RoutingTable& routes, uint32_t lastRound)
{
    NS_LOG_FUNCTION(this << lastRound);
    ConvergenceResult result;
    result.converged = false;
    result.sweeps = 0;
    result.lastRound = lastRound;

    while (result.sweeps < m_maxRounds)
    {
        bool changed = Sweep(distances, routes);
        result.sweeps++;
        result.lastRound++;
        m_roundCompleteTrace(result.lastRound, distances);
        if (!changed)
        {
            result.converged = true;
            NS_LOG_INFO("Converged at round " << result.lastRound << " after " << result.sweeps
                                              << " sweeps");
            return result;
        }
    }

    NS_LOG_WARN("No fixpoint after " << result.sweeps << " sweeps (round " << result.lastRound
                                     << ")");
    return result;
}

} // namespace dvsim
} // namespace ns3
