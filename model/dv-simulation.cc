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

#include "dv-simulation.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/callback.h"
#include "ns3/log.h"

#include <set>
#include <sstream>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvSimulation");

namespace dvsim
{

NS_OBJECT_ENSURE_REGISTERED(DvSimulation);

TypeId
DvSimulation::GetTypeId()
{
    static TypeId tid = TypeId("ns3::dvsim::DvSimulation")
                            .SetParent<Object>()
                            .SetGroupName("Dvsim")
                            .AddConstructor<DvSimulation>();
    return tid;
}

DvSimulation::DvSimulation()
    : m_routers(),
      m_printer(m_routers),
      m_topology(nullptr),
      m_engine(nullptr),
      m_applier(nullptr),
      m_distances(),
      m_routes(),
      m_updates(),
      m_round(0),
      m_setup(false),
      m_output(nullptr)
{
    NS_LOG_FUNCTION(this);
}

DvSimulation::~DvSimulation()
{
    NS_LOG_FUNCTION(this);
}

void
DvSimulation::DoDispose()
{
    NS_LOG_FUNCTION(this);
    if (m_setup)
    {
        // the engine may outlive this simulation
        bool disconnected =
            m_engine->TraceDisconnectWithoutContext("RoundComplete",
                                                    MakeCallback(&DvSimulation::ReportRound, this));
        NS_ABORT_MSG_UNLESS(disconnected, "cannot disconnect from the RoundComplete trace source");
        m_engine->SetTopology(nullptr);
        m_setup = false;
    }
    m_topology = nullptr;
    m_engine = nullptr;
    m_applier = nullptr;
    m_output = nullptr;
    Object::DoDispose();
}

void
DvSimulation::SetEngine(Ptr<ConvergenceEngine> engine)
{
    NS_LOG_FUNCTION(this << engine);
    NS_ASSERT_MSG(!m_setup, "the engine must be set before Setup");
    m_engine = engine;
}

bool
DvSimulation::Setup(const DvInput& input, std::string* error)
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(!m_setup, "Setup called twice");

    auto fail = [error](const std::string& msg) {
        NS_LOG_ERROR(msg);
        if (error != nullptr)
        {
            *error = msg;
        }
        return false;
    };

    if (m_engine && m_engine->GetTopology())
    {
        return fail("the engine is already driving another simulation");
    }
    if (input.routers.empty())
    {
        return fail("no routers");
    }
    std::set<std::string> unique(input.routers.begin(), input.routers.end());
    if (unique.size() != input.routers.size())
    {
        return fail("duplicate router labels");
    }
    m_routers = RouterSet(input.routers);

    auto resolve = [this, &fail](const LinkSpec& spec, LinkUpdate& update) {
        update.src = m_routers.GetIndex(spec.src);
        update.dest = m_routers.GetIndex(spec.dest);
        update.cost = spec.cost;
        if (update.src == NO_ROUTER || update.dest == NO_ROUTER)
        {
            return fail("line " + std::to_string(spec.line) + ": unknown router in \"" + spec.src +
                        " " + spec.dest + "\"");
        }
        return true;
    };

    m_topology = CreateObject<Topology>();
    m_topology->SetNRouters(m_routers.GetNRouters());
    for (const LinkSpec& spec : input.links)
    {
        LinkUpdate link;
        if (!resolve(spec, link))
        {
            return false;
        }
        LinkStatus status = m_topology->SetLink(link.src, link.dest, link.cost);
        if (status != LinkStatus::OK)
        {
            std::ostringstream oss;
            oss << "line " << spec.line << ": link " << spec.src << " " << spec.dest << " "
                << spec.cost << " rejected (" << status << ")";
            return fail(oss.str());
        }
    }

    m_updates.clear();
    for (const LinkSpec& spec : input.updates)
    {
        LinkUpdate update;
        if (!resolve(spec, update))
        {
            return false;
        }
        LinkStatus status = m_topology->CheckLink(update.src, update.dest, update.cost);
        if (status != LinkStatus::OK)
        {
            std::ostringstream oss;
            oss << "line " << spec.line << ": update " << spec.src << " " << spec.dest << " "
                << spec.cost << " rejected (" << status << ")";
            return fail(oss.str());
        }
        m_updates.push_back(update);
    }

    if (!m_engine)
    {
        m_engine = CreateObject<ConvergenceEngine>();
    }
    m_engine->SetTopology(m_topology);
    bool connected =
        m_engine->TraceConnectWithoutContext("RoundComplete",
                                             MakeCallback(&DvSimulation::ReportRound, this));
    NS_ABORT_MSG_UNLESS(connected, "cannot connect to the RoundComplete trace source");

    m_applier = CreateObject<UpdateApplier>();
    m_applier->SetTopology(m_topology);
    m_applier->SetEngine(m_engine);

    m_distances = DistanceTable(m_routers.GetNRouters());
    m_routes = RoutingTable(m_routers.GetNRouters());
    m_round = 0;
    m_setup = true;

    NS_LOG_INFO("Simulation with " << m_routers.GetNRouters() << " routers, "
                                   << m_topology->GetNLinks() << " links, " << m_updates.size()
                                   << " queued updates");
    return true;
}

ConvergenceResult
DvSimulation::RunInitialPhase()
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(m_setup, "Setup has not succeeded");
    m_round = 0;
    m_engine->InitializeTables(m_distances, m_routes);
    ConvergenceResult result = m_engine->Converge(m_distances, m_routes, m_round);
    m_round = result.lastRound;
    return result;
}

LinkStatus
DvSimulation::ApplyUpdates(const std::vector<LinkUpdate>& updates, ConvergenceResult& result)
{
    NS_LOG_FUNCTION(this << updates.size());
    NS_ASSERT_MSG(m_setup, "Setup has not succeeded");
    LinkStatus status = m_applier->Apply(updates, m_distances, m_routes, m_round, result);
    if (status == LinkStatus::OK)
    {
        m_round = result.lastRound;
    }
    return status;
}

bool
DvSimulation::Run(std::ostream& os)
{
    NS_LOG_FUNCTION(this);
    NS_ASSERT_MSG(m_setup, "Setup has not succeeded");
    m_output = &os;

    ConvergenceResult initial = RunInitialPhase();
    if (!initial.converged)
    {
        ReportNotConverged(os, initial);
    }
    m_printer.PrintRoutingTables(os, m_distances, m_routes);
    bool converged = initial.converged;

    if (!m_updates.empty())
    {
        os << std::endl << "APPLYING UPDATES" << std::endl;
        ConvergenceResult after;
        LinkStatus status = ApplyUpdates(m_updates, after);
        // the queued updates were checked in Setup
        NS_ABORT_MSG_IF(status != LinkStatus::OK, "queued updates rejected: " << status);
        if (!after.converged)
        {
            ReportNotConverged(os, after);
        }
        m_printer.PrintRoutingTables(os, m_distances, m_routes);
        converged = converged && after.converged;
    }

    m_output = nullptr;
    return converged;
}

void
DvSimulation::ReportRound(uint32_t round, const DistanceTable& table)
{
    if (m_output != nullptr)
    {
        m_printer.PrintDistanceTables(*m_output, round, table);
    }
}

void
DvSimulation::ReportNotConverged(std::ostream& os, const ConvergenceResult& result) const
{
    NS_LOG_WARN("Phase ended at round " << result.lastRound << " without converging");
    os << std::endl << "DID NOT CONVERGE after " << result.sweeps << " rounds" << std::endl;
}

const RouterSet&
DvSimulation::GetRouterSet() const
{
    return m_routers;
}

Ptr<Topology>
DvSimulation::GetTopology() const
{
    return m_topology;
}

Ptr<ConvergenceEngine>
DvSimulation::GetEngine() const
{
    return m_engine;
}

const DistanceTable&
DvSimulation::GetDistanceTable() const
{
    return m_distances;
}

const RoutingTable&
DvSimulation::GetRoutingTable() const
{
    return m_routes;
}

const std::vector<LinkUpdate>&
DvSimulation::GetQueuedUpdates() const
{
    return m_updates;
}

uint32_t
DvSimulation::GetRound() const
{
    return m_round;
}

uint32_t
DvSimulation::GetRouteCost(const std::string& src, const std::string& dest) const
{
    uint32_t s = m_routers.GetIndex(src);
    uint32_t d = m_routers.GetIndex(dest);
    NS_ASSERT_MSG(s != NO_ROUTER && d != NO_ROUTER, "unknown router " << src << " or " << dest);
    if (s == d)
    {
        return 0;
    }
    return m_distances.Get(s, s, d);
}

std::string
DvSimulation::GetNextHop(const std::string& src, const std::string& dest) const
{
    uint32_t s = m_routers.GetIndex(src);
    uint32_t d = m_routers.GetIndex(dest);
    NS_ASSERT_MSG(s != NO_ROUTER && d != NO_ROUTER, "unknown router " << src << " or " << dest);
    if (s == d)
    {
        return "";
    }
    uint32_t hop = m_routes.GetNextHop(s, d);
    if (hop == NO_ROUTER)
    {
        return "";
    }
    return m_routers.GetLabel(hop);
}

} // namespace dvsim
} // namespace ns3
