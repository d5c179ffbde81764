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

#include "dv-update-applier.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvUpdateApplier");

namespace dvsim
{

std::ostream&
operator<<(std::ostream& os, const UpdateCounts& counts)
{
    os << counts.added << " added, " << counts.changed << " changed, " << counts.removed
       << " removed, " << counts.unchanged << " unchanged";
    return os;
}

NS_OBJECT_ENSURE_REGISTERED(UpdateApplier);

TypeId
UpdateApplier::GetTypeId()
{
    static TypeId tid = TypeId("ns3::dvsim::UpdateApplier")
                            .SetParent<Object>()
                            .SetGroupName("Dvsim")
                            .AddConstructor<UpdateApplier>();
    return tid;
}

UpdateApplier::UpdateApplier()
    : m_topology(nullptr),
      m_engine(nullptr),
      m_lastCounts{0, 0, 0, 0}
{
    NS_LOG_FUNCTION(this);
}

UpdateApplier::~UpdateApplier()
{
    NS_LOG_FUNCTION(this);
}

void
UpdateApplier::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_topology = nullptr;
    m_engine = nullptr;
    Object::DoDispose();
}

void
UpdateApplier::SetTopology(Ptr<Topology> topology)
{
    NS_LOG_FUNCTION(this << topology);
    m_topology = topology;
}

void
UpdateApplier::SetEngine(Ptr<ConvergenceEngine> engine)
{
    NS_LOG_FUNCTION(this << engine);
    m_engine = engine;
}

LinkStatus
UpdateApplier::ApplyToTopology(const std::vector<LinkUpdate>& updates, uint32_t* failedIndex)
{
    NS_LOG_FUNCTION(this << updates.size());
    NS_ASSERT_MSG(m_topology, "no topology set");

    for (uint32_t i = 0; i < updates.size(); i++)
    {
        const LinkUpdate& u = updates[i];
        LinkStatus status = m_topology->CheckLink(u.src, u.dest, u.cost);
        if (status != LinkStatus::OK)
        {
            NS_LOG_ERROR("Edit " << i << " (" << u.src << " " << u.dest << " " << u.cost
                                 << ") rejected: " << status);
            if (failedIndex != nullptr)
            {
                *failedIndex = i;
            }
            return status;
        }
    }

    UpdateCounts counts = {0, 0, 0, 0};
    for (const LinkUpdate& u : updates)
    {
        bool existed = m_topology->HasLink(u.src, u.dest);
        if (u.cost == DELETE_LINK)
        {
            if (existed)
            {
                counts.removed++;
            }
            else
            {
                counts.unchanged++;
            }
        }
        else if (!existed)
        {
            counts.added++;
        }
        else if (m_topology->GetCost(u.src, u.dest) != u.cost)
        {
            counts.changed++;
        }
        else
        {
            counts.unchanged++;
        }
        LinkStatus status = m_topology->SetLink(u.src, u.dest, u.cost);
        NS_ABORT_MSG_IF(status != LinkStatus::OK, "validated edit rejected: " << status);
    }

    m_lastCounts = counts;
    NS_LOG_INFO("Applied " << updates.size() << " edits: " << counts);
    return LinkStatus::OK;
}

LinkStatus
UpdateApplier::Apply(const std::vector<LinkUpdate>& updates,
                     DistanceTable& distances,
                     RoutingTable& routes,
                     uint32_t lastRound,
                     ConvergenceResult& result)
{
    NS_LOG_FUNCTION(this << updates.size() << lastRound);
    NS_ASSERT_MSG(m_engine, "no engine set");

    LinkStatus status = ApplyToTopology(updates);
    if (status != LinkStatus::OK)
    {
        return status;
    }
    // warm start: the tables of the previous phase are the starting point
    result = m_engine->Converge(distances, routes, lastRound);
    return LinkStatus::OK;
}

UpdateCounts
UpdateApplier::GetLastCounts() const
{
    return m_lastCounts;
}

} // namespace dvsim
} // namespace ns3
