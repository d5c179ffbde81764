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

#ifndef DV_UPDATE_APPLIER_H
#define DV_UPDATE_APPLIER_H

#include "dv-convergence-engine.h"
#include "dv-topology.h"

#include "ns3/object.h"
#include "ns3/ptr.h"

#include <ostream>
#include <vector>

namespace ns3
{
namespace dvsim
{

/**
 * \brief One queued topology edit.
 */
struct LinkUpdate
{
    uint32_t src;  //!< first endpoint index
    uint32_t dest; //!< second endpoint index
    int64_t cost;  //!< new link cost, or DELETE_LINK
};

/**
 * \brief What a batch of edits did to the topology.
 */
struct UpdateCounts
{
    uint32_t added;     //!< links that did not exist before
    uint32_t changed;   //!< existing links that got a different cost
    uint32_t removed;   //!< existing links that were deleted
    uint32_t unchanged; //!< edits that left the topology as it was
};

std::ostream& operator<<(std::ostream& os, const UpdateCounts& counts);

/**
 * \ingroup dvsim
 * \brief Applies a batch of link edits and re-converges from the current
 * tables.
 *
 * Edits are applied in list order, so later edits to the same pair win.  The
 * distance and routing tables are not touched by the edits themselves: the
 * next sweeps propagate both improvements and invalidations.  Removing a link
 * therefore leaves stale costs that count upwards until they pass the metric
 * ceiling.
 */
class UpdateApplier : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();

    UpdateApplier();
    ~UpdateApplier() override;

    void SetTopology(Ptr<Topology> topology);
    void SetEngine(Ptr<ConvergenceEngine> engine);

    /**
     * \brief Apply the edits to the topology only.
     *
     * Every edit is checked before the first one is applied.  If any edit is
     * invalid the topology is left unchanged.
     *
     * \param updates the edits, in application order
     * \param failedIndex if not null, set to the position of the first invalid edit
     * \return LinkStatus::OK, or the reason the first invalid edit was rejected
     */
    LinkStatus ApplyToTopology(const std::vector<LinkUpdate>& updates,
                               uint32_t* failedIndex = nullptr);

    /**
     * \brief Apply the edits and run the engine on the existing tables.
     *
     * \param updates the edits, in application order
     * \param distances the distance table left by the previous phase
     * \param routes the routing table left by the previous phase
     * \param lastRound the round number of the most recently reported table
     * \param result set to the outcome of the re-convergence phase
     * \return LinkStatus::OK, or the reason the batch was rejected (no sweep is run)
     */
    LinkStatus Apply(const std::vector<LinkUpdate>& updates,
                     DistanceTable& distances,
                     RoutingTable& routes,
                     uint32_t lastRound,
                     ConvergenceResult& result);

    /**
     * \return the counts of the last batch applied
     */
    UpdateCounts GetLastCounts() const;

  protected:
    void DoDispose() override;

  private:
    Ptr<Topology> m_topology;        //!< topology edited in place
    Ptr<ConvergenceEngine> m_engine; //!< engine run after the edits
    UpdateCounts m_lastCounts;       //!< counts of the last batch
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_UPDATE_APPLIER_H */
