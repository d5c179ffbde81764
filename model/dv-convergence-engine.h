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

#ifndef DV_CONVERGENCE_ENGINE_H
#define DV_CONVERGENCE_ENGINE_H

#include "dv-distance-table.h"
#include "dv-routing-table.h"
#include "dv-topology.h"

#include "ns3/object.h"
#include "ns3/ptr.h"
#include "ns3/traced-callback.h"

namespace ns3
{
namespace dvsim
{

/**
 * \brief Outcome of one convergence phase.
 */
struct ConvergenceResult
{
    bool converged;     //!< true if a sweep produced no change within the round bound
    uint32_t sweeps;    //!< number of sweeps run in this phase
    uint32_t lastRound; //!< round number of the last reported table
};

/**
 * \ingroup dvsim
 * \brief Synchronous distance-vector relaxation.
 *
 * Each sweep recomputes, for every router n and destination d, the cost of
 * reaching d through every other router k as cost(n, k) plus the best
 * estimate k held for d in the previous round.  All routers read the same
 * snapshot and the new table replaces the old one only when the sweep is
 * complete.  Rows of routers that are not selected, or not even linked, are
 * rewritten as well, so a later link change can surface them without a reset.
 *
 * The selected cost for (n, d) is stored in the own row (n, n, d).  The
 * selected next hop keeps its previous value while it still achieves the
 * minimum; otherwise the lowest-indexed router achieving it wins.
 *
 * Plain distance-vector behaviour is reproduced on purpose: after a link
 * failure stale costs count upwards until they pass the metric ceiling.
 * There is no split horizon or poison reverse.
 */
class ConvergenceEngine : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();

    ConvergenceEngine();
    ~ConvergenceEngine() override;

    /**
     * TracedCallback signature for round reports.
     *
     * \param [in] round the round number, 0 for the initial table
     * \param [in] table the distance table after that round
     */
    typedef void (*RoundCompleteCallback)(uint32_t round, const DistanceTable& table);

    /**
     * \brief Set the topology read by every sweep.
     *
     * The topology is not copied; later mutations are seen by the next sweep.
     *
     * \param topology the topology
     */
    void SetTopology(Ptr<const Topology> topology);

    Ptr<const Topology> GetTopology() const;

    /**
     * \brief Fill both tables from the direct links of the topology and report
     * them as round 0.
     *
     * \param distances the distance table to initialize
     * \param routes the routing table to initialize
     */
    void InitializeTables(DistanceTable& distances, RoutingTable& routes);

    /**
     * \brief Run one synchronous relaxation sweep.
     *
     * \param distances the table of the previous round; replaced by the new one
     * \param routes the routing table of the previous round; replaced by the new one
     * \return true if any selected cost or next hop changed
     */
    bool Sweep(DistanceTable& distances, RoutingTable& routes) const;

    /**
     * \brief Sweep until a round produces no change or the round bound is hit.
     *
     * The tables are used as they are; nothing is reinitialized.  Every sweep
     * is reported through the RoundComplete trace, numbered from
     * \p lastRound + 1.
     *
     * \param distances the distance table to converge
     * \param routes the routing table to converge
     * \param lastRound the round number of the most recently reported table
     * \return the outcome of the phase
     */
    ConvergenceResult Converge(DistanceTable& distances,
                               RoutingTable& routes,
                               uint32_t lastRound = 0);

    /**
     * \brief The largest cost still considered reachable.
     *
     * When InfinityMetric is 0 this is the sum of all current link costs,
     * since no loop-free path can cost more.  Otherwise it is
     * InfinityMetric - 1.
     *
     * \return the metric ceiling
     */
    uint32_t GetMetricCeiling() const;

  protected:
    void DoDispose() override;

  private:
    Ptr<const Topology> m_topology; //!< links read by every sweep
    uint32_t m_maxRounds;           //!< round bound per Converge call
    uint32_t m_infinityMetric;      //!< first unreachable cost, 0 for automatic

    /// Fired with the table of round 0 and after every sweep.
    TracedCallback<uint32_t, const DistanceTable&> m_roundCompleteTrace;
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_CONVERGENCE_ENGINE_H */
