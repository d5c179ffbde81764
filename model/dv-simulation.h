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

#ifndef DV_SIMULATION_H
#define DV_SIMULATION_H

#include "dv-convergence-engine.h"
#include "dv-distance-table.h"
#include "dv-input-reader.h"
#include "dv-router-set.h"
#include "dv-routing-table.h"
#include "dv-table-printer.h"
#include "dv-topology.h"
#include "dv-update-applier.h"

#include "ns3/object.h"
#include "ns3/ptr.h"

#include <ostream>
#include <string>
#include <vector>

namespace ns3
{
namespace dvsim
{

/**
 * \ingroup dvsim
 * \brief One distance-vector simulation run.
 *
 * Owns the router set, the topology, both tables, the engine and the update
 * applier.  A run has two phases: the tables are initialized from the direct
 * links and converged, then the queued updates are applied to the topology
 * and the engine continues from the tables as they are.  Round numbers keep
 * counting across both phases.
 *
 * Independent simulations share no state.
 */
class DvSimulation : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();

    DvSimulation();
    ~DvSimulation() override;

    /**
     * \brief Use \p engine instead of a default-constructed one.
     *
     * Must be called before Setup.  An engine serves one simulation at a
     * time; it is released again when that simulation is disposed.
     *
     * \param engine the engine, usually configured through attributes
     */
    void SetEngine(Ptr<ConvergenceEngine> engine);

    /**
     * \brief Build the router set, topology and queued updates from \p input.
     *
     * Initial links are applied in order; a -1 cost removes a link declared
     * earlier in the block.
     *
     * \param input the parsed input
     * \param error if not null, receives the reason for a failure
     * \return true on success
     */
    bool Setup(const DvInput& input, std::string* error);

    /**
     * \brief Initialize the tables (round 0) and converge them.
     * \return the outcome of the phase
     */
    ConvergenceResult RunInitialPhase();

    /**
     * \brief Apply \p updates and converge again from the current tables.
     *
     * \param updates the edits, in application order
     * \param result set to the outcome of the phase
     * \return LinkStatus::OK, or the reason the batch was rejected
     */
    LinkStatus ApplyUpdates(const std::vector<LinkUpdate>& updates, ConvergenceResult& result);

    /**
     * \brief Run both phases and write the full report.
     *
     * Distance tables are printed for every round, routing tables after each
     * phase, and "APPLYING UPDATES" between the phases when there are queued
     * updates.  A phase that hits the round bound is reported with a
     * "DID NOT CONVERGE" line.
     *
     * \param os the output stream
     * \return true if every phase converged
     */
    bool Run(std::ostream& os);

    const RouterSet& GetRouterSet() const;
    Ptr<Topology> GetTopology() const;
    Ptr<ConvergenceEngine> GetEngine() const;
    const DistanceTable& GetDistanceTable() const;
    const RoutingTable& GetRoutingTable() const;
    const std::vector<LinkUpdate>& GetQueuedUpdates() const;

    /**
     * \return the round number of the most recently reported table
     */
    uint32_t GetRound() const;

    /**
     * \brief The selected cost from one router to another.
     *
     * \param src source label
     * \param dest destination label
     * \return the cost, or DISTINFINITY
     */
    uint32_t GetRouteCost(const std::string& src, const std::string& dest) const;

    /**
     * \brief The selected next hop from one router to another.
     *
     * \param src source label
     * \param dest destination label
     * \return the next hop label, or an empty string if \p dest is unreachable
     */
    std::string GetNextHop(const std::string& src, const std::string& dest) const;

  protected:
    void DoDispose() override;

  private:
    /**
     * \brief RoundComplete trace sink; prints the snapshot while a report is
     * being written.
     *
     * \param round the round number
     * \param table the snapshot
     */
    void ReportRound(uint32_t round, const DistanceTable& table);

    /**
     * \brief Write the outcome line for a phase that hit the round bound.
     */
    void ReportNotConverged(std::ostream& os, const ConvergenceResult& result) const;

    RouterSet m_routers;               //!< routers of this run
    TablePrinter m_printer;            //!< formats the report, reads m_routers
    Ptr<Topology> m_topology;          //!< current links
    Ptr<ConvergenceEngine> m_engine;   //!< relaxation
    Ptr<UpdateApplier> m_applier;      //!< applies the queued updates
    DistanceTable m_distances;         //!< current distance tables
    RoutingTable m_routes;             //!< current routing tables
    std::vector<LinkUpdate> m_updates; //!< updates read from the input
    uint32_t m_round;                  //!< last reported round
    bool m_setup;                      //!< Setup succeeded
    std::ostream* m_output;            //!< report stream while Run is active
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_SIMULATION_H */
