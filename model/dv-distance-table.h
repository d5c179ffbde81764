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

#ifndef DV_DISTANCE_TABLE_H
#define DV_DISTANCE_TABLE_H

#include "dv-cost.h"

#include <cstddef>
#include <vector>

namespace ns3
{
namespace dvsim
{

class Topology;

/**
 * \ingroup dvsim
 * \brief Per-router, per-neighbor, per-destination cost estimates.
 *
 * Entry (node, via, dest) is the cost \p node believes it would pay to reach
 * \p dest by forwarding through \p via.  The row via == node holds the
 * router's own best estimate for each destination; it is what the router
 * advertises to its neighbors.  Entries with dest == node are unused.
 *
 * The table is a dense N x N x N matrix over router indices.  Copying it is
 * how the convergence engine takes a snapshot of the previous round.
 */
class DistanceTable
{
  public:
    DistanceTable();

    /**
     * \brief Create a table with every entry unreachable.
     * \param nRouters the number of routers
     */
    explicit DistanceTable(uint32_t nRouters);

    uint32_t GetNRouters() const;

    /**
     * \brief Reset the table to the direct links of \p topology.
     *
     * For every link n-k both (n, k, k) and the own-row entry (n, n, k) get
     * the link cost; everything else becomes unreachable.
     *
     * \param topology the current topology; must have the same router count
     */
    void Initialize(const Topology& topology);

    /**
     * \param node the router owning the table
     * \param via the neighbor row
     * \param dest the destination column
     * \return the cost, or DISTINFINITY
     */
    uint32_t Get(uint32_t node, uint32_t via, uint32_t dest) const;

    void Set(uint32_t node, uint32_t via, uint32_t dest, uint32_t cost);

    /**
     * \brief The best estimate \p node currently holds for \p dest.
     *
     * This is the minimum over all of the router's rows, i.e. the aggregate
     * value a neighbor learns from \p node.
     *
     * \param node the advertising router
     * \param dest the destination
     * \return the minimum finite entry, or DISTINFINITY
     */
    uint32_t GetBestEstimate(uint32_t node, uint32_t dest) const;

    bool operator==(const DistanceTable& other) const;

  private:
    /**
     * \return the position of entry (node, via, dest) in m_costs
     */
    size_t Index(uint32_t node, uint32_t via, uint32_t dest) const;

    uint32_t m_nRouters;          //!< number of routers
    std::vector<uint32_t> m_costs; //!< node-major N x N x N cost matrix
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_DISTANCE_TABLE_H */
