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

#ifndef DV_ROUTING_TABLE_H
#define DV_ROUTING_TABLE_H

#include "dv-router-set.h"

#include <stdint.h>
#include <vector>

namespace ns3
{
namespace dvsim
{

class Topology;

/**
 * \ingroup dvsim
 * \brief Per-router, per-destination selected next hop.
 *
 * The table is derived from the DistanceTable by the convergence engine and
 * is never edited on its own.  An entry is NO_ROUTER while the destination
 * has no finite cost.
 */
class RoutingTable
{
  public:
    RoutingTable();

    /**
     * \brief Create a table without any next hop.
     * \param nRouters the number of routers
     */
    explicit RoutingTable(uint32_t nRouters);

    uint32_t GetNRouters() const;

    /**
     * \brief Reset the table so each router reaches its direct neighbors
     * through themselves and nothing else.
     *
     * \param topology the current topology; must have the same router count
     */
    void Initialize(const Topology& topology);

    /**
     * \param node the router owning the entry
     * \param dest the destination
     * \return the next hop, or NO_ROUTER
     */
    uint32_t GetNextHop(uint32_t node, uint32_t dest) const;

    void SetNextHop(uint32_t node, uint32_t dest, uint32_t nextHop);

    bool operator==(const RoutingTable& other) const;

  private:
    uint32_t m_nRouters;             //!< number of routers
    std::vector<uint32_t> m_nextHop; //!< node-major N x N next hop matrix
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_ROUTING_TABLE_H */
