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

#ifndef DV_TABLE_PRINTER_H
#define DV_TABLE_PRINTER_H

#include "dv-distance-table.h"
#include "dv-router-set.h"
#include "dv-routing-table.h"

#include <ostream>
#include <string>

namespace ns3
{
namespace dvsim
{

/**
 * \ingroup dvsim
 * \brief Formats table snapshots as the fixed-width console report.
 *
 * Routers are printed in ascending label order and every block starts with
 * an empty line.  A distance table block has one row per other router and
 * one column per destination, with unreachable costs shown as "INF".  A
 * routing table block has one "dest,next_hop,cost" line per reachable
 * destination.
 */
class TablePrinter
{
  public:
    /**
     * \param routers the labels used for every router index; must outlive the printer
     */
    explicit TablePrinter(const RouterSet& routers);

    /**
     * \brief Print the distance table of every router.
     *
     * \param os the output stream
     * \param round the round the snapshot belongs to
     * \param table the snapshot
     */
    void PrintDistanceTables(std::ostream& os, uint32_t round, const DistanceTable& table) const;

    /**
     * \brief Print the distance table of one router.
     *
     * \param os the output stream
     * \param round the round the snapshot belongs to
     * \param table the snapshot
     * \param node the router
     */
    void PrintDistanceTable(std::ostream& os,
                            uint32_t round,
                            const DistanceTable& table,
                            uint32_t node) const;

    /**
     * \brief Print the routing table of every router.
     *
     * The cost of each route is the router's selected cost, read from the
     * own row of \p distances.
     *
     * \param os the output stream
     * \param distances the distance table the routes were derived from
     * \param routes the routing table
     */
    void PrintRoutingTables(std::ostream& os,
                            const DistanceTable& distances,
                            const RoutingTable& routes) const;

    /**
     * \param cost a cost
     * \return the cost as printed, "INF" for DISTINFINITY
     */
    static std::string FormatCost(uint32_t cost);

  private:
    const RouterSet& m_routers; //!< index to label mapping
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_TABLE_PRINTER_H */
