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

#ifndef DV_TOPOLOGY_H
#define DV_TOPOLOGY_H

#include "dv-cost.h"

#include "ns3/object.h"

#include <map>
#include <ostream>
#include <vector>

namespace ns3
{
namespace dvsim
{

const int64_t DELETE_LINK = -1; //!< cost value requesting removal of a link

/**
 * \brief Outcome of a topology mutation.
 */
enum class LinkStatus
{
    OK,             //!< the link was set, changed or removed
    INVALID_COST,   //!< cost is 0, below -1, or not below DISTINFINITY
    UNKNOWN_ROUTER, //!< an endpoint index is out of range
    SELF_LOOP,      //!< both endpoints are the same router
};

/**
 * \brief Stream insertion operator.
 *
 * \param os the output stream
 * \param status the status
 * \returns the output stream
 */
std::ostream& operator<<(std::ostream& os, LinkStatus status);

/**
 * \ingroup dvsim
 * \brief Undirected weighted links between the routers of a simulation.
 *
 * Only direct links are stored.  Every link is kept in both directions with
 * the same cost and no router is ever linked to itself.  The set of routers
 * is fixed when the object is sized; only links change afterwards.
 */
class Topology : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();

    Topology();
    ~Topology() override;

    // Delete copy constructor and assignment operator to avoid misuse.
    Topology(const Topology&) = delete;
    Topology& operator=(const Topology&) = delete;

    /**
     * \brief Size the topology for \p nRouters routers and drop every link.
     * \param nRouters the number of routers
     */
    void SetNRouters(uint32_t nRouters);

    uint32_t GetNRouters() const;

    /**
     * \brief Check whether SetLink would accept the arguments.
     *
     * \param a first endpoint
     * \param b second endpoint
     * \param cost link cost, or DELETE_LINK
     * \return LinkStatus::OK if SetLink (a, b, cost) would succeed
     */
    LinkStatus CheckLink(uint32_t a, uint32_t b, int64_t cost) const;

    /**
     * \brief Add, overwrite or remove the link between \p a and \p b.
     *
     * A positive cost sets the link in both directions.  DELETE_LINK removes
     * it; removing a link that does not exist is not an error.
     *
     * \param a first endpoint
     * \param b second endpoint
     * \param cost link cost, or DELETE_LINK
     * \return LinkStatus::OK, or the reason the request was rejected
     */
    LinkStatus SetLink(uint32_t a, uint32_t b, int64_t cost);

    /**
     * \brief Remove the link between \p a and \p b if it exists.
     *
     * Same as SetLink (a, b, DELETE_LINK).
     *
     * \param a first endpoint
     * \param b second endpoint
     * \return LinkStatus::OK, or the reason the request was rejected
     */
    LinkStatus RemoveLink(uint32_t a, uint32_t b);

    bool HasLink(uint32_t a, uint32_t b) const;

    /**
     * \return the cost of the direct link between \p a and \p b, or
     * DISTINFINITY when they are not linked
     */
    uint32_t GetCost(uint32_t a, uint32_t b) const;

    /**
     * \brief The routers directly linked to \p node.
     *
     * The map is ordered by router index and reflects later mutations.
     *
     * \param node a router index
     * \return map of neighbor index to link cost
     */
    const std::map<uint32_t, uint32_t>& GetNeighbors(uint32_t node) const;

    /**
     * \return the number of undirected links
     */
    uint32_t GetNLinks() const;

    /**
     * \return the sum of the costs of all undirected links
     */
    uint64_t GetTotalCost() const;

  private:
    typedef std::map<uint32_t, uint32_t> AdjacencyMap_t; //!< neighbor index to cost
    std::vector<AdjacencyMap_t> m_adjacency;              //!< one map per router
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_TOPOLOGY_H */
