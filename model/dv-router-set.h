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

#ifndef DV_ROUTER_SET_H
#define DV_ROUTER_SET_H

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

namespace ns3
{
namespace dvsim
{

const uint32_t NO_ROUTER = 0xffffffff; //!< index meaning "no router"

/**
 * \ingroup dvsim
 * \brief The fixed set of routers taking part in one simulation.
 *
 * Labels are sorted once at construction and from then on every router is
 * identified by its position in that order.  The topology, the tables and the
 * printed output all use this dense index, so ascending index order is also
 * ascending label order.
 */
class RouterSet
{
  public:
    RouterSet();

    /**
     * \brief Build the set from the declared labels.
     * \param labels router labels in any order; must not contain duplicates
     */
    explicit RouterSet(const std::vector<std::string>& labels);

    /**
     * \return the number of routers
     */
    uint32_t GetNRouters() const;

    /**
     * \param index a router index
     * \return the label of the router
     */
    const std::string& GetLabel(uint32_t index) const;

    /**
     * \param label a router label
     * \return the index of the router, or NO_ROUTER if the label was not declared
     */
    uint32_t GetIndex(const std::string& label) const;

  private:
    std::vector<std::string> m_labels;         //!< labels in index order
    std::map<std::string, uint32_t> m_indices; //!< label to index
};

} // namespace dvsim
} // namespace ns3

#endif /* DV_ROUTER_SET_H */
