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

#ifndef DV_COST_H
#define DV_COST_H

#include <stdint.h>

namespace ns3
{
namespace dvsim
{

const uint32_t DISTINFINITY = 0xffffffff; //!< "unreachable" cost between routers

/**
 * \brief Add two costs, treating DISTINFINITY as +infinity.
 *
 * The sum saturates: if it does not fit below DISTINFINITY the result is
 * DISTINFINITY.
 *
 * \param a first cost
 * \param b second cost
 * \return a + b, or DISTINFINITY
 */
inline uint32_t
AddCost(uint32_t a, uint32_t b)
{
    if (a == DISTINFINITY || b == DISTINFINITY)
    {
        return DISTINFINITY;
    }
    uint64_t sum = static_cast<uint64_t>(a) + b;
    if (sum >= DISTINFINITY)
    {
        return DISTINFINITY;
    }
    return static_cast<uint32_t>(sum);
}

} // namespace dvsim
} // namespace ns3

#endif /* DV_COST_H */
