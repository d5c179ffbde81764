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

#include "dv-router-set.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvRouterSet");

namespace dvsim
{

RouterSet::RouterSet()
    : m_labels(),
      m_indices()
{
}

RouterSet::RouterSet(const std::vector<std::string>& labels)
    : m_labels(labels),
      m_indices()
{
    NS_LOG_FUNCTION(this << labels.size());
    std::sort(m_labels.begin(), m_labels.end());
    for (uint32_t i = 0; i < m_labels.size(); i++)
    {
        bool inserted = m_indices.insert(std::make_pair(m_labels[i], i)).second;
        NS_ASSERT_MSG(inserted, "duplicate router label " << m_labels[i]);
        NS_LOG_LOGIC("Router " << m_labels[i] << " has index " << i);
    }
}

uint32_t
RouterSet::GetNRouters() const
{
    return m_labels.size();
}

const std::string&
RouterSet::GetLabel(uint32_t index) const
{
    NS_ASSERT_MSG(index < m_labels.size(), "router index " << index << " out of range");
    return m_labels[index];
}

uint32_t
RouterSet::GetIndex(const std::string& label) const
{
    auto it = m_indices.find(label);
    if (it == m_indices.end())
    {
        return NO_ROUTER;
    }
    return it->second;
}

} // namespace dvsim
} // namespace ns3
