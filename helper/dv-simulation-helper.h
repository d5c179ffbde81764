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

#ifndef DV_SIMULATION_HELPER_H
#define DV_SIMULATION_HELPER_H

#include "ns3/attribute.h"
#include "ns3/dv-input-reader.h"
#include "ns3/dv-simulation.h"
#include "ns3/object-factory.h"
#include "ns3/ptr.h"

#include <istream>
#include <string>

namespace ns3
{

/**
 * \ingroup dvsim
 *
 * \brief Helper class that creates ready-to-run dvsim::DvSimulation objects.
 *
 * The convergence engine of every simulation is created through an
 * ObjectFactory, so its attributes (MaxRounds, InfinityMetric) can be set
 * once on the helper.
 */
class DvSimulationHelper
{
  public:
    DvSimulationHelper();

    /**
     * \brief Set an attribute of the convergence engines created by this helper.
     *
     * \param name the attribute name
     * \param value the attribute value
     */
    void SetEngineAttribute(std::string name, const AttributeValue& value);

    /**
     * \brief Create a simulation from already parsed input.
     *
     * \param input the input
     * \param error if not null, receives the reason for a failure
     * \returns the simulation, or a null pointer if the input is inconsistent
     */
    Ptr<dvsim::DvSimulation> Create(const dvsim::DvInput& input, std::string* error) const;

    /**
     * \brief Parse the input protocol from \p is and create a simulation.
     *
     * \param is the stream to read
     * \param error if not null, receives the reason for a failure
     * \returns the simulation, or a null pointer on a parse or input error
     */
    Ptr<dvsim::DvSimulation> Create(std::istream& is, std::string* error) const;

    /**
     * \brief Parse the input protocol from a file and create a simulation.
     *
     * \param path the file name
     * \param error if not null, receives the reason for a failure
     * \returns the simulation, or a null pointer on a parse or input error
     */
    Ptr<dvsim::DvSimulation> CreateFromFile(const std::string& path, std::string* error) const;

  private:
    ObjectFactory m_engineFactory; //!< creates the convergence engines
};

} // namespace ns3

#endif /* DV_SIMULATION_HELPER_H */
