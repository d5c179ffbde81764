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

#include "dv-simulation-helper.h"

#include "ns3/dv-convergence-engine.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvSimulationHelper");

DvSimulationHelper::DvSimulationHelper()
{
    m_engineFactory.SetTypeId(dvsim::ConvergenceEngine::GetTypeId());
}

void
DvSimulationHelper::SetEngineAttribute(std::string name, const AttributeValue& value)
{
    m_engineFactory.Set(name, value);
}

Ptr<dvsim::DvSimulation>
DvSimulationHelper::Create(const dvsim::DvInput& input, std::string* error) const
{
    NS_LOG_FUNCTION(this);
    Ptr<dvsim::DvSimulation> sim = CreateObject<dvsim::DvSimulation>();
    sim->SetEngine(m_engineFactory.Create<dvsim::ConvergenceEngine>());
    if (!sim->Setup(input, error))
    {
        sim->Dispose();
        return nullptr;
    }
    return sim;
}

Ptr<dvsim::DvSimulation>
DvSimulationHelper::Create(std::istream& is, std::string* error) const
{
    NS_LOG_FUNCTION(this);
    std::optional<dvsim::DvInput> input = dvsim::ReadDvInput(is, error);
    if (!input)
    {
        return nullptr;
    }
    return Create(*input, error);
}

Ptr<dvsim::DvSimulation>
DvSimulationHelper::CreateFromFile(const std::string& path, std::string* error) const
{
    NS_LOG_FUNCTION(this << path);
    std::optional<dvsim::DvInput> input = dvsim::ReadDvInputFile(path, error);
    if (!input)
    {
        return nullptr;
    }
    return Create(*input, error);
}

} // namespace ns3
