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

#include "ns3/core-module.h"
#include "ns3/dvsim-module.h"

#include <iostream>
#include <string>

/**
 * \file
 *
 * Distance-vector routing simulation.
 *
 * Reads the router list, the initial links and the queued link updates from
 * standard input (or --input), converges the distance tables, applies the
 * updates and converges again.  Every round's distance tables and the routing
 * tables after each phase are written to standard output.
 *
 * Example input:
 *
 *     A
 *     B
 *     C
 *     START
 *     A B 1
 *     B C 1
 *     UPDATE
 *     A C 1
 *     END
 *
 * With the default --infinity=0 any cost above the sum of all link costs is
 * unreachable, so a removed route usually disappears within a sweep or two.
 * Pass a fixed infinity such as --infinity=16 to watch stale costs count up
 * round by round after a link removal.
 *
 * Exit status is 0 on success, 1 if a phase did not converge within
 * --maxRounds sweeps, 2 on an input error and 3 on an unexpected failure.
 */

using namespace ns3;

NS_LOG_COMPONENT_DEFINE("DvRoutingExample");

int
main(int argc, char* argv[])
{
    std::string input;
    uint32_t maxRounds = 1000;
    uint32_t infinity = 0;
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.AddValue("input", "Simulation input file; standard input if empty", input);
    cmd.AddValue("maxRounds", "Sweeps per phase before giving up", maxRounds);
    cmd.AddValue("infinity",
                 "Smallest cost treated as unreachable; 0 derives it from the topology, "
                 "16 shows the full count to infinity",
                 infinity);
    cmd.AddValue("verbose", "Log the engine and update decisions if true", verbose);
    cmd.Parse(argc, argv);

    if (verbose)
    {
        LogComponentEnable("DvRoutingExample", LOG_LEVEL_INFO);
        LogComponentEnable("DvConvergenceEngine", LOG_LEVEL_LOGIC);
        LogComponentEnable("DvUpdateApplier", LOG_LEVEL_INFO);
        LogComponentEnable("DvSimulation", LOG_LEVEL_INFO);
    }

    if (maxRounds == 0)
    {
        std::cerr << "--maxRounds must be positive" << std::endl;
        return 2;
    }

    try
    {
        DvSimulationHelper helper;
        helper.SetEngineAttribute("MaxRounds", UintegerValue(maxRounds));
        helper.SetEngineAttribute("InfinityMetric", UintegerValue(infinity));

        std::string error;
        Ptr<dvsim::DvSimulation> sim;
        if (input.empty())
        {
            sim = helper.Create(std::cin, &error);
        }
        else
        {
            sim = helper.CreateFromFile(input, &error);
        }
        if (!sim)
        {
            std::cerr << "input error: " << error << std::endl;
            return 2;
        }

        NS_LOG_INFO("Running " << sim->GetRouterSet().GetNRouters() << " routers");
        bool converged = sim->Run(std::cout);
        sim->Dispose();
        Simulator::Destroy();
        return converged ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << std::endl;
        return 3;
    }
}
