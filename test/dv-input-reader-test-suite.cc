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

#include "ns3/dvsim-module.h"
#include "ns3/test.h"

#include <optional>
#include <sstream>
#include <string>

using namespace ns3;
using namespace ns3::dvsim;

namespace
{

std::optional<DvInput>
Parse(const std::string& text, std::string* error)
{
    std::istringstream is(text);
    return ReadDvInput(is, error);
}

} // namespace

/**
 * \ingroup dvsim-tests
 * Well-formed inputs
 */
class DvInputReaderTestCase : public TestCase
{
  public:
    DvInputReaderTestCase();

  private:
    void DoRun() override;
};

DvInputReaderTestCase::DvInputReaderTestCase()
    : TestCase("Input reader accepts the three-block format")
{
}

void
DvInputReaderTestCase::DoRun()
{
    std::string error;
    std::optional<DvInput> input =
        Parse("Y\r\n\nX\n  Z  \nSTART\nX Y 4\n\nY Z 2\nX Y -1\nUPDATE\nX Z 7\nEND\nnot parsed\n",
              &error);
    NS_TEST_ASSERT_MSG_EQ(input.has_value(), true, "valid input rejected: " << error);
    NS_TEST_ASSERT_MSG_EQ(input->routers.size(), 3, "router count");
    NS_TEST_ASSERT_MSG_EQ(input->routers[0], "Y", "routers keep declaration order");
    NS_TEST_ASSERT_MSG_EQ(input->routers[2], "Z", "labels are trimmed");
    NS_TEST_ASSERT_MSG_EQ(input->links.size(), 3, "link count");
    NS_TEST_ASSERT_MSG_EQ(input->links[1].cost, 2, "link cost");
    NS_TEST_ASSERT_MSG_EQ(input->links[1].line, 8, "line numbers count blank lines");
    NS_TEST_ASSERT_MSG_EQ(input->links[2].cost, -1, "-1 is kept as a deletion");
    NS_TEST_ASSERT_MSG_EQ(input->updates.size(), 1, "update count");
    NS_TEST_ASSERT_MSG_EQ(input->updates[0].dest, "Z", "update destination");

    // dense indices follow the sorted labels
    RouterSet routers(input->routers);
    NS_TEST_ASSERT_MSG_EQ(routers.GetIndex("X"), 0, "X sorts first");
    NS_TEST_ASSERT_MSG_EQ(routers.GetLabel(2), "Z", "Z sorts last");
    NS_TEST_ASSERT_MSG_EQ(routers.GetIndex("W"), NO_ROUTER, "undeclared label");

    // a deletion in the initial block removes the earlier declaration
    DvSimulationHelper helper;
    Ptr<DvSimulation> sim = helper.Create(*input, &error);
    NS_TEST_ASSERT_MSG_EQ(bool(sim), true, "setup failed: " << error);
    NS_TEST_ASSERT_MSG_EQ(sim->GetTopology()->GetNLinks(), 1, "X-Y was deleted");
    NS_TEST_ASSERT_MSG_EQ(sim->GetTopology()->GetCost(1, 2), 2, "Y-Z kept");

    std::optional<DvInput> empty = Parse("A\nB\nSTART\nUPDATE\nEND", &error);
    NS_TEST_ASSERT_MSG_EQ(empty.has_value(), true, "routers without links rejected: " << error);
    NS_TEST_ASSERT_MSG_EQ(empty->links.empty(), true, "no links expected");
}

/**
 * \ingroup dvsim-tests
 * Malformed inputs are rejected with the offending line
 */
class DvInputErrorTestCase : public TestCase
{
  public:
    DvInputErrorTestCase();

  private:
    void DoRun() override;

    /**
     * Check that \p text is rejected with a message containing \p expected.
     * \param text the input
     * \param expected a fragment of the error message
     */
    void CheckRejected(const std::string& text, const std::string& expected);
};

DvInputErrorTestCase::DvInputErrorTestCase()
    : TestCase("Input reader reports malformed input")
{
}

void
DvInputErrorTestCase::CheckRejected(const std::string& text, const std::string& expected)
{
    std::string error;
    std::optional<DvInput> input = Parse(text, &error);
    NS_TEST_ASSERT_MSG_EQ(input.has_value(), false, "accepted: " << text);
    NS_TEST_ASSERT_MSG_NE(error.find(expected),
                          std::string::npos,
                          "error \"" << error << "\" does not mention \"" << expected << "\"");
}

void
DvInputErrorTestCase::DoRun()
{
    const std::string head = "A\nB\nSTART\n";

    CheckRejected(head + "A B\nUPDATE\nEND\n", "line 4: expected \"src dest cost\", got 2");
    CheckRejected(head + "A B 1 2\nUPDATE\nEND\n", "got 4 tokens");
    CheckRejected(head + "A B x\nUPDATE\nEND\n", "line 4: cost \"x\" is not an integer");
    CheckRejected(head + "A B 1.5\nUPDATE\nEND\n", "is not an integer");
    CheckRejected(head + "A Z 1\nUPDATE\nEND\n", "line 4: unknown router \"Z\"");
    CheckRejected(head + "A A 1\nUPDATE\nEND\n", "to itself");
    CheckRejected(head + "A B 0\nUPDATE\nEND\n", "invalid cost 0");
    CheckRejected(head + "A B -2\nUPDATE\nEND\n", "invalid cost -2");
    CheckRejected(head + "A B 99999999999\nUPDATE\nEND\n", "invalid cost 99999999999");
    CheckRejected(head + "A B 1\nUPDATE\nB A zero\nEND\n", "line 6: cost \"zero\"");
    CheckRejected(head + "A B 1\nUPDATE\nA C 1\nEND\n", "unknown router \"C\"");
    CheckRejected(head + "A B 1\nUPDATE\n", "missing END");
    CheckRejected(head + "A B 1\n", "missing UPDATE");
    CheckRejected("A\nB\n", "missing START");
    CheckRejected("START\nUPDATE\nEND\n", "line 1: no routers declared");
    CheckRejected("A\nA\nSTART\nUPDATE\nEND\n", "line 2: router \"A\" declared twice");
    CheckRejected("A\nB C\nSTART\nUPDATE\nEND\n", "contains whitespace");
    CheckRejected("A\nUPDATE\nSTART\nUPDATE\nEND\n", "\"UPDATE\" is not a valid router label");

    std::string error;
    NS_TEST_ASSERT_MSG_EQ(ReadDvInputFile("/nonexistent/dvsim-input.txt", &error).has_value(),
                          false,
                          "missing file accepted");
    NS_TEST_ASSERT_MSG_NE(error.find("failed to open input"), std::string::npos, error);

    // inputs built by hand go through the same checks in Setup
    DvInput input;
    input.routers = {"A", "B"};
    input.links.push_back({"A", "C", 1, 1});
    DvSimulationHelper helper;
    NS_TEST_ASSERT_MSG_EQ(bool(helper.Create(input, &error)), false, "unknown router accepted");
    NS_TEST_ASSERT_MSG_NE(error.find("unknown router"), std::string::npos, error);

    input.links.clear();
    input.updates.push_back({"A", "B", 0, 7});
    NS_TEST_ASSERT_MSG_EQ(bool(helper.Create(input, &error)), false, "cost 0 update accepted");
    NS_TEST_ASSERT_MSG_NE(error.find("line 7"), std::string::npos, error);
}

/**
 * \ingroup dvsim-tests
 * Exact text of the printed tables
 */
class DvReportFormatTestCase : public TestCase
{
  public:
    DvReportFormatTestCase();

  private:
    void DoRun() override;
};

DvReportFormatTestCase::DvReportFormatTestCase()
    : TestCase("Distance and routing tables are printed in the report layout")
{
}

void
DvReportFormatTestCase::DoRun()
{
    NS_TEST_ASSERT_MSG_EQ(TablePrinter::FormatCost(DISTINFINITY), "INF", "infinity");
    NS_TEST_ASSERT_MSG_EQ(TablePrinter::FormatCost(12), "12", "finite cost");

    DvSimulationHelper helper;
    std::string error;
    std::istringstream pair("B\nA\nSTART\nA B 3\nUPDATE\nEND\n");
    Ptr<DvSimulation> sim = helper.Create(pair, &error);
    NS_TEST_ASSERT_MSG_EQ(bool(sim), true, "setup failed: " << error);

    std::ostringstream os;
    NS_TEST_ASSERT_MSG_EQ(sim->Run(os), true, "two routers must converge");
    const std::string expected = "\nDistance Table of router A at t=0:\n     B\nB    3\n"
                                 "\nDistance Table of router B at t=0:\n     A\nA    3\n"
                                 "\nDistance Table of router A at t=1:\n     B\nB    3\n"
                                 "\nDistance Table of router B at t=1:\n     A\nA    3\n"
                                 "\nRouting Table of router A:\nB,B,3\n"
                                 "\nRouting Table of router B:\nA,A,3\n";
    NS_TEST_ASSERT_MSG_EQ(os.str(), expected, "two-router report");

    std::istringstream line("A\nB\nC\nSTART\nA B 1\nB C 1\nUPDATE\nEND\n");
    Ptr<DvSimulation> lineSim = helper.Create(line, &error);
    NS_TEST_ASSERT_MSG_EQ(bool(lineSim), true, "setup failed: " << error);
    std::ostringstream round0;
    TablePrinter printer(lineSim->GetRouterSet());
    lineSim->RunInitialPhase();
    DistanceTable initial(3);
    initial.Initialize(*lineSim->GetTopology());
    printer.PrintDistanceTable(round0, 0, initial, 0);
    NS_TEST_ASSERT_MSG_EQ(round0.str(),
                          "\nDistance Table of router A at t=0:\n"
                          "     B    C\n"
                          "B    1    INF\n"
                          "C    INF    INF\n",
                          "three-router table with unreachable entries");

    std::ostringstream routes;
    printer.PrintRoutingTables(routes, lineSim->GetDistanceTable(), lineSim->GetRoutingTable());
    NS_TEST_ASSERT_MSG_EQ(routes.str(),
                          "\nRouting Table of router A:\nB,B,1\nC,B,2\n"
                          "\nRouting Table of router B:\nA,A,1\nC,C,1\n"
                          "\nRouting Table of router C:\nA,B,2\nB,B,1\n",
                          "converged routing tables");
}

/**
 * \ingroup dvsim-tests
 * Whole run with an update phase
 */
class DvEndToEndTestCase : public TestCase
{
  public:
    DvEndToEndTestCase();

  private:
    void DoRun() override;
};

DvEndToEndTestCase::DvEndToEndTestCase()
    : TestCase("Run prints both phases separated by the update marker")
{
}

void
DvEndToEndTestCase::DoRun()
{
    DvSimulationHelper helper;
    std::string error;
    std::istringstream is("A\nB\nC\nSTART\nA B 1\nB C 1\nUPDATE\nA C 1\nEND\n");
    Ptr<DvSimulation> sim = helper.Create(is, &error);
    NS_TEST_ASSERT_MSG_EQ(bool(sim), true, "setup failed: " << error);

    std::ostringstream os;
    NS_TEST_ASSERT_MSG_EQ(sim->Run(os), true, "both phases must converge");
    const std::string out = os.str();

    size_t marker = out.find("\nAPPLYING UPDATES\n");
    NS_TEST_ASSERT_MSG_NE(marker, std::string::npos, "missing update marker");
    NS_TEST_ASSERT_MSG_EQ(out.find("APPLYING UPDATES", marker + 2), std::string::npos, "one marker");

    const std::string before = out.substr(0, marker);
    const std::string after = out.substr(marker);
    NS_TEST_ASSERT_MSG_NE(before.find("Routing Table of router A:\nB,B,1\nC,B,2\n"),
                          std::string::npos,
                          "routes before the update");
    NS_TEST_ASSERT_MSG_NE(after.find("Routing Table of router A:\nB,B,1\nC,C,1\n"),
                          std::string::npos,
                          "routes after the update");
    NS_TEST_ASSERT_MSG_EQ(after.find("at t=0:"), std::string::npos, "rounds restart after updates");

    // rounds continue from the last round of the first phase
    std::ostringstream next;
    next << "Distance Table of router A at t=" << sim->GetRound() << ":";
    NS_TEST_ASSERT_MSG_NE(after.find(next.str()), std::string::npos, "last round printed");
    NS_TEST_ASSERT_MSG_EQ(out.find("DID NOT CONVERGE"), std::string::npos, "no failure line");
}

/**
 * \ingroup dvsim-tests
 * TestSuite for the input and report side of dvsim
 */
class DvInputTestSuite : public TestSuite
{
  public:
    DvInputTestSuite();
};

DvInputTestSuite::DvInputTestSuite()
    : TestSuite("dvsim-input", UNIT)
{
    AddTestCase(new DvInputReaderTestCase, TestCase::QUICK);
    AddTestCase(new DvInputErrorTestCase, TestCase::QUICK);
    AddTestCase(new DvReportFormatTestCase, TestCase::QUICK);
    AddTestCase(new DvEndToEndTestCase, TestCase::QUICK);
}

/**
 * \ingroup dvsim-tests
 * Static variable for test initialization
 */
static DvInputTestSuite sdvInputTestSuite;
