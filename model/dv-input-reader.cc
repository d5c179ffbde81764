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

#include "dv-input-reader.h"

#include "dv-cost.h"

#include "ns3/log.h"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("DvInputReader");

namespace dvsim
{
namespace
{

const char* const ROUTERS_END = "START";
const char* const LINKS_END = "UPDATE";
const char* const UPDATES_END = "END";

std::string
Trim(const std::string& s)
{
    const char* space = " \t\r\n";
    size_t first = s.find_first_not_of(space);
    if (first == std::string::npos)
    {
        return "";
    }
    size_t last = s.find_last_not_of(space);
    return s.substr(first, last - first + 1);
}

std::vector<std::string>
Tokenize(const std::string& line)
{
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

bool
IsKeyword(const std::string& s)
{
    return s == ROUTERS_END || s == LINKS_END || s == UPDATES_END;
}

std::optional<int64_t>
ParseCost(const std::string& s)
{
    try
    {
        size_t pos = 0;
        long long value = std::stoll(s, &pos);
        if (pos != s.size())
        {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    catch (const std::invalid_argument&)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
}

bool
Fail(std::string* error, uint32_t lineNo, const std::string& what)
{
    std::string msg = "line " + std::to_string(lineNo) + ": " + what;
    NS_LOG_ERROR(msg);
    if (error != nullptr)
    {
        *error = msg;
    }
    return false;
}

bool
ParseTriple(const std::string& line,
            uint32_t lineNo,
            const std::set<std::string>& routers,
            LinkSpec& spec,
            std::string* error)
{
    std::vector<std::string> tokens = Tokenize(line);
    if (tokens.size() != 3)
    {
        return Fail(error,
                    lineNo,
                    "expected \"src dest cost\", got " + std::to_string(tokens.size()) +
                        " tokens");
    }
    for (uint32_t i = 0; i < 2; i++)
    {
        if (routers.find(tokens[i]) == routers.end())
        {
            return Fail(error, lineNo, "unknown router \"" + tokens[i] + "\"");
        }
    }
    if (tokens[0] == tokens[1])
    {
        return Fail(error, lineNo, "link from router \"" + tokens[0] + "\" to itself");
    }
    std::optional<int64_t> cost = ParseCost(tokens[2]);
    if (!cost)
    {
        return Fail(error, lineNo, "cost \"" + tokens[2] + "\" is not an integer");
    }
    if (*cost != -1 && (*cost <= 0 || *cost >= static_cast<int64_t>(DISTINFINITY)))
    {
        return Fail(error,
                    lineNo,
                    "invalid cost " + tokens[2] + " (expected a positive integer or -1)");
    }
    spec.src = tokens[0];
    spec.dest = tokens[1];
    spec.cost = *cost;
    spec.line = lineNo;
    return true;
}

} // namespace

std::optional<DvInput>
ReadDvInput(std::istream& is, std::string* error)
{
    NS_LOG_FUNCTION(&is);

    enum Block
    {
        ROUTERS,
        LINKS,
        UPDATES,
        DONE
    };

    DvInput input;
    std::set<std::string> declared;
    Block block = ROUTERS;
    std::string raw;
    uint32_t lineNo = 0;

    while (block != DONE && std::getline(is, raw))
    {
        ++lineNo;
        std::string line = Trim(raw);
        if (line.empty())
        {
            continue;
        }

        if (block == ROUTERS)
        {
            if (line == ROUTERS_END)
            {
                if (input.routers.empty())
                {
                    Fail(error, lineNo, "no routers declared before START");
                    return std::nullopt;
                }
                block = LINKS;
                continue;
            }
            if (Tokenize(line).size() != 1)
            {
                Fail(error, lineNo, "router label \"" + line + "\" contains whitespace");
                return std::nullopt;
            }
            if (IsKeyword(line))
            {
                Fail(error, lineNo, "\"" + line + "\" is not a valid router label");
                return std::nullopt;
            }
            if (!declared.insert(line).second)
            {
                Fail(error, lineNo, "router \"" + line + "\" declared twice");
                return std::nullopt;
            }
            input.routers.push_back(line);
            continue;
        }

        const char* terminator = (block == LINKS) ? LINKS_END : UPDATES_END;
        if (line == terminator)
        {
            block = (block == LINKS) ? UPDATES : DONE;
            continue;
        }

        LinkSpec spec;
        if (!ParseTriple(line, lineNo, declared, spec, error))
        {
            return std::nullopt;
        }
        (block == LINKS ? input.links : input.updates).push_back(spec);
    }

    if (block != DONE)
    {
        const char* missing =
            (block == ROUTERS) ? ROUTERS_END : ((block == LINKS) ? LINKS_END : UPDATES_END);
        Fail(error, lineNo, std::string("unexpected end of input, missing ") + missing);
        return std::nullopt;
    }

    NS_LOG_INFO("Read " << input.routers.size() << " routers, " << input.links.size()
                        << " links, " << input.updates.size() << " updates");
    return input;
}

std::optional<DvInput>
ReadDvInputFile(const std::string& path, std::string* error)
{
    NS_LOG_FUNCTION(path);
    std::ifstream in(path);
    if (!in)
    {
        std::string msg = "failed to open input: " + path;
        NS_LOG_ERROR(msg);
        if (error != nullptr)
        {
            *error = msg;
        }
        return std::nullopt;
    }
    return ReadDvInput(in, error);
}

} // namespace dvsim
} // namespace ns3
