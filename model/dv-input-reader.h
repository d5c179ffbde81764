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

#ifndef DV_INPUT_READER_H
#define DV_INPUT_READER_H

#include <istream>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

namespace ns3
{
namespace dvsim
{

/**
 * \brief A link triple as written in the input, before index resolution.
 */
struct LinkSpec
{
    std::string src;  //!< first router label
    std::string dest; //!< second router label
    int64_t cost;     //!< link cost, or -1 for "no link"
    uint32_t line;    //!< line number the triple was read from
};

/**
 * \brief Everything read from one simulation input.
 */
struct DvInput
{
    std::vector<std::string> routers; //!< labels in declaration order
    std::vector<LinkSpec> links;      //!< initial topology, applied in order
    std::vector<LinkSpec> updates;    //!< edits applied after the first convergence
};

/**
 * \ingroup dvsim
 * \brief Read the three-block simulation input.
 *
 * The input is a list of router labels terminated by a line "START", then
 * "src dest cost" triples terminated by "UPDATE", then update triples
 * terminated by "END".  Blank lines are skipped; anything after "END" is
 * ignored.  Costs are positive integers or -1 ("no link" / delete).
 *
 * \param is the stream to read
 * \param error if not null, receives a message naming the offending line
 * \return the parsed input, or std::nullopt on the first error
 */
std::optional<DvInput> ReadDvInput(std::istream& is, std::string* error);

/**
 * \brief Read the simulation input from a file.
 *
 * \param path the file name
 * \param error if not null, receives the reason for a failure
 * \return the parsed input, or std::nullopt
 */
std::optional<DvInput> ReadDvInputFile(const std::string& path, std::string* error);

} // namespace dvsim
} // namespace ns3

#endif /* DV_INPUT_READER_H */
