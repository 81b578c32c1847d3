#pragma once

#include <string>
#include <tuple>
#include <vector>

#include "header.h"
#include "road.h"
#include "junction.h"
#include "signal.h"
#include "additional_data.h"

namespace XodrCodec
{
    // An id reference that does not resolve inside the document
    struct DanglingReference
    {
        std::string path;   // element holding the reference
        std::string field;  // attribute name
        std::string id;

        bool operator==(const DanglingReference& o) const
        {
            return std::tie(path, field, id) == std::tie(o.path, o.field, o.id);
        }
    };

    struct Document
    {
        Header header;
        std::vector<Road> roads;
        std::vector<Controller> controllers;
        std::vector<Junction> junctions;
        std::vector<JunctionGroup> junctionGroups;
        std::vector<Station> stations;
        AdditionalData extra;

        // nullptr if absent
        Road* FindRoad(const std::string& id);
        const Road* FindRoad(const std::string& id) const;
        Junction* FindJunction(const std::string& id);
        const Junction* FindJunction(const std::string& id) const;
        Controller* FindController(const std::string& id);
        const Controller* FindController(const std::string& id) const;

        /*Network-wide reference check, never run by the reader.
        * Covers road links, road@junction, junction connections / priorities / controllers,
        * controller controls, signal position roads, junction group members, railroad switch
        * tracks and station platform segments.
        */
        std::vector<DanglingReference> FindDanglingReferences() const;

        bool operator==(const Document& o) const
        {
            return std::tie(header, roads, controllers, junctions, junctionGroups, stations, extra) ==
                std::tie(o.header, o.roads, o.controllers, o.junctions, o.junctionGroups, o.stations, o.extra);
        }
        bool operator!=(const Document& o) const { return !(*this == o); }
    };
}
