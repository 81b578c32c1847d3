#include "document.h"

#include <algorithm>
#include <set>

#include <fmt/format.h>

namespace
{
    template <typename T>
    T* FindByID(std::vector<T>& items, const std::string& id)
    {
        auto it = std::find_if(items.begin(), items.end(), [&id](const T& item) { return item.id == id; });
        return it == items.end() ? nullptr : &*it;
    }

    template <typename T>
    const T* FindByID(const std::vector<T>& items, const std::string& id)
    {
        auto it = std::find_if(items.begin(), items.end(), [&id](const T& item) { return item.id == id; });
        return it == items.end() ? nullptr : &*it;
    }

    template <typename T>
    std::set<std::string> IDSet(const std::vector<T>& items)
    {
        std::set<std::string> rtn;
        for (const auto& item : items)
        {
            rtn.insert(item.id);
        }
        return rtn;
    }
}

namespace XodrCodec
{
    Road* Document::FindRoad(const std::string& id) { return FindByID(roads, id); }
    const Road* Document::FindRoad(const std::string& id) const { return FindByID(roads, id); }
    Junction* Document::FindJunction(const std::string& id) { return FindByID(junctions, id); }
    const Junction* Document::FindJunction(const std::string& id) const { return FindByID(junctions, id); }
    Controller* Document::FindController(const std::string& id) { return FindByID(controllers, id); }
    const Controller* Document::FindController(const std::string& id) const { return FindByID(controllers, id); }

    std::vector<DanglingReference> Document::FindDanglingReferences() const
    {
        const auto roadIDs = IDSet(roads);
        const auto junctionIDs = IDSet(junctions);
        const auto controllerIDs = IDSet(controllers);

        std::set<std::string> signalIDs;
        for (const auto& road : roads)
        {
            if (road.signals)
            {
                for (const auto& signal : road.signals->signals)
                {
                    signalIDs.insert(signal.id);
                }
            }
        }

        std::vector<DanglingReference> rtn;
        auto expect = [&rtn](const std::set<std::string>& pool, const std::string& path,
            const char* field, const std::string& id)
        {
            if (pool.find(id) == pool.end())
            {
                rtn.push_back(DanglingReference{ path, field, id });
            }
        };

        for (size_t i = 0; i != roads.size(); ++i)
        {
            const auto& road = roads[i];
            const auto roadPath = fmt::format("OpenDRIVE.road[{}]", i);
            if (road.InJunction())
            {
                expect(junctionIDs, roadPath, "junction", road.junction);
            }
            if (road.link)
            {
                for (const auto* end : { &road.link->predecessor, &road.link->successor })
                {
                    if (!end->has_value()) continue;
                    const auto& target = end->value();
                    const auto linkPath = roadPath + (end == &road.link->predecessor ? ".link.predecessor" : ".link.successor");
                    expect(target.elementType == ElementType::Road ? roadIDs : junctionIDs,
                        linkPath, "elementId", target.elementId);
                }
            }
            if (road.railroad)
            {
                for (size_t j = 0; j != road.railroad->switches.size(); ++j)
                {
                    const auto& railSwitch = road.railroad->switches[j];
                    const auto switchPath = fmt::format("{}.railroad.switch[{}]", roadPath, j);
                    expect(roadIDs, switchPath + ".mainTrack", "id", railSwitch.mainTrack.id);
                    expect(roadIDs, switchPath + ".sideTrack", "id", railSwitch.sideTrack.id);
                }
            }
            if (road.signals)
            {
                for (size_t j = 0; j != road.signals->signals.size(); ++j)
                {
                    const auto& position = road.signals->signals[j].position;
                    if (position && std::holds_alternative<SignalPositionRoad>(*position))
                    {
                        expect(roadIDs, fmt::format("{}.signals.signal[{}].positionRoad", roadPath, j),
                            "roadId", std::get<SignalPositionRoad>(*position).roadId);
                    }
                }
            }
        }

        for (size_t i = 0; i != controllers.size(); ++i)
        {
            for (size_t j = 0; j != controllers[i].controls.size(); ++j)
            {
                expect(signalIDs, fmt::format("OpenDRIVE.controller[{}].control[{}]", i, j),
                    "signalId", controllers[i].controls[j].signalId);
            }
        }

        for (size_t i = 0; i != junctions.size(); ++i)
        {
            const auto& junction = junctions[i];
            const auto junctionPath = fmt::format("OpenDRIVE.junction[{}]", i);
            if (junction.mainRoad)
            {
                expect(roadIDs, junctionPath, "mainRoad", *junction.mainRoad);
            }
            for (size_t j = 0; j != junction.connections.size(); ++j)
            {
                const auto& connection = junction.connections[j];
                const auto connectionPath = fmt::format("{}.connection[{}]", junctionPath, j);
                if (connection.incomingRoad) expect(roadIDs, connectionPath, "incomingRoad", *connection.incomingRoad);
                if (connection.connectingRoad) expect(roadIDs, connectionPath, "connectingRoad", *connection.connectingRoad);
                if (connection.linkedRoad) expect(roadIDs, connectionPath, "linkedRoad", *connection.linkedRoad);
            }
            for (size_t j = 0; j != junction.priorities.size(); ++j)
            {
                const auto& priority = junction.priorities[j];
                const auto priorityPath = fmt::format("{}.priority[{}]", junctionPath, j);
                if (priority.high) expect(roadIDs, priorityPath, "high", *priority.high);
                if (priority.low) expect(roadIDs, priorityPath, "low", *priority.low);
            }
            for (size_t j = 0; j != junction.controllers.size(); ++j)
            {
                expect(controllerIDs, fmt::format("{}.controller[{}]", junctionPath, j),
                    "id", junction.controllers[j].id);
            }
        }

        for (size_t i = 0; i != junctionGroups.size(); ++i)
        {
            for (size_t j = 0; j != junctionGroups[i].junctionReferences.size(); ++j)
            {
                expect(junctionIDs, fmt::format("OpenDRIVE.junctionGroup[{}].junctionReference[{}]", i, j),
                    "junction", junctionGroups[i].junctionReferences[j]);
            }
        }

        for (size_t i = 0; i != stations.size(); ++i)
        {
            for (size_t j = 0; j != stations[i].platforms.size(); ++j)
            {
                const auto& segments = stations[i].platforms[j].segments;
                for (size_t k = 0; k != segments.size(); ++k)
                {
                    expect(roadIDs, fmt::format("OpenDRIVE.station[{}].platform[{}].segment[{}]", i, j, k),
                        "roadId", segments[k].roadId);
                }
            }
        }
        return rtn;
    }
}
