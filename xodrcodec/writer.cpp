#include "writer.h"
#include "writer_detail.h"
#include "version.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace XodrCodec
{
    WriteContext::WriteContext(pugi::xml_node n, std::string p, const Workarounds& w) :
        node(n), path(std::move(p)), workarounds(w)
    {
    }

    WriteContext WriteContext::Child(const char* name)
    {
        const int index = childCount[name]++;
        return WriteContext(node.append_child(name), path + "." + name + "[" + std::to_string(index) + "]",
            workarounds);
    }

    void WriteContext::Fail(ErrorKind kind, const std::string& field,
        const std::string& raw, const std::string& detail) const
    {
        throw WriteError(kind, path, field, raw, 0, detail);
    }

    void WriteContext::Put(const char* name, const std::string& value)
    {
        node.append_attribute(name).set_value(value.c_str());
    }

    void WriteContext::Put(const char* name, const char* value)
    {
        node.append_attribute(name).set_value(value);
    }

    void WriteContext::Put(const char* name, double value)
    {
        if (!std::isfinite(value))
        {
            Fail(ErrorKind::MalformedNumber, name, FormatNumber(value), "number is not finite");
        }
        Put(name, FormatNumber(value));
    }

    void WriteContext::Put(const char* name, int value)
    {
        Put(name, std::to_string(value));
    }

    void WriteContext::Put(const char* name, unsigned value)
    {
        Put(name, std::to_string(value));
    }

    void WriteContext::Put(const char* name, bool value)
    {
        Put(name, value ? "true" : "false");
    }

    void WriteContext::PutYesNo(const char* name, bool value)
    {
        Put(name, value ? "yes" : "no");
    }

    void WriteContext::PutID(const char* name, const std::string& id)
    {
        if (!IsWellFormedID(id))
        {
            Fail(ErrorKind::UnresolvedReference, name, id, "malformed id");
        }
        Put(name, id);
    }

    void WriteContext::PutID(const char* name, const std::optional<std::string>& id)
    {
        if (id)
        {
            PutID(name, *id);
        }
    }

    void WriteContext::CData(const std::string& text)
    {
        node.append_child(pugi::node_cdata).set_value(text.c_str());
    }

    namespace
    {
        void WriteOpaque(pugi::xml_node parent, const OpaqueElement& element)
        {
            auto node = parent.append_child(element.name.c_str());
            for (const auto& attr : element.attributes)
            {
                node.append_attribute(attr.first.c_str()).set_value(attr.second.c_str());
            }
            if (!element.text.empty())
            {
                node.append_child(pugi::node_pcdata).set_value(element.text.c_str());
            }
            for (const auto& child : element.children)
            {
                WriteOpaque(node, child);
            }
        }
    }

    void WriteContext::PutExtra(const AdditionalData& extra)
    {
        for (const auto& include : extra.includes)
        {
            Child("include").Put("file", include.file);
        }
        for (const auto& data : extra.userData)
        {
            auto child = Child("userData");
            child.Put("code", data.code);
            child.Put("value", data.value);
            for (const auto& content : data.content)
            {
                WriteOpaque(child.node, content);
            }
        }
        for (const auto& quality : extra.dataQuality)
        {
            auto child = Child("dataQuality");
            if (quality.error)
            {
                auto error = child.Child("error");
                error.Put("xyAbsolute", quality.error->xyAbsolute);
                error.Put("zAbsolute", quality.error->zAbsolute);
                error.Put("xyRelative", quality.error->xyRelative);
                error.Put("zRelative", quality.error->zRelative);
            }
            if (quality.rawData)
            {
                auto raw = child.Child("rawData");
                raw.Put("date", quality.rawData->date);
                raw.Put("source", quality.rawData->source);
                raw.Put("sourceComment", quality.rawData->sourceComment);
                raw.Put("postProcessing", quality.rawData->postProcessing);
                raw.Put("postProcessingComment", quality.rawData->postProcessingComment);
            }
        }
    }

    void WriteValidity(WriteContext& ctx, const LaneValidity& validity)
    {
        auto child = ctx.Child("validity");
        child.Put("fromLane", validity.fromLane);
        child.Put("toLane", validity.toLane);
    }

    void WriteCubicRecord(WriteContext& ctx, const CubicRecord& record)
    {
        ctx.Put("s", record.s);
        ctx.Put("a", record.a);
        ctx.Put("b", record.b);
        ctx.Put("c", record.c);
        ctx.Put("d", record.d);
    }
}

namespace
{
    using namespace XodrCodec;

    void WriteHeader(WriteContext& ctx, const Header& header)
    {
        if (header.revMajor != StandardRevMajor || header.revMinor > StandardRevMinor)
        {
            ctx.Fail(ErrorKind::UnsupportedVersion, "revMinor",
                fmt::format("{}.{}", header.revMajor, header.revMinor),
                fmt::format("newest supported revision is {}.{}", StandardRevMajor, StandardRevMinor));
        }
        ctx.Put("revMajor", header.revMajor);
        ctx.Put("revMinor", header.revMinor);
        ctx.Put("name", header.name);
        ctx.Put("version", header.version);
        ctx.Put("date", header.date);
        ctx.Put("north", header.north);
        ctx.Put("south", header.south);
        ctx.Put("east", header.east);
        ctx.Put("west", header.west);
        ctx.Put("vendor", header.vendor);

        if (header.geoReference)
        {
            auto geo = ctx.Child("geoReference");
            geo.CData(header.geoReference->projection);
            geo.PutExtra(header.geoReference->extra);
        }
        if (header.offset)
        {
            auto offset = ctx.Child("offset");
            offset.Put("x", header.offset->x);
            offset.Put("y", header.offset->y);
            offset.Put("z", header.offset->z);
            offset.Put("hdg", header.offset->hdg);
            offset.PutExtra(header.offset->extra);
        }
        ctx.PutExtra(header.extra);
    }

    void WriteController(WriteContext& ctx, const Controller& controller)
    {
        ctx.PutID("id", controller.id);
        ctx.Put("name", controller.name);
        ctx.Put("sequence", controller.sequence);
        ctx.RequireNonEmpty(controller.controls, "control");
        for (const auto& control : controller.controls)
        {
            auto child = ctx.Child("control");
            child.PutID("signalId", control.signalId);
            child.Put("type", control.type);
        }
        ctx.PutExtra(controller.extra);
    }

    void WriteVirtualConnectionEnd(WriteContext ctx, const VirtualConnectionEnd& end)
    {
        ctx.Put("elementType", end.elementType);
        ctx.PutID("elementId", end.elementId);
        ctx.Put("elementS", end.elementS);
        ctx.Put("elementDir", end.elementDir);
    }

    void WriteJunction(WriteContext& ctx, const Junction& junction)
    {
        ctx.PutID("id", junction.id);
        ctx.Put("name", junction.name);
        ctx.PutUnlessDefault("type", junction.type, JunctionType::Default);
        ctx.PutID("mainRoad", junction.mainRoad);
        ctx.Put("orientation", junction.orientation);
        ctx.Put("sStart", junction.sStart);
        ctx.Put("sEnd", junction.sEnd);

        ctx.RequireNonEmpty(junction.connections, "connection");
        for (const auto& connection : junction.connections)
        {
            auto child = ctx.Child("connection");
            child.PutID("id", connection.id);
            child.PutUnlessDefault("type", connection.type, ConnectionType::Default);
            child.PutID("incomingRoad", connection.incomingRoad);
            child.PutID("connectingRoad", connection.connectingRoad);
            child.PutID("linkedRoad", connection.linkedRoad);
            child.Put("contactPoint", connection.contactPoint);
            if (connection.predecessor)
            {
                WriteVirtualConnectionEnd(child.Child("predecessor"), *connection.predecessor);
            }
            if (connection.successor)
            {
                WriteVirtualConnectionEnd(child.Child("successor"), *connection.successor);
            }
            for (const auto& laneLink : connection.laneLinks)
            {
                auto link = child.Child("laneLink");
                link.Put("from", laneLink.from);
                link.Put("to", laneLink.to);
            }
        }
        for (const auto& priority : junction.priorities)
        {
            auto child = ctx.Child("priority");
            child.PutID("high", priority.high);
            child.PutID("low", priority.low);
        }
        for (const auto& controller : junction.controllers)
        {
            auto child = ctx.Child("controller");
            child.PutID("id", controller.id);
            child.Put("type", controller.type);
            child.Put("sequence", controller.sequence);
        }
        if (junction.surface)
        {
            auto surface = ctx.Child("surface");
            for (const auto& crg : junction.surface->crgs)
            {
                auto child = surface.Child("CRG");
                child.Put("file", crg.file);
                child.Put("mode", crg.mode);
                child.Put("purpose", crg.purpose);
                child.Put("zOffset", crg.zOffset);
                child.Put("zScale", crg.zScale);
            }
            surface.PutExtra(junction.surface->extra);
        }
        ctx.PutExtra(junction.extra);
    }

    void WriteJunctionGroup(WriteContext& ctx, const JunctionGroup& group)
    {
        ctx.Put("name", group.name);
        ctx.PutID("id", group.id);
        ctx.Put("type", group.type);
        ctx.RequireNonEmpty(group.junctionReferences, "junctionReference");
        for (const auto& junction : group.junctionReferences)
        {
            ctx.Child("junctionReference").PutID("junction", junction);
        }
        ctx.PutExtra(group.extra);
    }
}

namespace XodrCodec
{
    std::string Serialize(const Document& doc, const Workarounds& workarounds)
    {
        pugi::xml_document xml;
        auto declaration = xml.append_child(pugi::node_declaration);
        declaration.append_attribute("version").set_value("1.0");
        declaration.append_attribute("standalone").set_value("yes");

        WriteContext root(xml.append_child("OpenDRIVE"), "OpenDRIVE", workarounds);
        auto header = root.Child("header");
        WriteHeader(header, doc.header);
        for (const auto& road : doc.roads)
        {
            auto child = root.Child("road");
            WriteRoad(child, road);
        }
        for (const auto& controller : doc.controllers)
        {
            auto child = root.Child("controller");
            WriteController(child, controller);
        }
        for (const auto& junction : doc.junctions)
        {
            auto child = root.Child("junction");
            WriteJunction(child, junction);
            spdlog::debug("Wrote junction {} ({} connections)", junction.id, junction.connections.size());
        }
        for (const auto& group : doc.junctionGroups)
        {
            auto child = root.Child("junctionGroup");
            WriteJunctionGroup(child, group);
        }
        for (const auto& station : doc.stations)
        {
            auto child = root.Child("station");
            WriteStation(child, station);
        }
        root.PutExtra(doc.extra);

        std::ostringstream os;
        xml.save(os, "    ", pugi::format_default, pugi::encoding_utf8);
        spdlog::debug("Serialized OpenDRIVE {}.{}: {} roads, {} junctions, {} controllers",
            doc.header.revMajor, doc.header.revMinor, doc.roads.size(), doc.junctions.size(),
            doc.controllers.size());
        return os.str();
    }

    void ExportFile(const Document& doc, const std::string& path, const Workarounds& workarounds)
    {
        auto text = Serialize(doc, workarounds);
        std::ofstream outFile(path, std::ios::binary);
        if (!outFile)
        {
            throw std::runtime_error("Cannot write " + path);
        }
        outFile << text;
        if (!outFile)
        {
            throw std::runtime_error("Failed writing " + path);
        }
    }
}
