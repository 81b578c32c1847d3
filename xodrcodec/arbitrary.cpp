#include "arbitrary.h"

#include <algorithm>
#include <limits>

namespace XodrCodec
{
    Unstructured::Unstructured(const uint8_t* d, size_t n) :
        data(d), size(n)
    {
    }

    Unstructured::Unstructured(int seed) :
        seeded(true), engine(static_cast<std::mt19937::result_type>(seed))
    {
    }

    uint8_t Unstructured::NextByte()
    {
        if (position < size)
        {
            return data[position++];
        }
        return 0;
    }

    uint32_t Unstructured::NextU32()
    {
        if (seeded)
        {
            return static_cast<uint32_t>(engine());
        }
        uint32_t rtn = 0;
        for (int i = 0; i != 4; ++i)
        {
            rtn = (rtn << 8) | NextByte();
        }
        return rtn;
    }

    int Unstructured::IntBetween(int low, int hi)
    {
        if (low >= hi) return low;
        const uint32_t span = static_cast<uint32_t>(hi - low) + 1;
        return low + static_cast<int>(NextU32() % span);
    }

    double Unstructured::DoubleBetween(double low, double hi)
    {
        const double unit = static_cast<double>(NextU32()) / std::numeric_limits<uint32_t>::max();
        return low + (hi - low) * unit;
    }

    std::string Unstructured::Identifier(int maxLength)
    {
        static const char Letters[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
        static const char Alnum[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
        std::string rtn(1, Letters[IntBetween(0, sizeof(Letters) - 2)]);
        const int extra = IntBetween(0, std::max(0, maxLength - 1));
        for (int i = 0; i != extra; ++i)
        {
            rtn.push_back(Alnum[IntBetween(0, sizeof(Alnum) - 2)]);
        }
        return rtn;
    }

    std::string Unstructured::FreeText(int maxPieces)
    {
        static const char* const Pieces[] = {
            "a", "Z", "7", " ", "&", "<", ">", "\"", "'", "\t", "\n", "]]>", "\xC3\xA9", "\xE4\xB8\xAD", "&amp;" };
        const int count = static_cast<int>(sizeof(Pieces) / sizeof(Pieces[0]));
        std::string rtn;
        const int n = IntBetween(1, std::max(1, maxPieces));
        for (int i = 0; i != n; ++i)
        {
            rtn += Pieces[IntBetween(0, count - 1)];
        }
        return rtn;
    }
}

namespace
{
    using namespace XodrCodec;

    template <typename T>
    std::optional<T> Maybe(Unstructured& u, T value)
    {
        if (u.Bool())
        {
            return value;
        }
        return std::nullopt;
    }

    Length NonNegative(Unstructured& u, double hi = 100)
    {
        return Length(u.DoubleBetween(0, hi));
    }

    Length Signed(Unstructured& u, double bound = 100)
    {
        return Length(u.DoubleBetween(-bound, bound));
    }

    Angle RandomAngle(Unstructured& u)
    {
        return Angle(u.DoubleBetween(-Pi, Pi));
    }

    // count values in [0, end), s-ordered, the first one 0
    std::vector<double> SortedOffsets(Unstructured& u, int count, double end)
    {
        if (count <= 0)
        {
            return {};
        }
        std::vector<double> cumulative{ 0 };
        for (int i = 1; i < count; ++i)
        {
            cumulative.push_back(cumulative.back() + u.DoubleBetween(0, 1));
        }
        const double total = cumulative.back() + u.DoubleBetween(0.1, 1);
        std::vector<double> rtn;
        for (double c : cumulative)
        {
            rtn.push_back(end * (c / total));
        }
        return rtn;
    }

    OpaqueElement ArbitraryOpaque(Unstructured& u, int depth)
    {
        OpaqueElement rtn;
        rtn.name = u.Identifier();
        const int nAttributes = u.IntBetween(0, 2);
        for (int i = 0; i != nAttributes; ++i)
        {
            rtn.attributes.emplace_back("k" + std::to_string(i), u.FreeText());
        }
        if (depth > 0 && u.Bool())
        {
            const int nChildren = u.IntBetween(1, 2);
            for (int i = 0; i != nChildren; ++i)
            {
                rtn.children.push_back(ArbitraryOpaque(u, depth - 1));
            }
        }
        else if (u.Bool())
        {
            rtn.text = u.Identifier(12);
        }
        return rtn;
    }

    AdditionalData ArbitraryExtra(Unstructured& u)
    {
        AdditionalData rtn;
        // Mostly empty, like real documents
        if (u.IntBetween(0, 3) != 0)
        {
            return rtn;
        }
        const int nIncludes = u.IntBetween(0, 1);
        for (int i = 0; i != nIncludes; ++i)
        {
            rtn.includes.push_back(Include{ u.Identifier() + ".xml" });
        }
        const int nUserData = u.IntBetween(0, 2);
        for (int i = 0; i != nUserData; ++i)
        {
            UserData data;
            data.code = u.Identifier();
            data.value = Maybe(u, u.FreeText());
            const int nContent = u.IntBetween(0, 2);
            for (int k = 0; k != nContent; ++k)
            {
                data.content.push_back(ArbitraryOpaque(u, 2));
            }
            rtn.userData.push_back(std::move(data));
        }
        if (u.Bool())
        {
            DataQuality quality;
            if (u.Bool())
            {
                quality.error = DataQualityError{ u.DoubleBetween(0, 1), u.DoubleBetween(0, 1),
                    u.DoubleBetween(0, 1), u.DoubleBetween(0, 1) };
            }
            if (u.Bool())
            {
                RawData raw;
                raw.date = u.Identifier();
                raw.source = u.Enum<DataSource>();
                raw.sourceComment = Maybe(u, u.FreeText());
                raw.postProcessing = u.Enum<PostProcessing>();
                raw.postProcessingComment = Maybe(u, u.FreeText());
                quality.rawData = raw;
            }
            rtn.dataQuality.push_back(quality);
        }
        return rtn;
    }

    std::vector<LaneValidity> ArbitraryValidities(Unstructured& u)
    {
        std::vector<LaneValidity> rtn;
        const int n = u.IntBetween(0, 2);
        for (int i = 0; i != n; ++i)
        {
            rtn.push_back(LaneValidity{ u.IntBetween(-3, 3), u.IntBetween(-3, 3) });
        }
        return rtn;
    }

    GeometryShape ArbitraryShape(Unstructured& u, double length)
    {
        switch (u.IntBetween(0, 4))
        {
        case 0:
            return LineShape{};
        case 1:
            return ArcShape{ Curvature(u.DoubleBetween(-0.1, 0.1)) };
        case 2:
            return SpiralShape{ Curvature(u.DoubleBetween(-0.05, 0.05)), Curvature(u.DoubleBetween(-0.05, 0.05)) };
        case 3:
        {
            Poly3Shape poly;
            poly.b = u.DoubleBetween(-0.5, 0.5);
            poly.c = u.DoubleBetween(-0.01, 0.01);
            poly.d = u.DoubleBetween(-0.001, 0.001);
            return poly;
        }
        default:
        {
            // du/dp stays positive, so the curve never stalls
            ParamPoly3Shape poly;
            poly.pRange = u.Enum<ParamPoly3Range>();
            const double pEnd = poly.pRange == ParamPoly3Range::Normalized ? 1 : length;
            const double scale = poly.pRange == ParamPoly3Range::Normalized ? length : 1;
            poly.bU = u.DoubleBetween(0.5, 1) * scale;
            poly.cU = u.DoubleBetween(-0.1, 0.1) * scale / pEnd;
            poly.dU = u.DoubleBetween(-0.05, 0.05) * scale / (pEnd * pEnd);
            poly.bV = u.DoubleBetween(-0.5, 0.5) * scale;
            poly.cV = u.DoubleBetween(-0.1, 0.1) * scale / pEnd;
            poly.dV = u.DoubleBetween(-0.05, 0.05) * scale / (pEnd * pEnd);
            return poly;
        }
        }
    }

    std::vector<Geometry> ArbitraryPlanView(Unstructured& u)
    {
        std::vector<Geometry> rtn;
        Pose start{ Signed(u, 1000), Signed(u, 1000), RandomAngle(u) };
        Length s(0);
        const int n = u.IntBetween(1, 4);
        for (int i = 0; i != n; ++i)
        {
            const double length = u.DoubleBetween(0.5, 50);
            auto shape = ArbitraryShape(u, length);
            rtn.emplace_back(s, start.x, start.y, start.hdg, Length(length), std::move(shape), ArbitraryExtra(u));
            start = rtn.back().End();
            s = rtn.back().EndS();
        }
        return rtn;
    }

    RoadMark ArbitraryRoadMark(Unstructured& u)
    {
        RoadMark rtn;
        rtn.sOffset = NonNegative(u, 10);
        rtn.type = u.Enum<RoadMarkType>();
        rtn.weight = Maybe(u, u.Enum<RoadMarkWeight>());
        rtn.color = u.Enum<RoadMarkColor>();
        rtn.material = Maybe(u, u.FreeText());
        rtn.width = Maybe(u, NonNegative(u, 0.5));
        rtn.laneChange = u.Enum<LaneChange>();
        rtn.height = Maybe(u, Signed(u, 0.1));
        const int nSways = u.IntBetween(0, 1);
        for (int i = 0; i != nSways; ++i)
        {
            rtn.sways.push_back(RoadMarkSway{ NonNegative(u, 10), u.DoubleBetween(-1, 1),
                u.DoubleBetween(-1, 1), u.DoubleBetween(-1, 1), u.DoubleBetween(-1, 1) });
        }
        if (u.Bool())
        {
            RoadMarkTypeDetail detail;
            detail.name = u.FreeText();
            detail.width = NonNegative(u, 0.5);
            const int nLines = u.IntBetween(1, 2);
            for (int i = 0; i != nLines; ++i)
            {
                RoadMarkTypeLine line;
                line.length = NonNegative(u, 10);
                line.space = NonNegative(u, 10);
                line.tOffset = Signed(u, 1);
                line.sOffset = NonNegative(u, 5);
                line.rule = Maybe(u, u.Enum<RoadMarkRule>());
                line.width = Maybe(u, NonNegative(u, 0.5));
                line.color = Maybe(u, u.Enum<RoadMarkColor>());
                detail.lines.push_back(line);
            }
            rtn.typeDetail = detail;
        }
        if (u.Bool())
        {
            RoadMarkExplicit explicitLines;
            const int nLines = u.IntBetween(1, 2);
            for (int i = 0; i != nLines; ++i)
            {
                ExplicitLine line;
                line.length = NonNegative(u, 10);
                line.tOffset = Signed(u, 1);
                line.sOffset = NonNegative(u, 50);
                line.rule = Maybe(u, u.Enum<RoadMarkRule>());
                line.width = Maybe(u, NonNegative(u, 0.5));
                explicitLines.lines.push_back(line);
            }
            rtn.explicitLines = explicitLines;
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    Lane ArbitraryLane(Unstructured& u, int id)
    {
        Lane rtn;
        rtn.id = id;
        rtn.type = u.Enum<LaneType>();
        rtn.level = u.Bool();
        if (u.Bool())
        {
            LaneLink link;
            if (u.Bool()) link.predecessors.push_back(u.IntBetween(-3, 3));
            if (u.Bool()) link.successors.push_back(u.IntBetween(-3, 3));
            rtn.link = link;
        }
        if (id != 0)
        {
            for (double offset : SortedOffsets(u, u.IntBetween(1, 3), 20))
            {
                const Length sOffset(offset);
                const double a = u.DoubleBetween(0, 4), b = u.DoubleBetween(-0.1, 0.1);
                if (u.IntBetween(0, 3) == 0)
                {
                    rtn.shape.push_back(LaneBorder{ sOffset, a, b, 0, 0 });
                }
                else
                {
                    rtn.shape.push_back(LaneWidth{ sOffset, a, b, u.DoubleBetween(-0.01, 0.01), 0 });
                }
            }
        }
        for (double offset : SortedOffsets(u, u.IntBetween(0, 2), 10))
        {
            rtn.roadMarks.push_back(ArbitraryRoadMark(u));
            rtn.roadMarks.back().sOffset = Length(offset);
        }
        if (u.IntBetween(0, 3) == 0)
        {
            rtn.materials.push_back(LaneMaterial{ NonNegative(u, 10), u.DoubleBetween(0, 1),
                Maybe(u, u.DoubleBetween(0, 1)), Maybe(u, u.FreeText()) });
        }
        if (u.IntBetween(0, 3) == 0)
        {
            rtn.speeds.push_back(LaneSpeed{ NonNegative(u, 10), u.DoubleBetween(0, 130), u.Enum<SpeedUnit>() });
        }
        if (u.IntBetween(0, 3) == 0)
        {
            rtn.accesses.push_back(LaneAccess{ NonNegative(u, 10), u.Enum<AccessRestriction>(),
                Maybe(u, u.Enum<AccessRule>()) });
        }
        if (u.IntBetween(0, 3) == 0)
        {
            rtn.heights.push_back(LaneHeight{ NonNegative(u, 10), Maybe(u, Signed(u, 0.3)), Maybe(u, Signed(u, 0.3)) });
        }
        if (u.IntBetween(0, 3) == 0)
        {
            rtn.rules.push_back(LaneRule{ NonNegative(u, 10), u.FreeText() });
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    Lanes ArbitraryLanes(Unstructured& u, double roadLength)
    {
        Lanes rtn;
        for (double s : SortedOffsets(u, u.IntBetween(0, 2), roadLength))
        {
            rtn.laneOffsets.push_back(CubicRecord{ Length(s), u.DoubleBetween(-2, 2), u.DoubleBetween(-0.1, 0.1), 0, 0 });
        }
        for (double s : SortedOffsets(u, u.IntBetween(1, 3), roadLength))
        {
            LaneSection section;
            section.s = Length(s);
            section.singleSide = u.Bool();
            const int nLeft = u.IntBetween(0, 3);
            for (int id = nLeft; id >= 1; --id)
            {
                section.left.push_back(ArbitraryLane(u, id));
            }
            section.center = ArbitraryLane(u, 0);
            const int nRight = u.IntBetween(0, 3);
            for (int id = -1; id >= -nRight; --id)
            {
                section.right.push_back(ArbitraryLane(u, id));
            }
            section.extra = ArbitraryExtra(u);
            rtn.laneSections.push_back(std::move(section));
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    RoadLinkElement ArbitraryLinkElement(Unstructured& u)
    {
        RoadLinkElement rtn;
        rtn.elementType = u.Enum<ElementType>();
        rtn.elementId = u.Identifier();
        rtn.contactPoint = Maybe(u, u.Enum<ContactPoint>());
        rtn.elementS = Maybe(u, NonNegative(u));
        rtn.elementDir = Maybe(u, u.Enum<ElementDir>());
        return rtn;
    }

    Outline ArbitraryOutline(Unstructured& u, double roadLength)
    {
        Outline rtn;
        rtn.id = Maybe(u, static_cast<unsigned>(u.IntBetween(0, 20)));
        rtn.fillType = Maybe(u, u.Enum<OutlineFillType>());
        rtn.outer = Maybe(u, u.Bool());
        rtn.closed = Maybe(u, u.Bool());
        rtn.laneType = Maybe(u, u.Enum<LaneType>());
        const int nCorners = u.IntBetween(1, 4);
        for (int i = 0; i != nCorners; ++i)
        {
            const auto id = Maybe(u, static_cast<unsigned>(i));
            if (u.Bool())
            {
                rtn.corners.push_back(CornerRoad{ NonNegative(u, roadLength), Signed(u, 10), Signed(u, 1),
                    Signed(u, 3), id });
            }
            else
            {
                rtn.corners.push_back(CornerLocal{ Signed(u, 10), Signed(u, 10), Signed(u, 1), Signed(u, 3), id });
            }
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    std::vector<unsigned> ArbitraryCornerReferences(Unstructured& u)
    {
        std::vector<unsigned> rtn;
        const int n = u.IntBetween(0, 3);
        for (int i = 0; i != n; ++i)
        {
            rtn.push_back(static_cast<unsigned>(u.IntBetween(0, 3)));
        }
        return rtn;
    }

    ObjectMarkings ArbitraryObjectMarkings(Unstructured& u)
    {
        ObjectMarkings rtn;
        const int n = u.IntBetween(1, 2);
        for (int i = 0; i != n; ++i)
        {
            ObjectMarking marking;
            marking.side = Maybe(u, u.Enum<MarkingSide>());
            marking.weight = Maybe(u, u.Enum<RoadMarkWeight>());
            marking.width = Maybe(u, NonNegative(u, 0.5));
            marking.color = u.Enum<RoadMarkColor>();
            marking.zOffset = Maybe(u, NonNegative(u, 0.1));
            marking.spaceLength = NonNegative(u, 5);
            marking.lineLength = NonNegative(u, 5);
            marking.startOffset = Signed(u, 2);
            marking.stopOffset = Signed(u, 2);
            marking.cornerReferences = ArbitraryCornerReferences(u);
            marking.extra = ArbitraryExtra(u);
            rtn.markings.push_back(std::move(marking));
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    ObjectBorders ArbitraryObjectBorders(Unstructured& u)
    {
        ObjectBorders rtn;
        const int n = u.IntBetween(1, 2);
        for (int i = 0; i != n; ++i)
        {
            ObjectBorder border;
            border.width = NonNegative(u, 1);
            border.type = u.Enum<ObjectBorderType>();
            border.outlineId = static_cast<unsigned>(u.IntBetween(0, 20));
            border.useCompleteOutline = Maybe(u, u.Bool());
            border.cornerReferences = ArbitraryCornerReferences(u);
            border.extra = ArbitraryExtra(u);
            rtn.borders.push_back(std::move(border));
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    void ArbitraryObjectDetails(Unstructured& u, double roadLength, RoadObject& object)
    {
        if (u.Bool())
        {
            object.outline = ArbitraryOutline(u, roadLength);
        }
        if (u.Bool())
        {
            Outlines outlines;
            const int n = u.IntBetween(1, 2);
            for (int i = 0; i != n; ++i)
            {
                outlines.outlines.push_back(ArbitraryOutline(u, roadLength));
            }
            outlines.extra = ArbitraryExtra(u);
            object.outlines = std::move(outlines);
        }
        const int nMaterials = u.IntBetween(0, 2);
        for (int i = 0; i != nMaterials; ++i)
        {
            object.materials.push_back(ObjectMaterial{ Maybe(u, u.FreeText()), Maybe(u, u.DoubleBetween(0, 1)),
                Maybe(u, u.DoubleBetween(0, 0.1)) });
        }
        if (u.Bool())
        {
            object.parkingSpace = ParkingSpace{ u.Enum<ParkingAccess>(), Maybe(u, u.FreeText()) };
        }
        if (u.Bool())
        {
            object.markings = ArbitraryObjectMarkings(u);
        }
        if (u.Bool())
        {
            object.borders = ArbitraryObjectBorders(u);
        }
        if (u.Bool())
        {
            ObjectSurface surface;
            if (u.Bool())
            {
                surface.crg = ObjectCrg{ Maybe(u, u.FreeText()), Maybe(u, u.Bool()), Maybe(u, u.DoubleBetween(0, 2)) };
            }
            surface.extra = ArbitraryExtra(u);
            object.surface = std::move(surface);
        }
    }

    Objects ArbitraryObjects(Unstructured& u, double roadLength)
    {
        Objects rtn;
        const int nObjects = u.IntBetween(0, 2);
        for (int i = 0; i != nObjects; ++i)
        {
            RoadObject object;
            object.id = u.Identifier() + std::to_string(i);
            object.s = NonNegative(u, roadLength);
            object.t = Signed(u, 10);
            object.zOffset = Signed(u, 1);
            object.type = Maybe(u, u.Enum<ObjectType>());
            object.subtype = Maybe(u, u.FreeText());
            object.name = Maybe(u, u.FreeText());
            object.validLength = Maybe(u, NonNegative(u, 10));
            object.orientation = Maybe(u, u.Enum<Orientation>());
            object.length = Maybe(u, NonNegative(u, 10));
            object.width = Maybe(u, NonNegative(u, 10));
            object.radius = Maybe(u, NonNegative(u, 10));
            object.height = Maybe(u, NonNegative(u, 10));
            object.hdg = Maybe(u, RandomAngle(u));
            object.pitch = Maybe(u, RandomAngle(u));
            object.roll = Maybe(u, RandomAngle(u));
            object.dynamic = Maybe(u, u.Bool());
            object.perpToRoad = Maybe(u, u.Bool());
            if (u.Bool())
            {
                ObjectRepeat repeat;
                repeat.s = NonNegative(u, roadLength);
                repeat.length = NonNegative(u, 20);
                repeat.distance = NonNegative(u, 5);
                repeat.tStart = Signed(u, 5);
                repeat.tEnd = Signed(u, 5);
                repeat.heightStart = Signed(u, 2);
                repeat.heightEnd = Signed(u, 2);
                repeat.zOffsetStart = Signed(u, 1);
                repeat.zOffsetEnd = Signed(u, 1);
                repeat.widthStart = Maybe(u, NonNegative(u, 2));
                repeat.widthEnd = Maybe(u, NonNegative(u, 2));
                repeat.lengthStart = Maybe(u, NonNegative(u, 2));
                repeat.lengthEnd = Maybe(u, NonNegative(u, 2));
                repeat.radiusStart = Maybe(u, NonNegative(u, 2));
                repeat.radiusEnd = Maybe(u, NonNegative(u, 2));
                object.repeats.push_back(repeat);
            }
            ArbitraryObjectDetails(u, roadLength, object);
            object.validities = ArbitraryValidities(u);
            object.extra = ArbitraryExtra(u);
            rtn.objects.push_back(std::move(object));
        }
        if (u.Bool())
        {
            rtn.references.push_back(ObjectReference{ u.Identifier(), NonNegative(u, roadLength), Signed(u, 10),
                Maybe(u, Signed(u, 1)), Maybe(u, NonNegative(u, 10)), u.Enum<Orientation>(), ArbitraryValidities(u) });
        }
        if (u.Bool())
        {
            rtn.tunnels.push_back(Tunnel{ u.Identifier(), NonNegative(u, roadLength), NonNegative(u, 50),
                Maybe(u, u.FreeText()), u.Enum<TunnelType>(), Maybe(u, u.DoubleBetween(0, 1)),
                Maybe(u, u.DoubleBetween(0, 1)), ArbitraryValidities(u) });
        }
        if (u.Bool())
        {
            rtn.bridges.push_back(Bridge{ u.Identifier(), NonNegative(u, roadLength), NonNegative(u, 50),
                Maybe(u, u.FreeText()), u.Enum<BridgeType>(), ArbitraryValidities(u) });
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    Signals ArbitrarySignals(Unstructured& u, double roadLength, std::vector<std::string>& signalIDs)
    {
        Signals rtn;
        const int nSignals = u.IntBetween(0, 2);
        for (int i = 0; i != nSignals; ++i)
        {
            Signal signal;
            signal.id = u.Identifier() + std::to_string(signalIDs.size());
            signalIDs.push_back(signal.id);
            signal.name = Maybe(u, u.FreeText());
            signal.s = NonNegative(u, roadLength);
            signal.t = Signed(u, 10);
            signal.dynamic = u.Bool();
            signal.orientation = u.Enum<Orientation>();
            signal.zOffset = Signed(u, 5);
            signal.country = Maybe(u, u.Identifier(3));
            signal.countryRevision = Maybe(u, u.Identifier(4));
            signal.type = u.FreeText();
            signal.subtype = u.FreeText();
            signal.value = Maybe(u, u.DoubleBetween(0, 130));
            signal.unit = Maybe(u, u.Enum<SignalUnit>());
            signal.height = Maybe(u, NonNegative(u, 3));
            signal.width = Maybe(u, NonNegative(u, 3));
            signal.text = Maybe(u, u.FreeText());
            signal.hOffset = Maybe(u, RandomAngle(u));
            signal.pitch = Maybe(u, RandomAngle(u));
            signal.roll = Maybe(u, RandomAngle(u));
            signal.validities = ArbitraryValidities(u);
            if (u.Bool())
            {
                signal.dependencies.push_back(SignalDependency{ u.Identifier(), Maybe(u, u.Identifier()) });
            }
            if (u.Bool())
            {
                signal.references.push_back(SignalLinkedElement{ u.Enum<SignalElementType>(), u.Identifier(),
                    Maybe(u, u.Identifier()) });
            }
            switch (u.IntBetween(0, 2))
            {
            case 1:
                signal.position = SignalPosition(SignalPositionRoad{ u.Identifier(), NonNegative(u), Signed(u, 10),
                    Signed(u, 5), RandomAngle(u), Maybe(u, RandomAngle(u)), Maybe(u, RandomAngle(u)) });
                break;
            case 2:
                signal.position = SignalPosition(SignalPositionInertial{ Signed(u, 1000), Signed(u, 1000),
                    Signed(u, 10), RandomAngle(u), Maybe(u, RandomAngle(u)), Maybe(u, RandomAngle(u)) });
                break;
            default:
                break;
            }
            signal.extra = ArbitraryExtra(u);
            rtn.signals.push_back(std::move(signal));
        }
        if (u.Bool())
        {
            rtn.references.push_back(SignalReference{ u.Identifier(), NonNegative(u, roadLength), Signed(u, 10),
                u.Enum<Orientation>(), ArbitraryValidities(u) });
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    Road ArbitraryRoad(Unstructured& u, int index, const std::vector<std::string>& junctionIDs,
        std::vector<std::string>& signalIDs)
    {
        Road rtn;
        rtn.id = u.Identifier() + std::to_string(index);
        rtn.name = Maybe(u, u.FreeText());
        if (!junctionIDs.empty() && u.Bool())
        {
            rtn.junction = junctionIDs[u.IntBetween(0, static_cast<int>(junctionIDs.size()) - 1)];
        }
        rtn.rule = u.Enum<TrafficRule>();

        rtn.planView = ArbitraryPlanView(u);
        rtn.length = rtn.planView.back().EndS();
        const double length = rtn.length.Value();

        if (u.Bool())
        {
            RoadLink link;
            if (u.Bool()) link.predecessor = ArbitraryLinkElement(u);
            if (u.Bool()) link.successor = ArbitraryLinkElement(u);
            link.extra = ArbitraryExtra(u);
            rtn.link = link;
        }
        for (double s : SortedOffsets(u, u.IntBetween(0, 2), length))
        {
            RoadTypeRecord type;
            type.s = Length(s);
            type.type = u.Enum<RoadType>();
            type.country = Maybe(u, u.Identifier(3));
            if (u.Bool())
            {
                RoadSpeed speed;
                switch (u.IntBetween(0, 2))
                {
                case 0: speed.max = MaxSpeed::Limit(u.DoubleBetween(0, 130)); break;
                case 1: speed.max = MaxSpeed::NoLimit(); break;
                default: speed.max = MaxSpeed::Undefined(); break;
                }
                speed.unit = u.Enum<SpeedUnit>();
                type.speed = speed;
            }
            rtn.types.push_back(type);
        }
        if (u.Bool())
        {
            ElevationProfile profile;
            for (double s : SortedOffsets(u, u.IntBetween(0, 3), length))
            {
                profile.elevations.push_back(CubicRecord{ Length(s), u.DoubleBetween(-10, 10),
                    u.DoubleBetween(-0.1, 0.1), u.DoubleBetween(-0.01, 0.01), u.DoubleBetween(-0.001, 0.001) });
            }
            profile.extra = ArbitraryExtra(u);
            rtn.elevationProfile = profile;
        }
        if (u.Bool())
        {
            LateralProfile profile;
            for (double s : SortedOffsets(u, u.IntBetween(0, 2), length))
            {
                profile.superelevations.push_back(CubicRecord{ Length(s), u.DoubleBetween(-0.1, 0.1), 0, 0, 0 });
            }
            if (u.Bool())
            {
                profile.shapes.push_back(LateralShape{ NonNegative(u, length), Signed(u, 5),
                    u.DoubleBetween(-0.1, 0.1), u.DoubleBetween(-0.1, 0.1), 0, 0 });
            }
            profile.extra = ArbitraryExtra(u);
            rtn.lateralProfile = profile;
        }
        rtn.lanes = ArbitraryLanes(u, length);
        if (u.Bool())
        {
            rtn.objects = ArbitraryObjects(u, length);
        }
        if (u.Bool())
        {
            rtn.signals = ArbitrarySignals(u, length, signalIDs);
        }
        if (u.Bool())
        {
            RoadSurface surface;
            const int nCrgs = u.IntBetween(0, 2);
            for (int i = 0; i != nCrgs; ++i)
            {
                RoadCrg crg;
                crg.file = u.FreeText();
                crg.sStart = NonNegative(u, length);
                crg.sEnd = Length(u.DoubleBetween(crg.sStart.Value(), length));
                crg.orientation = u.Enum<CrgOrientation>();
                crg.mode = u.Enum<RoadCrgMode>();
                crg.purpose = Maybe(u, u.Enum<CrgPurpose>());
                crg.sOffset = Maybe(u, Signed(u, 10));
                crg.tOffset = Maybe(u, Signed(u, 10));
                crg.zOffset = Maybe(u, Signed(u, 1));
                crg.zScale = Maybe(u, u.DoubleBetween(0, 2));
                crg.hOffset = Maybe(u, RandomAngle(u));
                surface.crgs.push_back(std::move(crg));
            }
            surface.extra = ArbitraryExtra(u);
            rtn.surface = std::move(surface);
        }
        if (u.Bool())
        {
            Railroad railroad;
            const int nSwitches = u.IntBetween(0, 2);
            for (int i = 0; i != nSwitches; ++i)
            {
                RailroadSwitch railSwitch;
                railSwitch.name = u.FreeText();
                railSwitch.id = u.Identifier() + std::to_string(i);
                railSwitch.position = u.Enum<SwitchPosition>();
                railSwitch.mainTrack = SwitchTrack{ rtn.id, NonNegative(u, length), u.Enum<ElementDir>() };
                railSwitch.sideTrack = SwitchTrack{ u.Identifier(), NonNegative(u), u.Enum<ElementDir>() };
                if (u.Bool())
                {
                    railSwitch.partner = SwitchPartner{ u.Identifier(), Maybe(u, u.FreeText()) };
                }
                railSwitch.extra = ArbitraryExtra(u);
                railroad.switches.push_back(std::move(railSwitch));
            }
            railroad.extra = ArbitraryExtra(u);
            rtn.railroad = std::move(railroad);
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    std::optional<VirtualConnectionEnd> MaybeConnectionEnd(Unstructured& u)
    {
        if (!u.Bool())
        {
            return std::nullopt;
        }
        return VirtualConnectionEnd{ u.Identifier(), u.Identifier(), NonNegative(u), u.Enum<ElementDir>() };
    }

    Junction ArbitraryJunction(Unstructured& u, const std::string& id)
    {
        Junction rtn;
        rtn.id = id;
        rtn.name = Maybe(u, u.FreeText());
        rtn.type = u.Enum<JunctionType>();
        rtn.mainRoad = Maybe(u, u.Identifier());
        rtn.orientation = Maybe(u, u.Enum<Orientation>());
        rtn.sStart = Maybe(u, NonNegative(u));
        rtn.sEnd = Maybe(u, NonNegative(u));
        const int nConnections = u.IntBetween(1, 3);
        for (int i = 0; i != nConnections; ++i)
        {
            Connection connection;
            connection.id = std::to_string(i);
            connection.type = u.Enum<ConnectionType>();
            connection.incomingRoad = Maybe(u, u.Identifier());
            connection.connectingRoad = Maybe(u, u.Identifier());
            connection.linkedRoad = Maybe(u, u.Identifier());
            connection.contactPoint = Maybe(u, u.Enum<ContactPoint>());
            connection.predecessor = MaybeConnectionEnd(u);
            connection.successor = MaybeConnectionEnd(u);
            const int nLinks = u.IntBetween(0, 3);
            for (int k = 0; k != nLinks; ++k)
            {
                connection.laneLinks.push_back(JunctionLaneLink{ u.IntBetween(-3, 3), u.IntBetween(-3, 3) });
            }
            rtn.connections.push_back(std::move(connection));
        }
        if (u.Bool())
        {
            rtn.priorities.push_back(JunctionPriority{ Maybe(u, u.Identifier()), Maybe(u, u.Identifier()) });
        }
        if (u.Bool())
        {
            rtn.controllers.push_back(JunctionController{ u.Identifier(), Maybe(u, u.Identifier()),
                Maybe(u, static_cast<unsigned>(u.IntBetween(0, 10))) });
        }
        if (u.Bool())
        {
            JunctionSurface surface;
            if (u.Bool())
            {
                surface.crgs.push_back(JunctionCrg{ u.FreeText(), u.Enum<JunctionCrgMode>(),
                    Maybe(u, u.Enum<CrgPurpose>()), Maybe(u, Signed(u, 1)), Maybe(u, u.DoubleBetween(0, 2)) });
            }
            surface.extra = ArbitraryExtra(u);
            rtn.surface = std::move(surface);
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    Header ArbitraryHeader(Unstructured& u)
    {
        Header rtn;
        rtn.revMinor = static_cast<unsigned>(u.IntBetween(0, StandardRevMinor));
        rtn.name = Maybe(u, u.FreeText());
        rtn.version = Maybe(u, u.Identifier(4));
        rtn.date = Maybe(u, u.FreeText());
        rtn.north = Maybe(u, Signed(u, 1e4));
        rtn.south = Maybe(u, Signed(u, 1e4));
        rtn.east = Maybe(u, Signed(u, 1e4));
        rtn.west = Maybe(u, Signed(u, 1e4));
        rtn.vendor = Maybe(u, u.FreeText());
        if (u.Bool())
        {
            rtn.geoReference = GeoReference{ u.FreeText(16), ArbitraryExtra(u) };
        }
        if (u.Bool())
        {
            rtn.offset = HeaderOffset{ Signed(u, 1e5), Signed(u, 1e5), Signed(u, 100), RandomAngle(u), ArbitraryExtra(u) };
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }
}

namespace XodrCodec
{
    Document ArbitraryDocument(Unstructured& u)
    {
        Document rtn;
        rtn.header = ArbitraryHeader(u);

        std::vector<std::string> junctionIDs;
        const int nJunctions = u.IntBetween(0, 2);
        for (int i = 0; i != nJunctions; ++i)
        {
            junctionIDs.push_back("j" + std::to_string(i));
        }

        std::vector<std::string> signalIDs;
        const int nRoads = u.IntBetween(0, 4);
        for (int i = 0; i != nRoads; ++i)
        {
            rtn.roads.push_back(ArbitraryRoad(u, i, junctionIDs, signalIDs));
        }

        const int nControllers = u.IntBetween(0, 2);
        for (int i = 0; i != nControllers; ++i)
        {
            Controller controller;
            controller.id = "c" + std::to_string(i);
            controller.name = Maybe(u, u.FreeText());
            controller.sequence = Maybe(u, static_cast<unsigned>(u.IntBetween(0, 10)));
            const int nControls = u.IntBetween(1, 3);
            for (int k = 0; k != nControls; ++k)
            {
                const std::string signalId = signalIDs.empty() ?
                    u.Identifier() : signalIDs[u.IntBetween(0, static_cast<int>(signalIDs.size()) - 1)];
                controller.controls.push_back(ControllerControl{ signalId, Maybe(u, u.Identifier()) });
            }
            controller.extra = ArbitraryExtra(u);
            rtn.controllers.push_back(std::move(controller));
        }

        for (const auto& id : junctionIDs)
        {
            rtn.junctions.push_back(ArbitraryJunction(u, id));
        }
        if (!junctionIDs.empty() && u.Bool())
        {
            JunctionGroup group;
            group.id = "g0";
            group.name = Maybe(u, u.FreeText());
            group.type = u.Enum<JunctionGroupType>();
            group.junctionReferences = junctionIDs;
            group.extra = ArbitraryExtra(u);
            rtn.junctionGroups.push_back(std::move(group));
        }

        const int nStations = u.IntBetween(0, 1);
        for (int i = 0; i != nStations; ++i)
        {
            Station station;
            station.id = "st" + std::to_string(i);
            station.name = u.FreeText();
            station.type = Maybe(u, u.Enum<StationType>());
            const int nPlatforms = u.IntBetween(1, 2);
            for (int k = 0; k != nPlatforms; ++k)
            {
                Platform platform;
                platform.id = station.id + "p" + std::to_string(k);
                platform.name = Maybe(u, u.FreeText());
                const int nSegments = u.IntBetween(1, 2);
                for (int m = 0; m != nSegments; ++m)
                {
                    const std::string roadId = rtn.roads.empty() ?
                        u.Identifier() : rtn.roads[u.IntBetween(0, static_cast<int>(rtn.roads.size()) - 1)].id;
                    const Length sStart = NonNegative(u, 50);
                    platform.segments.push_back(PlatformSegment{ roadId, sStart,
                        Length(sStart.Value() + u.DoubleBetween(0, 50)), u.Enum<SegmentSide>() });
                }
                platform.extra = ArbitraryExtra(u);
                station.platforms.push_back(std::move(platform));
            }
            station.extra = ArbitraryExtra(u);
            rtn.stations.push_back(std::move(station));
        }
        rtn.extra = ArbitraryExtra(u);
        return rtn;
    }

    Document ArbitraryDocument(int seed)
    {
        Unstructured u(seed);
        return ArbitraryDocument(u);
    }
}
