#include "road.h"
#include "errors.h"

#include <algorithm>
#include <stdexcept>

namespace XodrCodec
{
    const Geometry& Road::GeometryAt(Length s) const
    {
        if (planView.empty())
        {
            throw std::logic_error("Road " + id + " has no reference line");
        }
        auto it = std::upper_bound(planView.begin(), planView.end(), s,
            [](Length v, const Geometry& g) { return v < g.S(); });
        if (it == planView.begin())
        {
            return planView.front();
        }
        return *(--it);
    }

    Pose Road::Evaluate(Length s) const
    {
        if (!(s.Value() >= 0 && s <= length))
        {
            throw GeometryError(s.Value(), length.Value());
        }
        const auto& geo = GeometryAt(s);
        // Sum of segment lengths may differ from road length by rounding
        double offset = std::clamp(s.Value() - geo.S().Value(), 0.0, geo.GetLength().Value());
        return geo.Evaluate(Length(offset));
    }
}
