#include "SurfaceClass.hpp"

#include <array>
#include <string>

#include "CoreUtilities.hpp"

namespace
{
    struct KeywordRule
    {
        SurfaceClass                    cls;
        std::array<std::string_view, 3> keywords; // unused slots are empty
    };

    constexpr std::array<KeywordRule, 7> kRules = {{
        {SurfaceClass::Ground, {"ground", "floor"}},
        {SurfaceClass::Wall, {"wall", "ceiling"}},
        {SurfaceClass::Object, {"object", "furniture"}},
        {SurfaceClass::Vegetation, {"tree", "plant", "vegetation"}},
        {SurfaceClass::Water, {"water", "lake", "river"}},
        {SurfaceClass::Metal, {"metal", "steel", "iron"}},
        {SurfaceClass::Wood, {"wood", "timber"}},
    }};

} // namespace

SurfaceClass classifySurface(std::string_view meshName)
{
    const std::string name = lw::to_lower(std::string(meshName));

    for (const KeywordRule& rule : kRules)
    {
        for (std::string_view kw : rule.keywords)
        {
            if (!kw.empty() && name.find(kw) != std::string::npos)
                return rule.cls;
        }
    }

    return SurfaceClass::Default;
}

const char* surfaceClassName(SurfaceClass cls) noexcept
{
    switch (cls)
    {
        case SurfaceClass::Ground:
            return "ground";
        case SurfaceClass::Wall:
            return "wall";
        case SurfaceClass::Object:
            return "object";
        case SurfaceClass::Vegetation:
            return "vegetation";
        case SurfaceClass::Water:
            return "water";
        case SurfaceClass::Metal:
            return "metal";
        case SurfaceClass::Wood:
            return "wood";
        default:
            return "default";
    }
}
