#pragma once

#include "CoreTypes.hpp"

/**
 * @brief Anything that can report the current eye pose.
 *
 * The scanner fires from whatever view it is given; in the game this is the
 * player controller, in tests a fixed pose.
 */
class ViewSource
{
public:
    virtual ~ViewSource() = default;

    [[nodiscard]] virtual ViewPose viewPose() const = 0;

protected:
    ViewSource() = default;
};
