#pragma once

#include "orbitcore/types.hpp"
#include "orbitcore/math.hpp"
#include "orbitcore/time_utils.hpp"
#include "orbitcore/kepler.hpp"
#include "orbitcore/orbit.hpp"
#include "orbitcore/body.hpp"
#include "orbitcore/system.hpp"
#include "orbitcore/catalog.hpp"
