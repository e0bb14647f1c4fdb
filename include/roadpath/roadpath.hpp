#pragma once
#include "core/Error.hpp"
#include "log/TaggedLogger.hpp"
#include "path/GlobName.hpp"
#include "path/PathBuilder.hpp"
#include "path/PathFunctions.hpp"
#include "path/PathParts.hpp"
#include "path/RoadPath.hpp"
