#pragma once

#include <memory>

#include "sch/Schematic.hpp"

// One sheet with every schematic item type. Stands in for a parsed
// .kicad_sch file.
std::shared_ptr<Schematic> CreateSampleSchematic();
