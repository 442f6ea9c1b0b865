#pragma once

#include <memory>

#include "pcb/Board.hpp"

// Small four layer board exercising every board item type. Stands in for a
// parsed .kicad_pcb file.
std::shared_ptr<Board> CreateSampleBoard();
