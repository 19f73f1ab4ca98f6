#pragma once

#include <istream>
#include <string>

#include "geometry.h"

namespace tekanim::core {

// Converts HPGL plotter commands to strokes. Only PU, PD, PA, PR and AA are
// interpreted; other commands and statements with non-numeric arguments are
// skipped.
Strokes parse_hpgl(std::istream& in);
Strokes parse_hpgl_text(const std::string& text);

} // namespace tekanim::core
