#pragma once
#include <cstdint>
#include "msg/Color.hpp"

namespace color {

// sRGB (8-bit) -> CIE xy chromaticity, as expected by Hue bridges.
//
// Pipeline: c/255 -> gamma decode -> linear RGB -> XYZ (wide-gamut matrix)
// -> x = X/(X+Y+Z), y = Y/(X+Y+Z).
//
// The gamma decode is piecewise with a 2.2 exponent above 0.04045 and a
// linear /12.92 segment below. This is NOT the canonical sRGB curve (2.4 with
// offset); bridges were tuned against this exact formula, keep it.
//
// Total over all inputs, no state. Black returns (0,0).
msg::ChromaXY RgbToXy(uint8_t r, uint8_t g, uint8_t b);

inline msg::ChromaXY RgbToXy(const msg::Rgb8& c) { return RgbToXy(c.r, c.g, c.b); }

// Gamma decode of one normalized channel value (0..1).
double GammaDecode(double c_norm);

} // namespace color
