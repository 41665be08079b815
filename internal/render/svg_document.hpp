#pragma once

#include <string>
#include <string_view>

#include "internal/model/display_geometry.hpp"

namespace epd::render {

/*
  Wraps caller-supplied inner markup in an <svg> root whose width, height
  and viewBox equal the display geometry. The result always starts with
  the root element.
*/
std::string WrapVectorBody(std::string_view body, const model::DisplayGeometry& geometry);

} // namespace epd::render
