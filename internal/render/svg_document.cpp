#include "svg_document.hpp"

#include <sstream>

namespace epd::render {

std::string WrapVectorBody(std::string_view body, const model::DisplayGeometry& geometry) {
  std::ostringstream out;
  out << "<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\""
      << " width=\"" << geometry.width << "\" height=\"" << geometry.height << "\""
      << " viewBox=\"0 0 " << geometry.width << ' ' << geometry.height << "\">\n"
      << body << "\n</svg>\n";
  return out.str();
}

} // namespace epd::render
