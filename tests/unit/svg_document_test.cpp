#include "internal/render/svg_document.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using epd::model::DisplayGeometry;
using epd::render::WrapVectorBody;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestRootCarriesGeometry() {
  const auto doc = WrapVectorBody("<circle cx=\"64\" cy=\"148\" r=\"40\"/>", DisplayGeometry{128, 296});

  assert(doc.rfind("<svg", 0) == 0);
  assert(Contains(doc, "width=\"128\""));
  assert(Contains(doc, "height=\"296\""));
  assert(Contains(doc, "viewBox=\"0 0 128 296\""));
  assert(Contains(doc, "xmlns=\"http://www.w3.org/2000/svg\""));
  assert(Contains(doc, "xmlns:xlink=\"http://www.w3.org/1999/xlink\""));
}

void TestBodyIsEmbeddedVerbatim() {
  const std::string body = "<text x=\"1\" y=\"2\">a &amp; b</text>\n<rect width=\"3\" height=\"4\"/>";
  const auto        doc  = WrapVectorBody(body, DisplayGeometry{296, 128});

  const auto open_end = doc.find(">\n");
  assert(open_end != std::string::npos);
  assert(doc.compare(open_end + 2, body.size(), body) == 0);
  assert(doc.size() >= 7);
  assert(doc.substr(doc.size() - 7) == "</svg>\n");
}

void TestEmptyBodyStillWellFormed() {
  const auto doc = WrapVectorBody("", DisplayGeometry{1, 1});
  assert(doc.rfind("<svg", 0) == 0);
  assert(Contains(doc, "viewBox=\"0 0 1 1\""));
  assert(Contains(doc, "</svg>"));
}

} // namespace

int main() {
  TestRootCarriesGeometry();
  TestBodyIsEmbeddedVerbatim();
  TestEmptyBodyStillWellFormed();

  std::cout << "epd_unit_svg_document: pass\n";
  return 0;
}
