#include <catch2/catch_all.hpp>

#include "pdf_layout.hpp"

#include <string>

using namespace invoicemap;

TEST_CASE("parseBboxLayout groups words into lines per page", "[pdf]") {
  const std::string xmlish =
    "<doc>\n"
    "<page width=\"612.0\" height=\"792.0\">\n"
    "  <flow><block><line>\n"
    "    <word xMin=\"10.0\" yMin=\"10.0\" xMax=\"50.0\" yMax=\"20.0\">Invoice</word>\n"
    "    <word xMin=\"55.0\" yMin=\"11.0\" xMax=\"80.0\" yMax=\"21.0\">#:</word>\n"
    "    <word xMin=\"85.0\" yMin=\"10.0\" xMax=\"140.0\" yMax=\"20.0\">INV-7</word>\n"
    "  </line></block></flow>\n"
    "  <word xMin=\"10.0\" yMin=\"40.0\" xMax=\"40.0\" yMax=\"50.0\">Total</word>\n"
    "</page>\n"
    "<page width=\"612.0\" height=\"792.0\">\n"
    "  <word xMin=\"10.0\" yMin=\"10.0\" xMax=\"40.0\" yMax=\"20.0\">A&amp;B</word>\n"
    "</page>\n"
    "</doc>\n";

  auto pages = parseBboxLayout(xmlish);
  REQUIRE(pages.size() == 2);

  REQUIRE(pages[0].pageNumber == 1);
  REQUIRE(pages[0].lines.size() == 2);
  REQUIRE(pages[0].lines[0].content == "Invoice #: INV-7");
  REQUIRE(pages[0].lines[1].content == "Total");

  const auto& box = pages[0].lines[0].boundingBox;
  REQUIRE(box.has_value());
  REQUIRE(box->xMin == 10.0);
  REQUIRE(box->yMin == 10.0);
  REQUIRE(box->xMax == 140.0);
  REQUIRE(box->yMax == 21.0);

  REQUIRE(pages[1].pageNumber == 2);
  REQUIRE(pages[1].lines.size() == 1);
  REQUIRE(pages[1].lines[0].content == "A&B");
}

TEST_CASE("parseBboxLayout tolerates input without words", "[pdf]") {
  REQUIRE(parseBboxLayout("").empty());
  REQUIRE(parseBboxLayout("<doc><page width=\"1\" height=\"1\"></page></doc>").empty());
}
