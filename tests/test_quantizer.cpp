#include "testhelpers.h"

#include "convert/quantizer.h"

TEST_CASE("Quantizer: rounds to the nearest grid multiple", "[quantizer]") {
    REQUIRE(Quantizer::quantize(1.04, 0.1) == Approx(1.0));
    REQUIRE(Quantizer::quantize(1.06, 0.1) == Approx(1.1));
    REQUIRE(Quantizer::quantize(-0.01, 0.1) == 0.0);
}

TEST_CASE("Quantizer: non-positive tolerance leaves values alone", "[quantizer]") {
    REQUIRE(Quantizer::quantize(1.2345, 0.0) == 1.2345);
    REQUIRE(Quantizer::quantize(1.2345, -1.0) == 1.2345);
}

TEST_CASE("Quantizer: nearby end points share one node key", "[quantizer]") {
    const double tol = 0.01;
    // Both points fall inside the same grid cell around (1.00, 2.00)
    const Vertex a(1.0001, 2.0002);
    const Vertex b(0.9978, 2.0031);
    REQUIRE(Quantizer::node(a, tol) == Quantizer::node(b, tol));

    const Vertex far(1.02, 2.0);
    REQUIRE(Quantizer::node(a, tol) != Quantizer::node(far, tol));
}

TEST_CASE("Quantizer: signed zero maps to one key", "[quantizer]") {
    const QuantizedNode a = Quantizer::node(Vertex(-0.001, 0.001), 0.1);
    const QuantizedNode b = Quantizer::node(Vertex(0.001, -0.001), 0.1);
    REQUIRE(a == b);
    REQUIRE(qHash(a) == qHash(b));
}

TEST_CASE("Quantizer: close points on either side of a cell boundary round apart", "[quantizer]") {
    // 0.002 apart, but 1.05 is the rounding boundary of a 0.1 grid
    const Vertex a(1.049, 0.0);
    const Vertex b(1.051, 0.0);
    REQUIRE(Quantizer::node(a, 0.1) != Quantizer::node(b, 0.1));
}

TEST_CASE("NodeIndex: end points within half the tolerance share a key", "[quantizer][nodes]") {
    NodeIndex nodes(0.1);
    const int a = nodes.add(Vertex(1.049, 0.0));
    const int b = nodes.add(Vertex(1.051, 0.0));
    const int c = nodes.add(Vertex(1.049, 0.2));
    const int d = nodes.add(Vertex(5.0, 5.0));

    REQUIRE(nodes.size() == 4);
    REQUIRE(nodes.key(a) == nodes.key(b));
    REQUIRE(nodes.key(a) == Quantizer::node(Vertex(1.049, 0.0), 0.1));
    REQUIRE(nodes.key(a) != nodes.key(c));
    REQUIRE(nodes.key(a) != nodes.key(d));
}

TEST_CASE("NodeIndex: clusters join through intermediate points", "[quantizer][nodes]") {
    NodeIndex nodes(0.1);
    // First and last are 0.08 apart; each neighbour pair is 0.04 apart
    const int first = nodes.add(Vertex(0.0, 0.0));
    const int last = nodes.add(Vertex(0.08, 0.0));
    REQUIRE(nodes.key(first) != nodes.key(last));

    nodes.add(Vertex(0.04, 0.0));
    REQUIRE(nodes.key(first) == nodes.key(last));
}
