#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "base64_utils.hpp"
#include "geometry.hpp"
#include "test_support.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static void testDistance() {
    CHECK_NEAR(Geometry::distance({0, 0}, {3, 4}), 5.0, 1e-9);
    CHECK_NEAR(Geometry::distance({-2.5f, 1}, {-2.5f, 1}), 0.0, 1e-12);
    CHECK_NEAR(Geometry::distance({10, 0}, {0, 0}), Geometry::distance({0, 0}, {10, 0}), 1e-12);
}

static void testLineIntersection() {
    std::optional<cv::Point2f> cross = Geometry::lineIntersection({0, 5}, 0.0, {3, 0}, M_PI / 2);
    CHECK(cross.has_value());
    if (cross) {
        CHECK_NEAR(cross->x, 3.0, 1e-4);
        CHECK_NEAR(cross->y, 5.0, 1e-4);
    }

    std::optional<cv::Point2f> diagonal =
        Geometry::lineIntersection({0, 0}, M_PI / 4, {10, 0}, 3 * M_PI / 4);
    CHECK(diagonal.has_value());
    if (diagonal) {
        CHECK_NEAR(diagonal->x, 5.0, 1e-4);
        CHECK_NEAR(diagonal->y, 5.0, 1e-4);
    }

    CHECK(!Geometry::lineIntersection({0, 0}, 0.3, {0, 10}, 0.3));
    CHECK(!Geometry::lineIntersection({0, 0}, 0.3, {0, 10}, 0.3 + M_PI));

    // Nearly parallel, but above the default guard.
    CHECK(Geometry::lineIntersection({0, 0}, 0.0, {0, 10}, 0.01).has_value());
}

static void testBase64() {
    const std::string man = "Man";
    const std::string ma = "Ma";
    const std::string m = "M";
    CHECK(Base64Utils::encode(reinterpret_cast<const unsigned char*>(man.data()), man.size()) ==
          "TWFu");
    CHECK(Base64Utils::encode(reinterpret_cast<const unsigned char*>(ma.data()), ma.size()) ==
          "TWE=");
    CHECK(Base64Utils::encode(reinterpret_cast<const unsigned char*>(m.data()), m.size()) ==
          "TQ==");
    CHECK(Base64Utils::encode(nullptr, 0).empty());

    std::vector<unsigned char> decoded = Base64Utils::decode("TWE=");
    CHECK(std::string(decoded.begin(), decoded.end()) == "Ma");
    std::vector<unsigned char> unpadded = Base64Utils::decode("TQ");
    CHECK(std::string(unpadded.begin(), unpadded.end()) == "M");
    std::vector<unsigned char> wrapped = Base64Utils::decode("TW\nFu");
    CHECK(std::string(wrapped.begin(), wrapped.end()) == "Man");

    CHECK_THROWS(Base64Utils::decode("TW*u"), std::invalid_argument);
    CHECK_THROWS(Base64Utils::decode("T"), std::invalid_argument);
    CHECK_THROWS(Base64Utils::decode("TQ==TQ"), std::invalid_argument);

    CHECK(Base64Utils::stripDataUrlPrefix("data:image/png;base64,TWFu") == "TWFu");
    CHECK(Base64Utils::stripDataUrlPrefix("TWFu") == "TWFu");
    CHECK_THROWS(Base64Utils::stripDataUrlPrefix("data:text/plain,Man"), std::invalid_argument);
    CHECK_THROWS(Base64Utils::stripDataUrlPrefix("data:image/png;base64"), std::invalid_argument);
}

int main() {
    testDistance();
    testLineIntersection();
    testBase64();
    return finishTest("geometry_base64");
}
