#include <catch2/catch_test_macros.hpp>
#include "pluscode/validator.hpp"
#include "pluscode/decoder.hpp"
#include <string>
#include <vector>

using namespace pluscode;

namespace {

struct ValidityCase {
    std::string code;
    bool is_valid;
    bool is_short;
    bool is_full;
};

const std::vector<ValidityCase> validity_cases = {
    // full codes
    {"8FWC2345+G6", true, false, true},
    {"8FWC2345+G6G", true, false, true},
    {"8fwc2345+", true, false, true},
    {"8FWCX400+", true, false, true},
    {"8FVC9G8F+6XQQQQQQQ", true, false, true},
    // short codes
    {"WC2345+G6g", true, true, false},
    {"2345+G6", true, true, false},
    {"45+G6", true, true, false},
    {"+G6", true, true, false},
    // well formed, but outside the legal coordinate range
    {"X2222222+22", true, false, false},
    {"2X222222+22", true, false, false},
    // invalid
    {"", false, false, false},
    {"+", false, false, false},
    {"G+", false, false, false},
    {"8FWC2345", false, false, false},
    {"8FWC2345+G", false, false, false},
    {"8FWC2_45+G6", false, false, false},
    {"8FWC2\xce\xb7" "45+G6", false, false, false},
    {"8FWC2345+G6+", false, false, false},
    {"8FWC2345G6+", false, false, false},
    {"8FWC2300+G6", false, false, false},
    {"WC2300+G6g", false, false, false},
    {"WC2345+G", false, false, false},
    {"WC2300+", false, false, false},
    {"0FWC2345+", false, false, false},
    {"8FWC2000+", false, false, false},
    {"8F0C0000+", false, false, false},
    {"8FWC2345+G0", false, false, false},
    {"849VGJQF", false, false, false},
};

} // namespace

// ============================================================================
// is_valid / is_short / is_full tests
// ============================================================================

TEST_CASE("Validity table", "[validator]") {
    for (const auto& c : validity_cases) {
        INFO("code: " << c.code);
        REQUIRE(is_valid(c.code) == c.is_valid);
        REQUIRE(is_short(c.code) == c.is_short);
        REQUIRE(is_full(c.code) == c.is_full);
    }
}

TEST_CASE("Validator consistency", "[validator]") {
    for (const auto& c : validity_cases) {
        INFO("code: " << c.code);
        if (is_full(c.code)) {
            REQUIRE(is_valid(c.code));
            REQUIRE(!is_short(c.code));
        }
        if (is_short(c.code)) {
            REQUIRE(is_valid(c.code));
            REQUIRE(!is_full(c.code));
        }
    }
}

TEST_CASE("Validator literal scenarios", "[validator]") {
    REQUIRE(is_valid("8FVC9G8F+6X"));
    REQUIRE(is_valid("8FVC9G8F+6XQ"));
    REQUIRE(!is_valid("invalid"));
    REQUIRE(!is_valid("8FVC9G8F6X"));

    REQUIRE(is_short("9G8F+6X"));
    REQUIRE(is_short("8F+6X"));
    REQUIRE(!is_short("8FVC9G8F+6X"));

    REQUIRE(is_full("8FVC9G8F+6X"));
    REQUIRE(!is_full("9G8F+6X"));
}

TEST_CASE("Padding rules", "[validator]") {
    SECTION("padded full codes of every even length") {
        REQUIRE(is_full("8F000000+"));
        REQUIRE(is_full("8FVC0000+"));
        REQUIRE(is_full("8FVC9G00+"));
    }

    SECTION("padded codes need a full prefix and nothing after the separator") {
        REQUIRE(!is_valid("8FVC00+"));
        REQUIRE(!is_valid("8FVC0000+22"));
    }

    SECTION("digits between the padding and the separator are allowed") {
        // 0 が偶数個連続し、コードが + で終わっていればよい
        REQUIRE(is_valid("8FGG00GG+"));
        REQUIRE(is_full("8FGG00GG+"));
        REQUIRE(!is_short("8FGG00GG+"));

        auto area = decode("8FGG00GG+");
        REQUIRE(area.ok());
        REQUIRE(area->code_length == 6);
    }

    SECTION("odd padding run") {
        REQUIRE(!is_valid("8FVCC000+"));
    }
}
