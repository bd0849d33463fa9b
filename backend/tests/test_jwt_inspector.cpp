#include <catch2/catch_test_macros.hpp>
#include "infrastructure/auth/jwt_inspector.hpp"

using namespace proptrade::infrastructure::auth;
using nlohmann::json;

namespace {

const std::string kSecret = "test-secret-key";
constexpr int64_t kNow = 1700000000;

json validClaims() {
    return json{{"userId", "user-1"},
                {"role", "trader"},
                {"iss", "propfirm-api"},
                {"aud", "propfirm-client"},
                {"iat", kNow - 60},
                {"exp", kNow + 3600}};
}

} // namespace

TEST_CASE("JwtInspector - Token Validation", "[auth]") {
    JwtInspector inspector(kSecret);

    SECTION("Valid token") {
        auto result = inspector.verifyAt(JwtInspector::sign(validClaims(), kSecret), kNow);
        REQUIRE(result.has_value());
        REQUIRE(result->subject == "user-1");
        REQUIRE(result->roles.size() == 1);
        REQUIRE(result->roles[0] == "trader");
    }

    SECTION("Audience may be a list") {
        auto claims = validClaims();
        claims["aud"] = json::array({"other", "propfirm-client"});
        REQUIRE(inspector.verifyAt(JwtInspector::sign(claims, kSecret), kNow).has_value());
    }

    SECTION("Signed with another secret") {
        REQUIRE_FALSE(inspector.verifyAt(JwtInspector::sign(validClaims(), "wrong-secret"), kNow).has_value());
    }

    SECTION("Tampered payload") {
        auto token = JwtInspector::sign(validClaims(), kSecret);
        auto forged = validClaims();
        forged["userId"] = "user-2";
        auto firstDot = token.find('.');
        auto secondDot = token.find('.', firstDot + 1);
        std::string tampered = token.substr(0, firstDot + 1) + JwtInspector::base64UrlEncode(forged.dump()) +
                               token.substr(secondDot);
        REQUIRE_FALSE(inspector.verifyAt(tampered, kNow).has_value());
    }

    SECTION("Expired") {
        auto token = JwtInspector::sign(validClaims(), kSecret);
        REQUIRE_FALSE(inspector.verifyAt(token, kNow + 3600).has_value());
    }

    SECTION("Not yet valid") {
        auto claims = validClaims();
        claims["nbf"] = kNow + 10;
        REQUIRE_FALSE(inspector.verifyAt(JwtInspector::sign(claims, kSecret), kNow).has_value());
    }

    SECTION("Wrong issuer or audience") {
        auto claims = validClaims();
        claims["iss"] = "someone-else";
        REQUIRE_FALSE(inspector.verifyAt(JwtInspector::sign(claims, kSecret), kNow).has_value());

        claims = validClaims();
        claims["aud"] = "someone-else";
        REQUIRE_FALSE(inspector.verifyAt(JwtInspector::sign(claims, kSecret), kNow).has_value());
    }

    SECTION("Missing userId") {
        auto claims = validClaims();
        claims.erase("userId");
        REQUIRE_FALSE(inspector.verifyAt(JwtInspector::sign(claims, kSecret), kNow).has_value());
    }

    SECTION("Malformed tokens") {
        REQUIRE_FALSE(inspector.verify("").has_value());
        REQUIRE_FALSE(inspector.verify("not-a-token").has_value());
        REQUIRE_FALSE(inspector.verify("a.b.c.d").has_value());
    }
}

TEST_CASE("JwtInspector - Role Validation", "[auth]") {
    JwtInspector inspector(kSecret);

    SECTION("Role claim becomes the principal role") {
        auto result = inspector.verifyAt(JwtInspector::sign(validClaims(), kSecret), kNow);
        REQUIRE(result.has_value());
        REQUIRE(result->hasRole("trader"));
        REQUIRE_FALSE(result->hasRole("admin"));
    }

    SECTION("No role claim means no roles") {
        auto claims = validClaims();
        claims.erase("role");
        auto result = inspector.verifyAt(JwtInspector::sign(claims, kSecret), kNow);
        REQUIRE(result.has_value());
        REQUIRE(result->roles.empty());
    }
}

TEST_CASE("JwtInspector - Base64Url", "[auth]") {
    REQUIRE(JwtInspector::base64UrlEncode("\xfb\xff") == "-_8");
    REQUIRE(*JwtInspector::base64UrlDecode("-_8") == "\xfb\xff");
    REQUIRE(*JwtInspector::base64UrlDecode(JwtInspector::base64UrlEncode("{\"a\":1}")) == "{\"a\":1}");
    REQUIRE_FALSE(JwtInspector::base64UrlDecode("a+b=").has_value());
}
