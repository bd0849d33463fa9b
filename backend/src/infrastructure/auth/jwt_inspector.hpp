#pragma once

#include "../../domain/interfaces.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace proptrade::infrastructure::auth {

// HS256 JWT verification against a shared secret
class JwtInspector : public proptrade::domain::IAuthInspector {
private:
    std::string secret_;
    std::string issuer_;
    std::string audience_;

    bool audienceMatches(const nlohmann::json& claims) const;

public:
    JwtInspector(std::string secret, std::string issuer = "propfirm-api", std::string audience = "propfirm-client");

    std::optional<proptrade::domain::Principal> verify(const std::string& token) override;
    std::optional<proptrade::domain::Principal> verifyAt(const std::string& token, int64_t nowSeconds) const;

    // Encoding helpers, also used to mint tokens in tests
    static std::string base64UrlEncode(const std::string& data);
    static std::optional<std::string> base64UrlDecode(const std::string& data);
    static std::string hmacSha256(const std::string& key, const std::string& data);
    static std::string sign(const nlohmann::json& claims, const std::string& secret);
};

} // namespace proptrade::infrastructure::auth
