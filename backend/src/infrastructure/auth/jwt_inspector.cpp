#include "jwt_inspector.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <chrono>
#include <iostream>
#include <vector>

namespace proptrade::infrastructure::auth {

JwtInspector::JwtInspector(std::string secret, std::string issuer, std::string audience)
    : secret_(std::move(secret)), issuer_(std::move(issuer)), audience_(std::move(audience)) {
}

std::string JwtInspector::base64UrlEncode(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));

    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (auto& c : encoded) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return encoded;
}

std::optional<std::string> JwtInspector::base64UrlDecode(const std::string& data) {
    std::string standard = data;
    for (auto& c : standard) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return std::nullopt;
    }
    size_t padding = (4 - standard.size() % 4) % 4;
    if (padding == 3) {
        return std::nullopt;
    }
    standard.append(padding, '=');

    std::vector<unsigned char> out(standard.size() / 4 * 3 + 1);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                  static_cast<int>(standard.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written) - padding);
}

std::string JwtInspector::hmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &length);
    return std::string(reinterpret_cast<const char*>(digest), length);
}

std::string JwtInspector::sign(const nlohmann::json& claims, const std::string& secret) {
    nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};
    std::string signingInput = base64UrlEncode(header.dump()) + "." + base64UrlEncode(claims.dump());
    return signingInput + "." + base64UrlEncode(hmacSha256(secret, signingInput));
}

bool JwtInspector::audienceMatches(const nlohmann::json& claims) const {
    if (audience_.empty()) {
        return true;
    }
    if (!claims.contains("aud")) {
        return false;
    }
    const auto& aud = claims["aud"];
    if (aud.is_string()) {
        return aud.get<std::string>() == audience_;
    }
    if (aud.is_array()) {
        for (const auto& entry : aud) {
            if (entry.is_string() && entry.get<std::string>() == audience_) {
                return true;
            }
        }
    }
    return false;
}

std::optional<proptrade::domain::Principal> JwtInspector::verify(const std::string& token) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return verifyAt(token, now);
}

std::optional<proptrade::domain::Principal> JwtInspector::verifyAt(const std::string& token, int64_t nowSeconds) const {
    if (token.empty()) {
        return std::nullopt;
    }

    auto firstDot = token.find('.');
    auto secondDot = firstDot == std::string::npos ? std::string::npos : token.find('.', firstDot + 1);
    if (secondDot == std::string::npos || token.find('.', secondDot + 1) != std::string::npos) {
        return std::nullopt;
    }

    std::string signingInput = token.substr(0, secondDot);
    std::string signature = token.substr(secondDot + 1);
    std::string expected = base64UrlEncode(hmacSha256(secret_, signingInput));
    if (signature.size() != expected.size() ||
        CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
        std::cout << "[Auth] Token signature mismatch" << std::endl;
        return std::nullopt;
    }

    auto headerText = base64UrlDecode(token.substr(0, firstDot));
    auto payloadText = base64UrlDecode(token.substr(firstDot + 1, secondDot - firstDot - 1));
    if (!headerText || !payloadText) {
        return std::nullopt;
    }

    try {
        auto header = nlohmann::json::parse(*headerText);
        if (header.value("alg", "") != "HS256") {
            return std::nullopt;
        }

        auto claims = nlohmann::json::parse(*payloadText);
        if (!claims.is_object()) {
            return std::nullopt;
        }
        if (claims.contains("exp") && (!claims["exp"].is_number() || claims["exp"].get<int64_t>() <= nowSeconds)) {
            std::cout << "[Auth] Token expired" << std::endl;
            return std::nullopt;
        }
        if (claims.contains("nbf") && (!claims["nbf"].is_number() || claims["nbf"].get<int64_t>() > nowSeconds)) {
            return std::nullopt;
        }
        if (!issuer_.empty() && claims.value("iss", "") != issuer_) {
            return std::nullopt;
        }
        if (!audienceMatches(claims)) {
            return std::nullopt;
        }

        std::string userId = claims.value("userId", "");
        if (userId.empty()) {
            return std::nullopt;
        }

        std::vector<std::string> roles;
        if (claims.contains("role") && claims["role"].is_string()) {
            roles.push_back(claims["role"].get<std::string>());
        }
        return proptrade::domain::Principal(userId, roles);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Auth] Malformed token claims: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace proptrade::infrastructure::auth
