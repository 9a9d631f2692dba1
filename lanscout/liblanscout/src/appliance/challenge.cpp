/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file challenge.cpp
 * @brief Session login challenge-response
 **/

#include "lanscout/appliance_api.hpp"

#include "common/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <climits>

namespace lanscout
{

Expected<std::string> compute_challenge_password(const std::string &app_token, const std::string &challenge)
{
    CHECK_AS_EXPECTED(!app_token.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty app token");
    CHECK_AS_EXPECTED(app_token.size() <= INT_MAX, LANSCOUT_INVALID_ARGUMENT, "App token too long");

    std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    auto result = HMAC(EVP_sha1(), app_token.data(), static_cast<int>(app_token.size()),
        reinterpret_cast<const unsigned char*>(challenge.data()), challenge.size(), digest.data(), &digest_length);
    CHECK_NOT_NULL_AS_EXPECTED(result, LANSCOUT_CRYPTO_FAILURE);
    CHECK_AS_EXPECTED(static_cast<unsigned int>(EVP_MD_get_size(EVP_sha1())) == digest_length,
        LANSCOUT_CRYPTO_FAILURE, "Unexpected HMAC-SHA1 length {}", digest_length);

    return StringUtils::to_hex_string(digest.data(), digest_length, false);
}

} /* namespace lanscout */
