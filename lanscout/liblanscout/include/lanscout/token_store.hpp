/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file token_store.hpp
 * @brief Persistence of the appliance app token across runs
 **/

#ifndef _LANSCOUT_TOKEN_STORE_HPP_
#define _LANSCOUT_TOKEN_STORE_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <memory>
#include <mutex>
#include <string>

/** lanscout namespace */
namespace lanscout
{

class LANSCOUTAPI TokenStore
{
public:
    virtual ~TokenStore() = default;

    /**
     * @return Upon success, returns the stored app token. Returns Unexpected of ::LANSCOUT_NOT_FOUND when no token
     *         is stored, or another status on storage failure.
     */
    virtual Expected<std::string> load_app_token() = 0;
    virtual lanscout_status save_app_token(const std::string &app_token) = 0;
    virtual lanscout_status clear_app_token() = 0;
};

class LANSCOUTAPI MemoryTokenStore final : public TokenStore
{
public:
    MemoryTokenStore() = default;

    virtual Expected<std::string> load_app_token() override;
    virtual lanscout_status save_app_token(const std::string &app_token) override;
    virtual lanscout_status clear_app_token() override;

private:
    std::mutex m_mutex;
    std::string m_app_token;
};

/** Stores the token in a JSON file readable by the owner only */
class LANSCOUTAPI FileTokenStore final : public TokenStore
{
public:
    explicit FileTokenStore(const std::string &file_path);

    virtual Expected<std::string> load_app_token() override;
    virtual lanscout_status save_app_token(const std::string &app_token) override;
    virtual lanscout_status clear_app_token() override;

    const std::string &file_path() const { return m_file_path; }

private:
    const std::string m_file_path;
    std::mutex m_mutex;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_TOKEN_STORE_HPP_ */
