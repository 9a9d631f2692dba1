/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file token_store.cpp
 * @brief App token stores
 **/

#include "lanscout/token_store.hpp"

#include "common/utils.hpp"
#include "common/filesystem.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanscout
{

static const std::string APP_TOKEN_KEY = "app_token";
#define JSON_PRINT_INDENTATION (4)

Expected<std::string> MemoryTokenStore::load_app_token()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_app_token.empty()) {
        return make_unexpected(LANSCOUT_NOT_FOUND);
    }
    return std::string(m_app_token);
}

lanscout_status MemoryTokenStore::save_app_token(const std::string &app_token)
{
    CHECK(!app_token.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty app token");
    std::unique_lock<std::mutex> lock(m_mutex);
    m_app_token = app_token;
    return LANSCOUT_SUCCESS;
}

lanscout_status MemoryTokenStore::clear_app_token()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_app_token.clear();
    return LANSCOUT_SUCCESS;
}

FileTokenStore::FileTokenStore(const std::string &file_path) :
    m_file_path(file_path)
{}

Expected<std::string> FileTokenStore::load_app_token()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!Filesystem::does_file_exists(m_file_path)) {
        return make_unexpected(LANSCOUT_NOT_FOUND);
    }

    TRY(const auto content, Filesystem::read_file(m_file_path));
    std::string app_token;
    try {
        const auto stored = json::parse(content);
        CHECK_AS_EXPECTED(stored.is_object(), LANSCOUT_FILE_OPERATION_FAILURE, "Token file {} is not a JSON object",
            m_file_path);
        app_token = stored.value(APP_TOKEN_KEY, std::string());
    } catch (const json::exception &e) {
        LOGGER__ERROR("Failed parsing token file {}: {}", m_file_path, e.what());
        return make_unexpected(LANSCOUT_FILE_OPERATION_FAILURE);
    }

    if (app_token.empty()) {
        return make_unexpected(LANSCOUT_NOT_FOUND);
    }
    return app_token;
}

lanscout_status FileTokenStore::save_app_token(const std::string &app_token)
{
    CHECK(!app_token.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty app token");

    const json stored = {
        {APP_TOKEN_KEY, app_token},
    };

    std::unique_lock<std::mutex> lock(m_mutex);
    auto status = Filesystem::write_file_atomic(m_file_path, stored.dump(JSON_PRINT_INDENTATION), true);
    CHECK_SUCCESS(status, "Failed saving app token to {}", m_file_path);

    LOGGER__DEBUG("App token saved to {}", m_file_path);
    return LANSCOUT_SUCCESS;
}

lanscout_status FileTokenStore::clear_app_token()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto status = Filesystem::remove_file(m_file_path);
    CHECK_SUCCESS(status, "Failed removing token file {}", m_file_path);
    return LANSCOUT_SUCCESS;
}

} /* namespace lanscout */
