/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file filesystem.cpp
 * @brief Filesystem wrapper for Linux
 **/

#include "common/filesystem.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <pwd.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace lanscout
{

const char *Filesystem::SEPARATOR = "/";
static const std::string HOME_PREFIX = "~/";
static const std::string TEMP_FILE_SUFFIX = ".tmp";

Expected<bool> Filesystem::is_directory(const std::string &path)
{
    struct stat path_stat{};
    auto ret_Val = stat(path.c_str(), &path_stat);
    if (ret_Val != 0 && (errno == ENOENT)) {
        // Directory path does not exist
        return false;
    }
    CHECK(0 == ret_Val, make_unexpected(LANSCOUT_FILE_OPERATION_FAILURE),
        "stat() on path \"{}\" failed. errno {}", path.c_str(), errno);

   return S_ISDIR(path_stat.st_mode);
}

lanscout_status Filesystem::create_directory(const std::string &dir_path)
{
    CHECK(!dir_path.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty directory path");

    // Create every missing parent, like "mkdir -p"
    for (size_t index = dir_path.find(SEPARATOR, 1); std::string::npos != index; index = dir_path.find(SEPARATOR, index + 1)) {
        const auto parent = dir_path.substr(0, index);
        auto ret_val = mkdir(parent.c_str(), S_IRWXU);
        CHECK((ret_val == 0) || (errno == EEXIST), LANSCOUT_FILE_OPERATION_FAILURE,
            "Failed to create directory {}, errno {}", parent, errno);
    }

    auto ret_val = mkdir(dir_path.c_str(), S_IRWXU);
    CHECK((ret_val == 0) || (errno == EEXIST), LANSCOUT_FILE_OPERATION_FAILURE,
        "Failed to create directory {}, errno {}", dir_path, errno);
    return LANSCOUT_SUCCESS;
}

std::string Filesystem::get_home_directory()
{
    const char *homedir = getenv("HOME");
    if (NULL == homedir) {
        const auto pw = getpwuid(getuid());
        homedir = (nullptr != pw) ? pw->pw_dir : "/tmp";
    }

    return homedir;
}

std::string Filesystem::expand_home(const std::string &path)
{
    if (0 != path.compare(0, HOME_PREFIX.size(), HOME_PREFIX)) {
        return path;
    }
    return join(get_home_directory(), path.substr(HOME_PREFIX.size()));
}

bool Filesystem::does_file_exists(const std::string &path)
{
    // From https://stackoverflow.com/a/12774387
    struct stat buffer;
    return (0 == stat(path.c_str(), &buffer));
}

lanscout_status Filesystem::remove_file(const std::string &path)
{
    auto ret_val = unlink(path.c_str());
    CHECK((0 == ret_val) || (ENOENT == errno), LANSCOUT_FILE_OPERATION_FAILURE,
        "Failed to remove file {}, errno {}", path, errno);
    return LANSCOUT_SUCCESS;
}

Expected<std::string> Filesystem::read_file(const std::string &path)
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    CHECK_AS_EXPECTED(file.is_open(), LANSCOUT_OPEN_FILE_FAILURE, "Failed opening file {}, errno {}", path, errno);

    std::stringstream content;
    content << file.rdbuf();
    CHECK_AS_EXPECTED(!file.bad(), LANSCOUT_FILE_OPERATION_FAILURE, "Failed reading file {}", path);

    return content.str();
}

lanscout_status Filesystem::write_file_atomic(const std::string &path, const std::string &content,
    bool private_permissions)
{
    const auto dir_path = dirname(path);
    if (!dir_path.empty()) {
        auto status = create_directory(dir_path);
        CHECK_SUCCESS(status);
    }

    const auto temp_path = path + TEMP_FILE_SUFFIX;
    const mode_t mode = private_permissions ? (S_IRUSR | S_IWUSR) : (S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    CHECK(-1 != fd, LANSCOUT_OPEN_FILE_FAILURE, "Failed opening file {}, errno {}", temp_path, errno);

    lanscout_status status = LANSCOUT_SUCCESS;
    if (private_permissions && (0 != fchmod(fd, mode))) {
        LOGGER__ERROR("Failed setting permissions of {}, errno {}", temp_path, errno);
        status = LANSCOUT_FILE_OPERATION_FAILURE;
    }

    size_t offset = 0;
    while ((LANSCOUT_SUCCESS == status) && (offset < content.size())) {
        const auto written = write(fd, content.data() + offset, content.size() - offset);
        if ((-1 == written) && (EINTR == errno)) {
            continue;
        }
        if (0 > written) {
            LOGGER__ERROR("Failed writing file {}, errno {}", temp_path, errno);
            status = LANSCOUT_FILE_OPERATION_FAILURE;
            break;
        }
        offset += static_cast<size_t>(written);
    }

    if ((LANSCOUT_SUCCESS == status) && (0 != fsync(fd))) {
        LOGGER__ERROR("Failed syncing file {}, errno {}", temp_path, errno);
        status = LANSCOUT_FILE_OPERATION_FAILURE;
    }

    CLOSE(fd, status);
    if (LANSCOUT_SUCCESS != status) {
        (void) unlink(temp_path.c_str());
        return status;
    }

    auto ret_val = rename(temp_path.c_str(), path.c_str());
    if (0 != ret_val) {
        LOGGER__ERROR("Failed renaming {} to {}, errno {}", temp_path, path, errno);
        (void) unlink(temp_path.c_str());
        return LANSCOUT_FILE_OPERATION_FAILURE;
    }

    return LANSCOUT_SUCCESS;
}

} /* namespace lanscout */
