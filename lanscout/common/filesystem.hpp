/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file filesystem.hpp
 * @brief File system API
 **/

#ifndef _OS_FILESYSTEM_HPP_
#define _OS_FILESYSTEM_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/platform.h"

#include "lanscout/expected.hpp"
#include <string>
#include <algorithm>


namespace lanscout
{

class Filesystem final {
public:
    Filesystem() = delete;

    static Expected<bool> is_directory(const std::string &path);
    static lanscout_status create_directory(const std::string &dir_path);
    static std::string get_home_directory();
    static bool does_file_exists(const std::string &path);
    static lanscout_status remove_file(const std::string &path);

    static Expected<std::string> read_file(const std::string &path);

    // Writes content to a sibling temporary file and renames it over path, so readers never see a partial file.
    // When private_permissions is set the file is created with mode 0600.
    static lanscout_status write_file_atomic(const std::string &path, const std::string &content,
        bool private_permissions = false);

    // Expands a leading "~/" into the home directory
    static std::string expand_home(const std::string &path);

    static std::string join(const std::string &dir_path, const std::string &file_name)
    {
        if (dir_path.empty() || (dir_path.back() == SEPARATOR[0])) {
            return dir_path + file_name;
        }
        return dir_path + SEPARATOR + file_name;
    }

    // Emultes https://docs.python.org/3/library/os.path.html#os.path.dirname
    static std::string dirname(const std::string &file_name)
    {
        const auto last_separator_index = file_name.find_last_of(SEPARATOR);
        if (std::string::npos == last_separator_index) {
            return "";
        }
        return file_name.substr(0, last_separator_index);
    }

private:
    // OS-specific filesystem directory separator char
    static const char *SEPARATOR;
};

} /* namespace lanscout */

#endif /* _OS_FILESYSTEM_HPP_ */
