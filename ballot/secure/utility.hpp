#pragma once

#include <filesystem>

namespace ballot
{
/** Root of the per user application data, `BALLOT_APP_PATH` overrides it */
std::filesystem::path app_path ();
/** Default data path of the coordinator */
std::filesystem::path working_path ();
std::filesystem::path random_filename ();
/** A new, empty directory under the working path, removed by remove_temporary_directories */
std::filesystem::path unique_path ();
void remove_temporary_directories ();
}
