#pragma once
#include <string>

#include <finbot/status.h>

namespace finbot::storage
{
    bool EnsureDirExists(const std::string &path);

    bool FsyncDirPath(const std::string &dir);

    bool AtomicRename(const std::string &tmp_path, const std::string &final_path);

    // Reads the whole file in binary mode. NotFound when it does not exist.
    Status ReadFileToString(const std::string &path, std::string *out);

    // Writes `data` to `path`, fsyncs it and closes it. Truncates existing files.
    Status WriteStringToFileSync(const std::string &path, const std::string &data);
}
