#pragma once

#include <mailpipe/common.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace mailpipe {

    /// Replace `path` with `text` through `<path>.tmp` and a rename, so readers see
    /// either the old contents or the new ones, never a partial write.
    /// Errors: io_error naming `what` when writing or renaming fails
    inline dp::Res<void> write_file_atomically(const std::filesystem::path &path, const std::string &text,
                                               const char *what) {
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                echo::error("cannot open ", tmp.string(), " for writing");
                return dp::result::err(dp::Error::io_error(dp::String("cannot write ") + what));
            }
            out << text;
            out.flush();
            if (!out) {
                echo::error("short write to ", tmp.string());
                return dp::result::err(dp::Error::io_error(dp::String("cannot write ") + what));
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            echo::error("rename ", tmp.string(), " -> ", path.string(), " failed: ", ec.message());
            std::filesystem::remove(tmp, ec);
            return dp::result::err(dp::Error::io_error(dp::String("cannot replace ") + what));
        }
        return dp::result::ok();
    }

    inline bool file_exists(const std::filesystem::path &path) {
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    }

} // namespace mailpipe
