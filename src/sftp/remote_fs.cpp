#include "remote_fs.hpp"
#include "remote_path.hpp"

Result<void> RemoteFs::mkdir_all(const std::string& path) {
    std::string p = clean_remote_path(path);

    auto st = stat(p);
    if (st.is_ok()) {
        if (st.value.is_dir()) return Result<void>::Ok();
        return Result<void>::Err("mkdir " + p + ": exists and is not a directory",
                                 ErrorCode::TRANSFER);
    }

    std::string parent = remote_dirname(p);
    if (parent != p && parent != "/" && parent != ".") {
        auto r = mkdir_all(parent);
        if (r.is_err()) return r;
    }

    auto r = mkdir(p);
    if (r.is_err()) {
        // Lost a race with another creator
        auto again = stat(p);
        if (again.is_ok() && again.value.is_dir()) return Result<void>::Ok();
        return r;
    }
    return Result<void>::Ok();
}
