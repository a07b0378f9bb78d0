#include "sandbox/scratch_directory.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <system_error>
#include <vector>

#include "utils/logging.hpp"

namespace vizrun::sandbox {
namespace {

// User code may have stripped permissions from what it created; restore owner
// access so remove_all can descend.
void RestoreOwnerAccess(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::permissions(root, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add, ec);
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        const auto status = it->symlink_status(ec);
        if (!ec && std::filesystem::is_directory(status)) {
            std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ec);
        }
        ec.clear();
        it.increment(ec);
    }
}

}  // namespace

ScratchDirectory::ScratchDirectory(const std::filesystem::path& root) {
    std::filesystem::create_directories(root);

    auto pattern = (root / "run-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
    }
    path_ = std::filesystem::path(buffer.data());

    std::error_code ec;
    std::filesystem::create_directory(WorkDir(), ec);
    if (ec) {
        std::filesystem::remove_all(path_, ec);
        throw std::system_error(ec, "create " + WorkDir().string());
    }
}

ScratchDirectory::~ScratchDirectory() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        RestoreOwnerAccess(path_);
        ec.clear();
        std::filesystem::remove_all(path_, ec);
    }
    if (ec) {
        utils::LogError("sandbox", "failed to remove scratch directory",
                        {{"path", path_.string()}, {"error", ec.message()}});
    }
}

}  // namespace vizrun::sandbox
