#pragma once

#include <filesystem>

namespace vizrun::sandbox {

// A private (0700) directory under root, removed with everything in it when
// the owner goes out of scope. Layout:
//   work/          working directory, HOME and TMPDIR of the worker
//   stdout.log     captured standard output
//   stderr.log     captured standard error
//   artifact.*     the artifact channel
class ScratchDirectory {
public:
    // Throws std::system_error when the directory cannot be created.
    explicit ScratchDirectory(const std::filesystem::path& root);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::filesystem::path WorkDir() const { return path_ / "work"; }

private:
    std::filesystem::path path_;
};

}  // namespace vizrun::sandbox
