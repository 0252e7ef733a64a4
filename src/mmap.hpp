#pragma once

#include "keel/utility.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace keel {

// Read-only view of a whole file. Empty files map to an empty view.
class MappedFile {
public:
    static Result<std::shared_ptr<MappedFile>> open(const std::filesystem::path &path) {
        std::shared_ptr<MappedFile> file(new MappedFile());

        file->fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (file->fd_ == -1) {
            return fail(ErrorKind::IO, "Failed to open file: " + path.string() + ": " + std::strerror(errno));
        }

        struct stat sb;
        if (fstat(file->fd_, &sb) == -1) {
            return fail(ErrorKind::IO, "Failed to stat file: " + path.string() + ": " + std::strerror(errno));
        }
        if (!S_ISREG(sb.st_mode)) {
            return fail(ErrorKind::IO, "Not a regular file: " + path.string());
        }
        file->size_ = static_cast<size_t>(sb.st_size);

        if (file->size_ == 0) {
            return file;
        }

        void *addr = mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, file->fd_, 0);
        if (addr == MAP_FAILED) {
            return fail(ErrorKind::IO, "Failed to mmap file: " + path.string() + ": " + std::strerror(errno));
        }
        file->data_ = static_cast<char *>(addr);
        return file;
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
        if (fd_ != -1) {
            close(fd_);
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    MappedFile() = default;

    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace keel
