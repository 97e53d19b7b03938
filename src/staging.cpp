#include "exec_kernel/staging.h"
#include "exec_kernel/errors.h"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>

namespace exec_kernel {

namespace fs = std::filesystem;

namespace {

void write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ExecutionError(ErrorKind::EnvironmentSetupFailed, errno_message("write script"));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

} // anonymous namespace

StagingArea StagingArea::create(const std::string& root, const std::string& source) {
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
    if (ec) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed,
                             "no temporary directory: " + ec.message());
    }
    base = fs::absolute(base, ec);
    if (ec) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed,
                             "cannot resolve staging root " + root + ": " + ec.message());
    }

    std::string tmpl = (base / "fusional-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed,
                             errno_message("mkdtemp in " + base.string()));
    }

    // From here on the handle owns the directory and cleans it on throw.
    StagingArea area(std::string(buf.data()));

    // The container runs as an unprivileged uid; the mount must be readable.
    if (chmod(area.path_.c_str(), 0755) != 0) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed, errno_message("chmod staging dir"));
    }

    std::string script = area.script_path();
    int fd = open(script.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed, errno_message("create " + script));
    }
    try {
        write_all(fd, source);
    } catch (...) {
        close(fd);
        throw;
    }
    if (close(fd) != 0) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed, errno_message("close " + script));
    }
    // open() honours the umask; make sure the file really is 0644.
    if (chmod(script.c_str(), 0644) != 0) {
        throw ExecutionError(ErrorKind::EnvironmentSetupFailed, errno_message("chmod " + script));
    }

    spdlog::debug("staged {} bytes in {}", source.size(), area.path_);
    return area;
}

StagingArea::StagingArea(StagingArea&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

StagingArea& StagingArea::operator=(StagingArea&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

StagingArea::~StagingArea() {
    remove();
}

std::string StagingArea::name() const {
    return fs::path(path_).filename().string();
}

void StagingArea::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("failed to remove staging area {}: {}", path_, ec.message());
    } else {
        spdlog::debug("removed staging area {}", path_);
    }
    path_.clear();
}

} // namespace exec_kernel
