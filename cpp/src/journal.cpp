#include "arbscan/journal.hpp"
#include "arbscan/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace arbscan {

namespace {
    std::string errno_text() {
        return std::strerror(errno);
    }

    // Returns false with errno set on the first failed write
    bool write_all(int fd, const std::string& data) {
        const char* p = data.data();
        std::size_t left = data.size();
        while (left > 0) {
            const ssize_t n = ::write(fd, p, left);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            p += n;
            left -= static_cast<std::size_t>(n);
        }
        return true;
    }
}

FileJournal::FileJournal(std::string path)
    : path_(std::move(path))
    , fd_(-1)
    , dropped_torn_tail_(false)
{
    if (path_.empty()) {
        throw StorageError("journal path is empty");
    }
    truncate_torn_tail();
    open_for_append();
}

void FileJournal::truncate_torn_tail() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw StorageError("cannot read " + path_ + ": " + std::strerror(errno));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (content.empty() || content.back() == '\n') {
        return;
    }

    // Crash between write and newline: keep everything up to the last full line
    const auto last_newline = content.rfind('\n');
    const std::uintmax_t keep = (last_newline == std::string::npos) ? 0 : last_newline + 1;
    in.close();

    fs::resize_file(path_, keep, ec);
    if (ec) {
        throw StorageError("cannot truncate torn tail of " + path_ + ": " + ec.message());
    }
    dropped_torn_tail_ = true;
    std::cerr << "[Journal] Dropped torn final line in " << path_
              << " (" << (content.size() - keep) << " bytes)" << std::endl;
}

FileJournal::~FileJournal() {
    close_fd();
}

void FileJournal::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FileJournal::open_for_append() {
    close_fd();
    fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw StorageError("cannot open " + path_ + " for append: " + errno_text());
    }
}

void FileJournal::replay(const LineHandler& handler) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw StorageError("cannot read " + path_ + ": " + std::strerror(errno));
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        handler(line, line_no);
    }
    if (in.bad()) {
        throw StorageError("read failure on " + path_);
    }
}

void FileJournal::append(const std::string& line) {
    if (line.find('\n') != std::string::npos) {
        throw StorageError("journal entries must be single lines");
    }
    if (fd_ < 0) {
        open_for_append();
    }

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw StorageError("cannot stat " + path_ + ": " + errno_text());
    }
    const off_t previous_end = st.st_size;

    if (!write_all(fd_, line + '\n') || ::fdatasync(fd_) != 0) {
        const std::string reason = errno_text();
        // Leave no partial line behind for the next append to land on
        if (::ftruncate(fd_, previous_end) != 0) {
            std::cerr << "[Journal] Could not roll back partial append to " << path_
                      << ": " << errno_text() << std::endl;
        }
        throw StorageError("append to " + path_ + " failed: " + reason);
    }
}

void FileJournal::rewrite(const std::vector<std::string>& lines) {
    const std::string tmp_path = path_ + ".tmp";

    std::string content;
    for (const auto& line : lines) {
        content += line;
        content += '\n';
    }

    const int tmp = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (tmp < 0) {
        throw StorageError("cannot create " + tmp_path + ": " + errno_text());
    }
    if (!write_all(tmp, content) || ::fsync(tmp) != 0) {
        const std::string reason = errno_text();
        ::close(tmp);
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw StorageError("write to " + tmp_path + " failed: " + reason);
    }
    ::close(tmp);

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw StorageError("cannot replace " + path_ + ": " + ec.message());
    }
    // The old descriptor still points at the replaced file
    open_for_append();
}

} // namespace arbscan
