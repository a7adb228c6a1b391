#pragma once

#include <functional>
#include <string>
#include <vector>

namespace arbscan {

// Append-only sequence of text lines; the single durable source of truth
// for the opportunity store.
class Journal {
public:
    using LineHandler = std::function<void(const std::string& line, std::size_t line_no)>;

    virtual ~Journal() = default;

    // Feeds every complete line, oldest first
    virtual void replay(const LineHandler& handler) = 0;

    // All or nothing: on StorageError no part of the line remains
    virtual void append(const std::string& line) = 0;

    // Replaces the whole content; throws StorageError and keeps the old
    // content on failure
    virtual void rewrite(const std::vector<std::string>& lines) = 0;

    virtual std::string describe() const = 0;
};

// JSON-lines file. Opening drops a torn final line left by a crash mid-append.
// Each append is synced with fdatasync before it returns; a short or failed
// write is truncated back to the previous end of file.
class FileJournal : public Journal {
public:
    explicit FileJournal(std::string path);
    ~FileJournal() override;

    FileJournal(const FileJournal&) = delete;
    FileJournal& operator=(const FileJournal&) = delete;

    void replay(const LineHandler& handler) override;
    void append(const std::string& line) override;
    void rewrite(const std::vector<std::string>& lines) override;
    std::string describe() const override { return path_; }

    const std::string& path() const { return path_; }
    bool dropped_torn_tail() const { return dropped_torn_tail_; }

private:
    void truncate_torn_tail();
    void open_for_append();

    void close_fd();

    std::string path_;
    int fd_;
    bool dropped_torn_tail_;
};

} // namespace arbscan
