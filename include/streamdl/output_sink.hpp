#pragma once

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>

namespace streamdl {

// Destination for downloaded bytes. Implementations throw on failure.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void write(const char* data, std::size_t size) = 0;
    // Returns once everything written has been handed to the destination.
    virtual void close() = 0;
};

class FileSink final : public OutputSink {
public:
    explicit FileSink(std::string path);

    void write(const char* data, std::size_t size) override;
    void close() override;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] bool isOpen() const { return static_cast<bool>(file_); }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::string path_;
    std::unique_ptr<FILE, FileDeleter> file_;
};

} // namespace streamdl
