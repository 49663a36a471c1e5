#include "streamdl/output_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace streamdl {

FileSink::FileSink(std::string path) : path_(std::move(path)) {
    file_.reset(std::fopen(path_.c_str(), "wb"));
    if (!file_) {
        throw std::system_error(errno, std::generic_category(), "Cannot create destination file " + path_);
    }
}

void FileSink::write(const char* data, std::size_t size) {
    if (!file_) {
        throw std::runtime_error("Write to closed file " + path_);
    }

    const std::size_t written = std::fwrite(data, 1, size, file_.get());
    if (written != size) {
        throw std::system_error(errno, std::generic_category(), "Failed to write output file " + path_);
    }
}

void FileSink::close() {
    if (!file_) {
        return;
    }

    const bool flushed = std::fflush(file_.get()) == 0;
    const int flush_errno = errno;
    const bool closed = std::fclose(file_.release()) == 0;
    if (!flushed) {
        throw std::system_error(flush_errno, std::generic_category(), "Failed to flush output file " + path_);
    }
    if (!closed) {
        throw std::system_error(errno, std::generic_category(), "Failed to close output file " + path_);
    }
}

} // namespace streamdl
