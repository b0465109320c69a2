#include "zealdump/io/file_sink.hpp"

#include <iostream>
#include <stdexcept>

namespace zealdump {

FileSink::FileSink(std::filesystem::path path)
    : path_(std::move(path)) {
    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to create output file: " + path_.string());
    }
}

FileSink::~FileSink() {
    if (file_.is_open() && !close()) {
        std::cerr << "[FileSink] WARNING: " << lastError_ << "\n";
    }
}

bool FileSink::write(std::span<const uint8_t> data) {
    if (!file_.is_open()) {
        lastError_ = "output file is closed";
        return false;
    }
    if (data.empty()) {
        return true;
    }

    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    file_.flush();
    if (!file_.good()) {
        lastError_ = "write to " + path_.string() + " failed";
        return false;
    }

    bytesWritten_ += data.size();
    return true;
}

bool FileSink::close() {
    if (!file_.is_open()) {
        return true;
    }
    file_.flush();
    bool ok = file_.good();
    file_.close();
    if (!ok) {
        lastError_ = "flush of " + path_.string() + " failed";
    }
    return ok;
}

}  // namespace zealdump
