#include "tftpclient/tftp_stream.h"
#include "tftpclient/tftp_logger.h"
#include <algorithm>

namespace tftpclient {

bool MemoryByteSink::Write(const uint8_t* data, size_t size) {
    if (size > 0) {
        buffer_.insert(buffer_.end(), data, data + size);
    }
    return true;
}

bool MemoryByteSource::Read(size_t max_bytes, std::vector<uint8_t>& out) {
    size_t count = std::min(max_bytes, buffer_.size() - offset_);
    out.assign(buffer_.begin() + offset_, buffer_.begin() + offset_ + count);
    offset_ += count;
    return true;
}

bool FileByteSink::Open(const std::string& path) {
    path_ = path;
    file_.open(path, std::ios::binary | std::ios::trunc);
    if (!file_) {
        last_error_ = "Cannot open file for writing: " + path;
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return false;
    }
    return true;
}

bool FileByteSink::Write(const uint8_t* data, size_t size) {
    if (!file_.is_open()) {
        last_error_ = "File is not open: " + path_;
        return false;
    }
    if (!file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size))) {
        last_error_ = "File write error: " + path_;
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return false;
    }
    return true;
}

bool FileByteSink::Close() {
    if (!file_.is_open()) {
        return true;
    }
    file_.flush();
    bool ok = static_cast<bool>(file_);
    file_.close();
    if (!ok) {
        last_error_ = "File flush error: " + path_;
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
    }
    return ok;
}

bool FileByteSource::Open(const std::string& path) {
    path_ = path;
    file_.open(path, std::ios::binary);
    if (!file_) {
        last_error_ = "Cannot open file: " + path;
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        return false;
    }

    // Get file size
    file_.seekg(0, std::ios::end);
    std::streamsize file_size = file_.tellg();
    file_.seekg(0, std::ios::beg);
    if (file_size < 0 || !file_) {
        last_error_ = "Cannot determine file size: " + path;
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        file_.close();
        return false;
    }
    size_ = static_cast<uint64_t>(file_size);
    return true;
}

bool FileByteSource::Read(size_t max_bytes, std::vector<uint8_t>& out) {
    if (!file_.is_open()) {
        last_error_ = "File is not open: " + path_;
        return false;
    }

    out.resize(max_bytes);
    file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(max_bytes));
    std::streamsize count = file_.gcount();
    if (file_.bad()) {
        last_error_ = "File read error: " + path_;
        TFTPCLIENT_ERROR("%s", last_error_.c_str());
        out.clear();
        return false;
    }
    out.resize(static_cast<size_t>(count));

    // Short read means end of file; keep the stream usable for the next call
    if (file_.eof()) {
        file_.clear();
    }
    return true;
}

} // namespace tftpclient
