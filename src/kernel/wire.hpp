#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include "kernel/types.hpp"

namespace zero::kernel {

// Raised when a byte buffer is shorter than its encoding claims
class WireError : public std::runtime_error {
public:
    explicit WireError(const std::string& what) : std::runtime_error(what) {}
};

// Little-endian append-only encoder used for commits, results and payloads
class ByteWriter {
public:
    void u8(uint8_t v) { out_.push_back(v); }

    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xffu));
        }
    }

    void u64(uint64_t v) {
        u32(static_cast<uint32_t>(v & 0xffffffffull));
        u32(static_cast<uint32_t>(v >> 32));
    }

    void raw(const uint8_t* data, size_t len) {
        out_.insert(out_.end(), data, data + len);
    }

    // u32 length prefix followed by the bytes
    void bytes(const Bytes& data) {
        u32(static_cast<uint32_t>(data.size()));
        raw(data.data(), data.size());
    }

    void str(const std::string& s) {
        u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    const Bytes& data() const { return out_; }
    Bytes take() { return std::move(out_); }

private:
    Bytes out_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const Bytes& data) : data_(data.data()), size_(data.size()) {}

    uint8_t u8() {
        need(1);
        return data_[pos_++];
    }

    uint32_t u32() {
        need(4);
        uint32_t v = static_cast<uint32_t>(data_[pos_]) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    uint64_t u64() {
        uint64_t lo = u32();
        uint64_t hi = u32();
        return lo | (hi << 32);
    }

    Bytes raw(size_t len) {
        need(len);
        Bytes out(data_ + pos_, data_ + pos_ + len);
        pos_ += len;
        return out;
    }

    Bytes bytes() { return raw(u32()); }

    std::string str() {
        uint32_t len = u32();
        need(len);
        std::string out(data_ + pos_, data_ + pos_ + len);
        pos_ += len;
        return out;
    }

    size_t remaining() const { return size_ - pos_; }
    bool done() const { return pos_ == size_; }

private:
    void need(size_t len) const {
        if (size_ - pos_ < len) {
            throw WireError("truncated buffer: need " + std::to_string(len) +
                            " bytes at offset " + std::to_string(pos_) +
                            ", have " + std::to_string(size_ - pos_));
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

inline Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

inline std::string to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

inline std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

inline std::string to_hex(const Bytes& data) {
    return to_hex(data.data(), data.size());
}

// Throws WireError on odd length or non-hex characters
inline Bytes from_hex(const std::string& hex) {
    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw WireError(std::string("invalid hex digit '") + c + "'");
    };

    if (hex.size() % 2 != 0) {
        throw WireError("odd-length hex string");
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

} // namespace zero::kernel
