#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include "errors.hpp"

// Bounds-checked big-endian cursor over a byte buffer.
// Every read past the end throws TruncatedDataError carrying the absolute offset.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size, size_t base_offset = 0)
        : data_(data), size_(size), pos_(0), base_(base_offset) {}

    explicit ByteReader(const std::vector<uint8_t>& data, size_t base_offset = 0)
        : ByteReader(data.data(), data.size(), base_offset) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    int32_t i32() { return static_cast<int32_t>(u32()); }
    std::vector<uint8_t> bytes(size_t count);
    std::vector<uint8_t> rest();

    // Length-prefixed string with a 1, 2 or 4 byte length field.
    std::vector<uint8_t> pascal(size_t length_width = 1);

    // Reads a packed on-disk structure as-is; the caller converts byte order.
    template<typename T>
    void read_struct(T& value) {
        require(sizeof(T));
        std::memcpy(&value, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
    }

    void seek(size_t pos);
    void skip(size_t count);
    size_t tell() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ >= size_; }
    size_t absolute() const { return base_ + pos_; }

private:
    void require(size_t count) const;

    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    size_t base_;
};

// Growable big-endian output buffer. Values that do not fit their slot throw EncodeError.
class ByteWriter {
public:
    void u8(uint64_t value);
    void u16(uint64_t value);
    void u32(uint64_t value);
    void i32(int64_t value);
    void bytes(const std::vector<uint8_t>& data);
    void bytes(const uint8_t* data, size_t size);
    void pascal(const std::vector<uint8_t>& text, size_t length_width = 1);
    void zeros(size_t count);
    void align(size_t alignment);

    template<typename T>
    void write_struct(const T& value) {
        bytes(reinterpret_cast<const uint8_t*>(&value), sizeof(T));
    }

    size_t size() const { return buffer_.size(); }
    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

#endif // BYTE_STREAM_HPP
