#include "byte_stream.hpp"

void ByteReader::require(size_t count) const {
    if (count > size_ - pos_) {
        throw TruncatedDataError("Need " + std::to_string(count) + " bytes, only " +
                                 std::to_string(size_ - pos_) + " left", base_ + pos_);
    }
}

uint8_t ByteReader::u8() {
    require(1);
    return data_[pos_++];
}

uint16_t ByteReader::u16() {
    require(2);
    uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
}

uint32_t ByteReader::u32() {
    require(4);
    uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                 (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                 (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                 static_cast<uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return v;
}

std::vector<uint8_t> ByteReader::bytes(size_t count) {
    require(count);
    std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + count);
    pos_ += count;
    return out;
}

std::vector<uint8_t> ByteReader::rest() {
    return bytes(remaining());
}

std::vector<uint8_t> ByteReader::pascal(size_t length_width) {
    size_t len = 0;
    switch (length_width) {
        case 1: len = u8(); break;
        case 2: len = u16(); break;
        case 4: len = u32(); break;
        default: throw std::invalid_argument("Unsupported Pascal string length width");
    }
    return bytes(len);
}

void ByteReader::seek(size_t pos) {
    if (pos > size_) {
        throw TruncatedDataError("Seek past end of data", base_ + pos);
    }
    pos_ = pos;
}

void ByteReader::skip(size_t count) {
    require(count);
    pos_ += count;
}

void ByteWriter::u8(uint64_t value) {
    if (value > 0xFF) {
        throw EncodeError("Value " + std::to_string(value) + " does not fit in 8 bits");
    }
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::u16(uint64_t value) {
    if (value > 0xFFFF) {
        throw EncodeError("Value " + std::to_string(value) + " does not fit in 16 bits");
    }
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::u32(uint64_t value) {
    if (value > 0xFFFFFFFFull) {
        throw EncodeError("Value " + std::to_string(value) + " does not fit in 32 bits");
    }
    buffer_.push_back(static_cast<uint8_t>(value >> 24));
    buffer_.push_back(static_cast<uint8_t>(value >> 16));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::i32(int64_t value) {
    if (value < INT32_MIN || value > INT32_MAX) {
        throw EncodeError("Value " + std::to_string(value) + " does not fit in a signed 32-bit field");
    }
    u32(static_cast<uint32_t>(static_cast<int32_t>(value)));
}

void ByteWriter::bytes(const std::vector<uint8_t>& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::bytes(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void ByteWriter::pascal(const std::vector<uint8_t>& text, size_t length_width) {
    switch (length_width) {
        case 1: u8(text.size()); break;
        case 2: u16(text.size()); break;
        case 4: u32(text.size()); break;
        default: throw std::invalid_argument("Unsupported Pascal string length width");
    }
    bytes(text);
}

void ByteWriter::zeros(size_t count) {
    buffer_.insert(buffer_.end(), count, 0);
}

void ByteWriter::align(size_t alignment) {
    size_t rem = buffer_.size() % alignment;
    if (rem != 0) {
        zeros(alignment - rem);
    }
}
