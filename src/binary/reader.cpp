#include "reader.hpp"

namespace Umbra::Binary {

uint8_t Reader::read_uint8() {
    if (offset_ >= data_.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    return data_[offset_++];
}

uint16_t Reader::read_uint16_be() {
    if (offset_ + 2 > data_.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return value;
}

std::string Reader::read_string(size_t length) {
    if (offset_ + length > data_.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    std::string s(reinterpret_cast<const char*>(data_.data() + offset_), length);
    offset_ += length;
    return s;
}
}  // namespace Umbra::Binary
