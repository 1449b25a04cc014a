#include "writer.hpp"
#include <stdexcept>

namespace Umbra::Binary {

void Writer::write_uint8(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_uint16_be(uint16_t value) {
    data_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    data_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void Writer::write_string(const std::string& value) {
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_short_string(const std::string& value) {
    if (value.size() > 0xFF) {
        throw std::length_error("Field longer than 255 bytes: " + std::to_string(value.size()));
    }
    write_uint8(static_cast<uint8_t>(value.size()));
    write_string(value);
}
}  // namespace Umbra::Binary
