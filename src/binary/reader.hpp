#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Umbra::Binary {
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {
    }

    uint8_t     read_uint8();
    uint16_t    read_uint16_be();
    std::string read_string(size_t length);

    bool eof() const {
        return offset_ >= data_.size();
    }
    size_t remaining() const {
        return eof() ? 0 : data_.size() - offset_;
    }

private:
    const std::vector<uint8_t>& data_;
    size_t                      offset_;
};
}  // namespace Umbra::Binary
