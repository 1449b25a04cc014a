#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Umbra::Binary {
class Writer {
public:
    explicit Writer(std::vector<uint8_t>& data) : data_(data) {
    }

    void write_uint8(uint8_t value);
    void write_uint16_be(uint16_t value);
    void write_string(const std::string& value);

    // One length octet followed by the bytes; throws if value exceeds 255 bytes.
    void write_short_string(const std::string& value);

private:
    std::vector<uint8_t>& data_;
};
}  // namespace Umbra::Binary
