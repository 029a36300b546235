#include "thermo/core/ByteBuffer.hpp"

#include <string>

namespace thermo::core {

ByteBuffer::ByteBuffer() {
    buffer.reserve(1024 * 32); // a 78 mm label row is 78 bytes; most pages fit
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendChar(char value) {
    buffer.push_back(static_cast<std::uint8_t>(value));
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendText(std::string_view text) {
    buffer.insert(buffer.end(), text.begin(), text.end());
}

void ByteBuffer::appendDecimal(long long value) {
    appendText(std::to_string(value));
}

void ByteBuffer::appendBytes(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return;
    }
    buffer.insert(buffer.end(), data, data + size);
}

void ByteBuffer::append(const ByteBuffer& other) {
    appendBytes(other.data(), other.size());
}

void ByteBuffer::endLine() {
    buffer.push_back('\r');
    buffer.push_back('\n');
}

} // namespace thermo::core
