#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace thermo::core {

/**
 * @brief Growable byte sink for printer programs.
 *
 * TSPL mixes ASCII keywords and decimal parameters with raw bitmap payloads,
 * so the buffer offers text helpers next to the raw appends.
 */
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void appendChar(char value);
    void appendUInt8(std::uint8_t value);
    void appendText(std::string_view text);
    void appendDecimal(long long value);
    void appendBytes(const std::uint8_t* data, std::size_t size);
    void append(const ByteBuffer& other);

    /// Appends the TSPL line terminator "\r\n".
    void endLine();

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

    const std::vector<std::uint8_t>& bytes() const { return buffer; }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace thermo::core
