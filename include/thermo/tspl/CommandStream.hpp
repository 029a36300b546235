#pragma once

#include "thermo/core/ByteBuffer.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace thermo::tspl {

enum class DirectiveKind : std::uint8_t {
    Size,
    Speed,
    Density,
    Gap,
    BlackMark,
    Reference,
    Clear,
    Bitmap,
    Print
};

const char* toString(DirectiveKind kind);

/**
 * @brief One page's printer program: directive boundaries plus the raw bytes.
 *
 * Well-formed streams start with SIZE, end with PRINT and carry exactly one
 * BITMAP. The encoder is the only writer; the orchestrator hands `bytes()`
 * to the transport unchanged.
 */
class CommandStream {
public:
    struct Directive {
        DirectiveKind kind;
        std::size_t offset; // into bytes()
        std::size_t length;
    };

    /// Starts a new directive; bytes appended to the returned buffer until
    /// the next `begin()` belong to it.
    core::ByteBuffer& begin(DirectiveKind kind);

    /// Closes the last directive. Called once the program is complete.
    void finish() { closeCurrent(); }

    const std::vector<Directive>& directives() const { return entries; }
    const core::ByteBuffer& bytes() const { return buffer; }
    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }

    /// Index of the first directive of @p kind, or -1.
    int indexOf(DirectiveKind kind) const;
    std::size_t count(DirectiveKind kind) const;
    bool isWellFormed() const;

private:
    void closeCurrent();

    std::vector<Directive> entries;
    core::ByteBuffer buffer;
};

} // namespace thermo::tspl
