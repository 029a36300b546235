#pragma once

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/core/JobError.hpp"
#include "thermo/core/PixelBuffer.hpp"
#include "thermo/core/PrintSettings.hpp"
#include "thermo/transport/TransportCapabilities.hpp"
#include "thermo/tspl/Capability.hpp"
#include "thermo/tspl/CommandStream.hpp"

#include <cstdint>

namespace thermo::tspl {

/// BITMAP compositing modes.
enum class BitmapMode : std::uint8_t {
    Overwrite = 0,
    Or = 1,
    Xor = 2
};

/**
 * @brief Serializes dithered pages into TSPL label programs.
 *
 * Directive order per page:
 *   SIZE, [SPEED], [DENSITY], GAP | BLINE | REFERENCE, CLS, BITMAP, PRINT.
 *
 * Optional directives are chosen once, in the constructor, by negotiating
 * the job settings against the transport's capabilities. A missing optional
 * feature drops or substitutes its directive; only a page that cannot carry
 * a BITMAP fails to encode.
 */
class TsplEncoder {
public:
    TsplEncoder(const core::PrintSettings& settings,
                const transport::TransportCapabilities& caps,
                int dotsPerMm = config::DOTS_PER_MM);

    /// Consumes @p page and returns its program.
    JobResult<CommandStream> encode(core::BinaryBuffer page) const;

    const NegotiatedCapabilities& negotiated() const { return capabilities; }

    /**
     * @brief Packs binary rows MSB-first, `(width + 7) / 8` bytes per row.
     *
     * TSPL prints a dot for a 0 bit, so black samples clear their bit and
     * white samples and row padding set it. Columns beyond the page width
     * are white; columns beyond @p width are cropped.
     */
    static void packRows(const core::BinaryBuffer& page, int width, core::ByteBuffer& out);

private:
    void appendSize(CommandStream& stream, int pageHeightDots) const;
    void appendMedia(CommandStream& stream) const;
    void appendBitmap(CommandStream& stream, const core::BinaryBuffer& page,
                      transport::BitmapSignature signature) const;

    core::PrintSettings settings;
    NegotiatedCapabilities capabilities;
    int dotsPerMm;
    int declaredWidth;
};

} // namespace thermo::tspl
