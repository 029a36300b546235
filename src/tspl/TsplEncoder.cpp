/**
 * @brief TSPL program assembly for one dithered page.
 */
#include "thermo/tspl/TsplEncoder.hpp"

#include "thermo/log/Log.hpp"

#include <algorithm>

namespace thermo::tspl {

namespace {
const log::Channel LOG{"TsplEncoder"};

void appendMm(core::ByteBuffer& out, int value) {
    out.appendDecimal(value);
    out.appendText(" mm");
}
} // namespace

TsplEncoder::TsplEncoder(const core::PrintSettings& settings,
                         const transport::TransportCapabilities& caps,
                         int dotsPerMm)
: settings(settings)
, capabilities(negotiate(settings, caps))
, dotsPerMm(dotsPerMm > 0 ? dotsPerMm : config::DOTS_PER_MM)
, declaredWidth(settings.targetPixelWidth(this->dotsPerMm)) {}

JobResult<CommandStream> TsplEncoder::encode(core::BinaryBuffer page) const {
    if (page.empty()) {
        LOG.error("refusing to encode an empty page");
        return unexpected(JobError::encode("page bitmap is empty"));
    }
    if (!capabilities.bitmap) {
        LOG.error("cannot encode page: ", capabilities.bitmap.error().message);
        return unexpected(JobError::encode(capabilities.bitmap.error().message));
    }

    CommandStream stream;
    appendSize(stream, page.height());

    if (capabilities.speed) {
        auto& out = stream.begin(DirectiveKind::Speed);
        out.appendText("SPEED ");
        out.appendDecimal(*capabilities.speed);
        out.endLine();
    }

    if (capabilities.density) {
        auto& out = stream.begin(DirectiveKind::Density);
        out.appendText("DENSITY ");
        out.appendDecimal(*capabilities.density);
        out.endLine();
    }

    appendMedia(stream);

    auto& clear = stream.begin(DirectiveKind::Clear);
    clear.appendText("CLS");
    clear.endLine();

    appendBitmap(stream, page, *capabilities.bitmap);

    auto& print = stream.begin(DirectiveKind::Print);
    print.appendText("PRINT ");
    print.appendDecimal(config::COPIES_PER_PAGE);
    print.endLine();
    stream.finish();

    LOG.info("encoded ", page.width(), "x", page.height(), " page: ",
             stream.directives().size(), " directives, ", stream.size(), " bytes");
    return stream;
}

void TsplEncoder::appendSize(CommandStream& stream, int pageHeightDots) const {
    auto& out = stream.begin(DirectiveKind::Size);
    out.appendText("SIZE ");
    appendMm(out, settings.paperWidthMm);
    out.appendChar(',');
    appendMm(out, pageHeightDots / dotsPerMm);
    out.endLine();
}

void TsplEncoder::appendMedia(CommandStream& stream) const {
    const auto& media = capabilities.media;
    switch (media.directive) {
        case MediaDirective::Reference: {
            auto& out = stream.begin(DirectiveKind::Reference);
            out.appendText("REFERENCE ");
            out.appendDecimal(media.first);
            out.appendChar(',');
            out.appendDecimal(media.second);
            out.endLine();
            break;
        }
        case MediaDirective::BlackMark: {
            auto& out = stream.begin(DirectiveKind::BlackMark);
            out.appendText("BLINE ");
            appendMm(out, media.first);
            out.appendChar(',');
            appendMm(out, media.second);
            out.endLine();
            break;
        }
        case MediaDirective::Gap: {
            auto& out = stream.begin(DirectiveKind::Gap);
            out.appendText("GAP ");
            appendMm(out, media.first);
            out.appendChar(',');
            appendMm(out, media.second);
            out.endLine();
            break;
        }
    }
}

void TsplEncoder::appendBitmap(CommandStream& stream, const core::BinaryBuffer& page,
                               transport::BitmapSignature signature) const {
    const bool extended = signature == transport::BitmapSignature::Extended;
    const int width = extended && declaredWidth > 0 ? declaredWidth : page.width();
    const int widthBytes = (width + 7) / 8;

    auto& out = stream.begin(DirectiveKind::Bitmap);
    out.appendText("BITMAP 0,0,");
    out.appendDecimal(widthBytes);
    out.appendChar(',');
    out.appendDecimal(page.height());
    out.appendChar(',');
    out.appendDecimal(static_cast<int>(BitmapMode::Overwrite));
    out.appendChar(',');
    packRows(page, width, out);
    out.endLine();
}

void TsplEncoder::packRows(const core::BinaryBuffer& page, int width, core::ByteBuffer& out) {
    const int widthBytes = (width + 7) / 8;
    const int visible = std::min(width, page.width());

    for (int y = 0; y < page.height(); ++y) {
        for (int b = 0; b < widthBytes; ++b) {
            std::uint8_t byte = 0xFF;
            for (int bit = 0; bit < 8; ++bit) {
                const int x = b * 8 + bit;
                if (x < visible && page.at(x, y) == core::BINARY_BLACK) {
                    byte = static_cast<std::uint8_t>(byte & ~(0x80u >> bit));
                }
            }
            out.appendUInt8(byte);
        }
    }
}

} // namespace thermo::tspl
