#include "thermo/document/NetpbmDocument.hpp"

#include "thermo/log/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>

namespace thermo::document {

namespace {

const log::Channel LOG{"NetpbmDocument"};

// Reads one header token, skipping whitespace and '#' comments. The single
// whitespace character terminating the token is consumed, which is exactly
// what the format requires after the last header field.
std::optional<std::string> readToken(std::istream& in) {
    int c = in.get();
    while (c != EOF) {
        if (c == '#') {
            while (c != EOF && c != '\n') {
                c = in.get();
            }
        } else if (std::isspace(c)) {
            c = in.get();
        } else {
            break;
        }
    }
    if (c == EOF) {
        return std::nullopt;
    }

    std::string token;
    while (c != EOF && !std::isspace(c)) {
        token.push_back(static_cast<char>(c));
        c = in.get();
    }
    return token;
}

std::optional<int> readPositive(std::istream& in) {
    auto token = readToken(in);
    if (!token || token->empty() || token->size() > 9) {
        return std::nullopt;
    }
    int value = 0;
    for (char ch : *token) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        value = value * 10 + (ch - '0');
    }
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

bool skipWhitespace(std::istream& in) {
    int c = in.peek();
    while (c != EOF && std::isspace(c)) {
        in.get();
        c = in.peek();
    }
    return c != EOF;
}

inline std::uint8_t scaleSample(unsigned value, int maxValue) {
    if (maxValue == 255) {
        return static_cast<std::uint8_t>(value);
    }
    const unsigned clamped = std::min<unsigned>(value, static_cast<unsigned>(maxValue));
    return static_cast<std::uint8_t>((clamped * 255u + static_cast<unsigned>(maxValue) / 2u) /
                                     static_cast<unsigned>(maxValue));
}

void resampleBilinear(const core::RgbBuffer& src, core::RgbBuffer& dst) {
    const double sx = static_cast<double>(src.width()) / static_cast<double>(dst.width());
    const double sy = static_cast<double>(src.height()) / static_cast<double>(dst.height());
    const int maxX = src.width() - 1;
    const int maxY = src.height() - 1;

    for (int y = 0; y < dst.height(); ++y) {
        const double fy = std::clamp((y + 0.5) * sy - 0.5, 0.0, static_cast<double>(maxY));
        const int y0 = static_cast<int>(fy);
        const int y1 = std::min(y0 + 1, maxY);
        const double wy = fy - y0;

        for (int x = 0; x < dst.width(); ++x) {
            const double fx = std::clamp((x + 0.5) * sx - 0.5, 0.0, static_cast<double>(maxX));
            const int x0 = static_cast<int>(fx);
            const int x1 = std::min(x0 + 1, maxX);
            const double wx = fx - x0;

            for (std::size_t c = 0; c < 3; ++c) {
                const double top = src.at(x0, y0, c) * (1.0 - wx) + src.at(x1, y0, c) * wx;
                const double bottom = src.at(x0, y1, c) * (1.0 - wx) + src.at(x1, y1, c) * wx;
                const double v = top * (1.0 - wy) + bottom * wy;
                dst.at(x, y, c) = static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
            }
        }
    }
}

} // namespace

JobResult<std::unique_ptr<PageRenderer>> NetpbmDocument::open(const std::string& path) {
    std::unique_ptr<NetpbmDocument> doc(new NetpbmDocument(path));
    doc->file.open(path, std::ios::binary);
    if (!doc->file) {
        return unexpected(JobError::document("cannot open " + path));
    }

    if (auto indexed = doc->indexPages(); !indexed) {
        return unexpected(indexed.error());
    }
    if (doc->pages.empty()) {
        return unexpected(JobError::document("document has no pages: " + path));
    }

    LOG.info("opened ", path, " with ", doc->pages.size(), " page(s)");
    return std::unique_ptr<PageRenderer>(std::move(doc));
}

NetpbmDocument::NetpbmDocument(std::string path)
: path(std::move(path)) {}

NetpbmDocument::~NetpbmDocument() {
    close();
}

void NetpbmDocument::close() {
    if (file.is_open()) {
        file.close();
    }
}

JobResult<void> NetpbmDocument::indexPages() {
    file.seekg(0, std::ios::end);
    const std::streamoff fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    while (skipWhitespace(file)) {
        const std::size_t pageNumber = pages.size() + 1;
        auto magic = readToken(file);
        if (!magic || magic->size() != 2 || (*magic)[0] != 'P') {
            return unexpected(JobError::document("page " + std::to_string(pageNumber) +
                                                 ": not a binary netpbm image"));
        }

        PageEntry page;
        switch ((*magic)[1]) {
            case '4': page.format = Format::Bitmap; break;
            case '5': page.format = Format::Graymap; break;
            case '6': page.format = Format::Pixmap; break;
            default:
                return unexpected(JobError::document("page " + std::to_string(pageNumber) +
                                                     ": unsupported netpbm type " + *magic));
        }

        auto width = readPositive(file);
        auto height = readPositive(file);
        if (!width || !height) {
            return unexpected(JobError::document("page " + std::to_string(pageNumber) +
                                                 ": bad dimensions"));
        }
        page.width = *width;
        page.height = *height;

        std::size_t bytesPerSample = 1;
        if (page.format != Format::Bitmap) {
            auto maxValue = readPositive(file);
            if (!maxValue || *maxValue > 65535) {
                return unexpected(JobError::document("page " + std::to_string(pageNumber) +
                                                     ": bad maximum value"));
            }
            page.maxValue = *maxValue;
            bytesPerSample = page.maxValue > 255 ? 2 : 1;
        }

        const auto w = static_cast<std::size_t>(page.width);
        const auto h = static_cast<std::size_t>(page.height);
        switch (page.format) {
            case Format::Bitmap:  page.rasterBytes = ((w + 7) / 8) * h; break;
            case Format::Graymap: page.rasterBytes = w * h * bytesPerSample; break;
            case Format::Pixmap:  page.rasterBytes = w * h * 3 * bytesPerSample; break;
        }

        page.rasterOffset = file.tellg();
        pages.push_back(page);

        const std::streamoff next = page.rasterOffset + static_cast<std::streamoff>(page.rasterBytes);
        if (next >= fileSize) {
            // A short final raster is reported when that page is rendered.
            break;
        }
        file.seekg(next, std::ios::beg);
    }

    file.clear();
    return {};
}

JobResult<PageSize> NetpbmDocument::pageDimensions(int index) const {
    if (index < 0 || index >= pageCount()) {
        return unexpected(JobError::render("page index " + std::to_string(index) + " out of range"));
    }
    const auto& page = pages[static_cast<std::size_t>(index)];
    return PageSize{page.width, page.height};
}

JobResult<void> NetpbmDocument::renderPage(int index, core::RgbBuffer& canvas) {
    if (!file.is_open()) {
        return unexpected(JobError::render("document is closed"));
    }
    if (index < 0 || index >= pageCount()) {
        return unexpected(JobError::render("page index " + std::to_string(index) + " out of range"));
    }
    if (canvas.empty()) {
        return unexpected(JobError::render("empty canvas"));
    }

    auto decoded = decodePage(pages[static_cast<std::size_t>(index)]);
    if (!decoded) {
        return unexpected(JobError::render("page " + std::to_string(index + 1) + ": " +
                                           decoded.error().message));
    }

    resampleBilinear(*decoded, canvas);
    return {};
}

JobResult<core::RgbBuffer> NetpbmDocument::decodePage(const PageEntry& page) {
    std::vector<std::uint8_t> raster(page.rasterBytes);
    file.clear();
    file.seekg(page.rasterOffset, std::ios::beg);
    file.read(reinterpret_cast<char*>(raster.data()), static_cast<std::streamsize>(raster.size()));
    if (static_cast<std::size_t>(file.gcount()) != raster.size()) {
        return unexpected(JobError::render("truncated raster data"));
    }

    core::RgbBuffer rgb(page.width, page.height);
    const bool wide = page.maxValue > 255;

    auto sampleAt = [&](std::size_t i) -> unsigned {
        if (wide) {
            return (static_cast<unsigned>(raster[i * 2]) << 8) | raster[i * 2 + 1];
        }
        return raster[i];
    };

    const auto rowBytes = static_cast<std::size_t>((page.width + 7) / 8);
    for (int y = 0; y < page.height; ++y) {
        for (int x = 0; x < page.width; ++x) {
            const auto pixel = static_cast<std::size_t>(y) * static_cast<std::size_t>(page.width) +
                               static_cast<std::size_t>(x);
            std::uint8_t r = 0, g = 0, b = 0;
            switch (page.format) {
                case Format::Bitmap: {
                    const std::uint8_t byte = raster[static_cast<std::size_t>(y) * rowBytes +
                                                     static_cast<std::size_t>(x / 8)];
                    const bool black = (byte & (0x80u >> (x % 8))) != 0;
                    r = g = b = black ? 0 : 255;
                    break;
                }
                case Format::Graymap:
                    r = g = b = scaleSample(sampleAt(pixel), page.maxValue);
                    break;
                case Format::Pixmap:
                    r = scaleSample(sampleAt(pixel * 3), page.maxValue);
                    g = scaleSample(sampleAt(pixel * 3 + 1), page.maxValue);
                    b = scaleSample(sampleAt(pixel * 3 + 2), page.maxValue);
                    break;
            }
            rgb.at(x, y, 0) = r;
            rgb.at(x, y, 1) = g;
            rgb.at(x, y, 2) = b;
        }
    }
    return std::move(rgb);
}

} // namespace thermo::document
