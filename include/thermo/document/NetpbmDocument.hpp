#pragma once

#include "thermo/document/PageRenderer.hpp"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace thermo::document {

/**
 * @brief Multi-page raster document made of concatenated binary netpbm images.
 *
 * Each page is one P4 (bitmap), P5 (graymap) or P6 (pixmap) image; pages
 * follow each other in the file with no separator, as netpbm tools emit them
 * (`pnmcat`, `pdftoppm | cat`). The file is indexed once on open, then pages
 * are decoded on demand and bilinearly resampled onto the caller's canvas.
 */
class NetpbmDocument : public PageRenderer {
public:
    static JobResult<std::unique_ptr<PageRenderer>> open(const std::string& path);

    ~NetpbmDocument() override;

    int pageCount() const override { return static_cast<int>(pages.size()); }
    JobResult<PageSize> pageDimensions(int index) const override;
    JobResult<void> renderPage(int index, core::RgbBuffer& canvas) override;
    void close() override;
    bool isOpen() const override { return file.is_open(); }

private:
    enum class Format : std::uint8_t { Bitmap, Graymap, Pixmap };

    struct PageEntry {
        Format format = Format::Pixmap;
        int width = 0;
        int height = 0;
        int maxValue = 1;
        std::streamoff rasterOffset = 0;
        std::size_t rasterBytes = 0;
    };

    explicit NetpbmDocument(std::string path);

    JobResult<void> indexPages();
    JobResult<core::RgbBuffer> decodePage(const PageEntry& page);

    std::string path;
    std::ifstream file;
    std::vector<PageEntry> pages;
};

} // namespace thermo::document
