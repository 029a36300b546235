#include "thermo/document/DocumentSource.hpp"

#include <array>
#include <fstream>
#include <istream>
#include <ostream>

namespace thermo::document {

namespace {

JobResult<std::size_t> pump(std::istream& in, std::ostream& out, const std::string& label) {
    std::array<char, 64 * 1024> chunk{};
    std::size_t total = 0;

    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(chunk.data(), got);
        if (!out) {
            return unexpected(JobError::document("cannot write local copy of " + label));
        }
        total += static_cast<std::size_t>(got);
    }

    if (in.bad()) {
        return unexpected(JobError::document("cannot read document " + label));
    }
    return total;
}

} // namespace

StreamDocumentSource::StreamDocumentSource(std::istream& input, std::string label)
: input(input)
, label(std::move(label)) {}

JobResult<std::size_t> StreamDocumentSource::copyTo(std::ostream& out) {
    return pump(input, out, label);
}

FileDocumentSource::FileDocumentSource(std::filesystem::path path)
: path(std::move(path)) {}

JobResult<std::size_t> FileDocumentSource::copyTo(std::ostream& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(JobError::document("cannot open document " + path.string()));
    }
    return pump(in, out, path.string());
}

} // namespace thermo::document
