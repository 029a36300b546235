#include "thermo/tspl/CommandStream.hpp"

#include <algorithm>

namespace thermo::tspl {

const char* toString(DirectiveKind kind) {
    switch (kind) {
        case DirectiveKind::Size:      return "SIZE";
        case DirectiveKind::Speed:     return "SPEED";
        case DirectiveKind::Density:   return "DENSITY";
        case DirectiveKind::Gap:       return "GAP";
        case DirectiveKind::BlackMark: return "BLINE";
        case DirectiveKind::Reference: return "REFERENCE";
        case DirectiveKind::Clear:     return "CLS";
        case DirectiveKind::Bitmap:    return "BITMAP";
        case DirectiveKind::Print:     return "PRINT";
    }
    return "?";
}

core::ByteBuffer& CommandStream::begin(DirectiveKind kind) {
    closeCurrent();
    entries.push_back(Directive{kind, buffer.size(), 0});
    return buffer;
}

void CommandStream::closeCurrent() {
    if (!entries.empty()) {
        auto& last = entries.back();
        last.length = buffer.size() - last.offset;
    }
}

int CommandStream::indexOf(DirectiveKind kind) const {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].kind == kind) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::size_t CommandStream::count(DirectiveKind kind) const {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
        [kind](const Directive& d) { return d.kind == kind; }));
}

bool CommandStream::isWellFormed() const {
    if (entries.empty()) {
        return false;
    }
    return entries.front().kind == DirectiveKind::Size
        && entries.back().kind == DirectiveKind::Print
        && count(DirectiveKind::Size) == 1
        && count(DirectiveKind::Print) == 1
        && count(DirectiveKind::Bitmap) == 1;
}

} // namespace thermo::tspl
