#include "yankring/entry.hpp"
#include <cctype>
#include <chrono>

namespace yankring {

static constexpr char kCtrlV = '\x16';

const char* kindCode(EntryKind kind) {
    switch (kind) {
    case EntryKind::Linewise: return "V";
    case EntryKind::Blockwise: return "b";
    case EntryKind::Charwise: break;
    }
    return "v";
}

std::optional<EntryKind> kindFromCode(std::string_view code) {
    if (code == "v") return EntryKind::Charwise;
    if (code == "V") return EntryKind::Linewise;
    if (code == "b") return EntryKind::Blockwise;
    return std::nullopt;
}

EntryKind parseKind(std::string_view regtype, std::optional<int>* width) {
    if (regtype == "V") return EntryKind::Linewise;
    if (regtype == "b") return EntryKind::Blockwise;
    if (!regtype.empty() && regtype.front() == kCtrlV) {
        if (width) {
            int w = 0;
            bool any = false;
            for (size_t i = 1; i < regtype.size(); ++i) {
                if (!std::isdigit(static_cast<unsigned char>(regtype[i]))) break;
                w = w * 10 + (regtype[i] - '0');
                any = true;
            }
            *width = any ? std::optional<int>(w) : std::nullopt;
        }
        return EntryKind::Blockwise;
    }
    return EntryKind::Charwise;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace yankring
