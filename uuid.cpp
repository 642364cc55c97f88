// uuid.cpp
#include "uuid.h"
#include <cctype>

namespace {

const std::string_view URN_PREFIX = "urn:uuid:";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

// Decodes 32 hex digits, with hyphens required before bytes 4, 6, 8 and 10
// when `dashed` is set.
bool decodeHex(std::string_view text, bool dashed, Uuid& out) {
    size_t pos = 0;
    for (int i = 0; i < 16; i++) {
        if (dashed && (i == 4 || i == 6 || i == 8 || i == 10)) {
            if (text[pos] != '-') {
                return false;
            }
            pos++;
        }

        int hi = hexValue(text[pos++]);
        int lo = hexValue(text[pos++]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

} // namespace

bool parseUuid(std::string_view text, Uuid& out) {
    if (startsWithIgnoreCase(text, URN_PREFIX)) {
        text.remove_prefix(URN_PREFIX.size());
        if (text.size() != 36) {
            return false;
        }
    } else if (!text.empty() && text.front() == '{') {
        if (text.size() != 38 || text.back() != '}') {
            return false;
        }
        text = text.substr(1, 36);
    }

    Uuid parsed;
    bool ok = false;
    if (text.size() == 36) {
        ok = decodeHex(text, true, parsed);
    } else if (text.size() == 32) {
        ok = decodeHex(text, false, parsed);
    }

    if (ok) {
        out = parsed;
    }
    return ok;
}

std::string toString(const Uuid& uuid) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result += '-';
        }
        result += digits[uuid.bytes[i] >> 4];
        result += digits[uuid.bytes[i] & 0x0F];
    }
    return result;
}
