// uuid.h
#ifndef UUID_H
#define UUID_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

// Raw 16-byte UUID value. Version and variant bits are carried as-is.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
};

// Parse a UUID from text. Returns false and leaves `out` alone if the text
// is not a UUID. Accepted spellings, hex digits in either case:
//   018d5e5e-7b3a-7000-8000-000000000000          canonical
//   018d5e5e7b3a70008000000000000000              simple
//   {018d5e5e-7b3a-7000-8000-000000000000}        braced
//   urn:uuid:018d5e5e-7b3a-7000-8000-000000000000 URN
bool parseUuid(std::string_view text, Uuid& out);

// Canonical lowercase 8-4-4-4-12 rendering. Only the tests use it, to build
// inputs from raw bytes.
std::string toString(const Uuid& uuid);

#endif // UUID_H
