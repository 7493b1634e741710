#pragma once

#include <cstdint>
#include <cstddef>
#include <QByteArray>

namespace qedl {

// CRC-32/ISO-HDLC (the GPT checksum): reflected 0x04C11DB7, init and
// final xor 0xFFFFFFFF
class Crc32 {
public:
    static uint32_t compute(const uint8_t* data, size_t length);
    static uint32_t compute(const QByteArray& data);
    static uint32_t update(uint32_t crc, const uint8_t* data, size_t length);
};

} // namespace qedl
