#include "crc_utils.h"

#include <array>

namespace qedl {

namespace {

std::array<uint32_t, 256> makeTable()
{
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t c = i;
        for (int k = 0; k < 8; k++)
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        table[i] = c;
    }
    return table;
}

const std::array<uint32_t, 256>& table()
{
    static const std::array<uint32_t, 256> t = makeTable();
    return t;
}

} // namespace

uint32_t Crc32::update(uint32_t crc, const uint8_t* data, size_t length)
{
    const auto& t = table();
    uint32_t c = ~crc;
    for (size_t i = 0; i < length; i++)
        c = t[(c ^ data[i]) & 0xFF] ^ (c >> 8);
    return ~c;
}

uint32_t Crc32::compute(const uint8_t* data, size_t length)
{
    return update(0, data, length);
}

uint32_t Crc32::compute(const QByteArray& data)
{
    return compute(reinterpret_cast<const uint8_t*>(data.constData()),
                   static_cast<size_t>(data.size()));
}

} // namespace qedl
