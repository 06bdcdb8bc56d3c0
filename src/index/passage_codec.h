#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <finbot/status.h>
#include <finbot/types.h>

namespace finbot::index
{
    // meta.bin layout (integers little-endian):
    //   "finbot.meta.v1\n"
    //   u32 dim, u64 count
    //   count x { u8 flags, str content, str source,
    //             [str category], [str sheet_name], u32 n_extra, n_extra x (str key, str value) }
    //   u32 crc32c over everything above
    // str = u32 byte length + bytes. flags bit0: category present, bit1: sheet_name present.
    std::string EncodePassages(std::uint32_t dim, const std::vector<Passage> &passages);

    Status DecodePassages(std::string_view raw, std::uint32_t *dim, std::vector<Passage> *out);

} // namespace finbot::index
