#include "obt_search.hpp"
#include "type_codec.hpp"

namespace satr {

static int64_t be_u32_at(const std::vector<uint8_t>& data, size_t pos) {
    return static_cast<int64_t>(std::get<uint64_t>(decode_value(data.data() + pos, 4, FieldType::U32, Endian::Big)));
}

std::vector<size_t> find_obt_candidates(const std::vector<uint8_t>& data, size_t frame_size,
                                        uint32_t min_obt, uint32_t max_obt, uint32_t max_step) {
    std::vector<size_t> good;
    if (frame_size < 4 || data.size() < frame_size) return good;

    const size_t frames = data.size() / frame_size;

    for (size_t off = 0; off + 4 <= frame_size; ++off) {
        const int64_t first = be_u32_at(data, off);
        if (first < min_obt || first > max_obt) continue;

        int64_t prev = first;
        bool ok = true;
        for (size_t i = 1; i < frames; ++i) {
            const int64_t v = be_u32_at(data, i * frame_size + off);
            if (v - (prev + static_cast<int64_t>(i)) > static_cast<int64_t>(max_step)) {
                ok = false;
                break;
            }
            prev = v;
        }
        if (ok) good.push_back(off);
    }
    return good;
}

} // namespace satr
