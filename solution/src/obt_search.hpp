#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace satr {

// Offline helper for unknown layouts: find offsets that look like a 32-bit
// big-endian OBT counter.
//
// Every offset in frame 0 whose value lies in [min_obt, max_obt] is a
// candidate. A candidate survives if, for every later frame i, its value
// never exceeds (previous value + i) by more than max_step seconds.
// data.size() must be a multiple of frame_size; trailing bytes are ignored.
std::vector<size_t> find_obt_candidates(const std::vector<uint8_t>& data, size_t frame_size,
                                        uint32_t min_obt, uint32_t max_obt,
                                        uint32_t max_step = 8);

} // namespace satr
