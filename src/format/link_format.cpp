// =============================================================================
// linkx - Link Container Format Implementation
// =============================================================================

#include "linkx/format/link_format.h"

#include <algorithm>
#include <iterator>

namespace linkx::format {

// =============================================================================
// IndexRecord Implementation
// =============================================================================

IndexRecord IndexRecord::parse(const std::uint8_t* src) noexcept {
    IndexRecord record;
    record.offset = loadLE<std::uint64_t>(src);
    record.uncompressedSize = loadLE<std::uint64_t>(src + 8);
    record.compressedSize = loadLE<std::uint64_t>(src + 16);
    record.methodSlot = loadLE<std::uint64_t>(src + 24);
    std::copy_n(src + 32, record.tag0.size(), record.tag0.begin());
    std::copy_n(src + 36, record.tag1.size(), record.tag1.begin());
    return record;
}

void IndexRecord::serialize(std::uint8_t* dst) const noexcept {
    storeLE<std::uint64_t>(dst, offset);
    storeLE<std::uint64_t>(dst + 8, uncompressedSize);
    storeLE<std::uint64_t>(dst + 16, compressedSize);
    storeLE<std::uint64_t>(dst + 24, methodSlot);
    std::copy(tag0.begin(), tag0.end(), dst + 32);
    std::copy(tag1.begin(), tag1.end(), dst + 36);
}

// =============================================================================
// BlockSubHeader Implementation
// =============================================================================

std::vector<std::uint32_t> BlockSubHeader::fieldSizes() const {
    std::vector<std::uint32_t> sizes;
    sizes.reserve(kSubHeaderSlotCount - kFirstFieldSizeSlot);
    std::copy_if(slots.begin() + kFirstFieldSizeSlot, slots.end(), std::back_inserter(sizes),
                 [](std::uint32_t size) { return size != 0; });
    return sizes;
}

BlockSubHeader BlockSubHeader::parse(const std::uint8_t* src) noexcept {
    BlockSubHeader header;
    for (std::size_t i = 0; i < kSubHeaderSlotCount; ++i) {
        header.slots[i] = loadLE<std::uint32_t>(src + i * sizeof(std::uint32_t));
    }
    return header;
}

void BlockSubHeader::serialize(std::uint8_t* dst) const noexcept {
    for (std::size_t i = 0; i < kSubHeaderSlotCount; ++i) {
        storeLE<std::uint32_t>(dst + i * sizeof(std::uint32_t), slots[i]);
    }
}

}  // namespace linkx::format
