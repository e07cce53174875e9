// =============================================================================
// linkx - Link Container Format Definitions
// =============================================================================
// Binary format definitions for the two-file link container.
//
// This module defines:
// - IndexRecord structure (40 bytes, index file)
// - BlockSubHeader structure (128 bytes, start of every block)
// - CompressionMethod codes
// - Little-endian load/store helpers
//
// Index File Layout:
// +-------------------+
// |  IndexRecord 1    |  (40 bytes)
// +-------------------+
// |  IndexRecord 2    |
// +-------------------+
// |       ...         |
// +-------------------+
//
// IndexRecord Layout (little-endian):
//   [0..8)    offset
//   [8..16)   uncompressed size
//   [16..24)  compressed size
//   [24..32)  method slot (low byte = method, rest reserved)
//   [32..36)  opaque tag 0
//   [36..40)  opaque tag 1
//
// Deflate Block Layout:
// +-------------------+
// |  BlockSubHeader   |  (32 x u32 = 128 bytes)
// +-------------------+
// |  Field 1          |  u32 inner size + zlib stream
// +-------------------+
// |  padding to 128   |
// +-------------------+
// |  Field 2          |
// +-------------------+
// |       ...         |
// +-------------------+
// =============================================================================

#ifndef LINKX_FORMAT_LINK_FORMAT_H
#define LINKX_FORMAT_LINK_FORMAT_H

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <type_traits>
#include <vector>

#include "linkx/common/types.h"

namespace linkx::format {

// =============================================================================
// Format Constants
// =============================================================================

/// @brief Fields inside a deflate block end on multiples of this value.
inline constexpr std::size_t kFieldAlignment = 128;

/// @brief Number of u32 slots in a block sub-header.
inline constexpr std::size_t kSubHeaderSlotCount = 32;

/// @brief Sub-header size in bytes.
inline constexpr std::size_t kSubHeaderSize = kSubHeaderSlotCount * sizeof(std::uint32_t);

/// @brief Slot holding the declared field count.
inline constexpr std::size_t kDeclaredFieldCountSlot = 1;

/// @brief First slot of the candidate field size table.
inline constexpr std::size_t kFirstFieldSizeSlot = 3;

/// @brief Size of the inner declared size prefix of each field.
inline constexpr std::size_t kFieldPrefixSize = sizeof(std::uint32_t);

/// @brief Round a block-relative position up to the next field boundary.
[[nodiscard]] constexpr std::size_t alignToField(std::size_t position) noexcept {
    return ((position + kFieldAlignment - 1) / kFieldAlignment) * kFieldAlignment;
}

// =============================================================================
// Little-Endian Helpers
// =============================================================================

/// @brief Load an unsigned little-endian integer from raw bytes.
/// @pre src points at sizeof(T) readable bytes.
template <typename T>
[[nodiscard]] T loadLE(const std::uint8_t* src) noexcept {
    static_assert(std::is_unsigned_v<T>, "loadLE requires an unsigned integer type");

    T value;
    std::memcpy(&value, src, sizeof(T));

    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(value));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(value));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(value));
        }
    }
    return value;
}

/// @brief Store an unsigned integer in little-endian order.
/// @pre dst points at sizeof(T) writable bytes.
template <typename T>
void storeLE(std::uint8_t* dst, T value) noexcept {
    static_assert(std::is_unsigned_v<T>, "storeLE requires an unsigned integer type");

    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(value));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(value));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(value));
        }
    }
    std::memcpy(dst, &value, sizeof(T));
}

// =============================================================================
// Compression Method
// =============================================================================

/// @brief Block compression method (low byte of the record's method slot).
enum class CompressionMethod : std::uint8_t {
    /// @brief Block bytes are stored as-is.
    kStored = 0,

    /// @brief Block carries a sub-header and zlib-wrapped deflate fields.
    kDeflate = 1
};

/// @brief Human-readable name of a method code.
[[nodiscard]] constexpr std::string_view compressionMethodName(std::uint8_t code) noexcept {
    switch (code) {
        case static_cast<std::uint8_t>(CompressionMethod::kStored):
            return "stored";
        case static_cast<std::uint8_t>(CompressionMethod::kDeflate):
            return "deflate";
        default:
            return "unknown";
    }
}

// =============================================================================
// IndexRecord Structure
// =============================================================================

/// @brief One index file record describing where a block lives.
struct IndexRecord {
    /// @brief Byte offset of the block in the data file.
    std::uint64_t offset = 0;

    /// @brief Size after decompression as recorded by the producer.
    /// @note Informational only; never enforced against decoded output.
    std::uint64_t uncompressedSize = 0;

    /// @brief Exact number of bytes to read at offset.
    std::uint64_t compressedSize = 0;

    /// @brief Raw method slot. Low byte is the method, upper bytes reserved.
    std::uint64_t methodSlot = 0;

    /// @brief Two opaque trailing tags, preserved as read.
    std::array<std::uint8_t, 4> tag0{};
    std::array<std::uint8_t, 4> tag1{};

    /// @brief Fixed on-disk record size.
    static constexpr std::size_t kSize = 40;

    /// @brief Method code (low byte of the method slot).
    [[nodiscard]] std::uint8_t methodCode() const noexcept {
        return static_cast<std::uint8_t>(methodSlot & 0xFF);
    }

    /// @brief Reserved bits of the method slot, shifted down.
    [[nodiscard]] std::uint64_t methodReserved() const noexcept { return methodSlot >> 8; }

    /// @brief Whether the block carries deflate fields.
    [[nodiscard]] bool isDeflate() const noexcept {
        return methodCode() == static_cast<std::uint8_t>(CompressionMethod::kDeflate);
    }

    /// @brief Whether the block is stored raw.
    [[nodiscard]] bool isStored() const noexcept {
        return methodCode() == static_cast<std::uint8_t>(CompressionMethod::kStored);
    }

    /// @brief Check that [offset, offset + compressedSize) lies within a file.
    /// @note A sum that would wrap 64 bits is out of range.
    [[nodiscard]] bool fitsWithin(std::uint64_t fileSize) const noexcept {
        return offset <= fileSize && compressedSize <= fileSize - offset;
    }

    /// @brief Decode a record from kSize bytes.
    /// @pre src points at kSize readable bytes.
    [[nodiscard]] static IndexRecord parse(const std::uint8_t* src) noexcept;

    /// @brief Encode the record into kSize bytes.
    /// @pre dst points at kSize writable bytes.
    void serialize(std::uint8_t* dst) const noexcept;

    bool operator==(const IndexRecord&) const = default;
};

// =============================================================================
// BlockSubHeader Structure
// =============================================================================

/// @brief Fixed 32-slot header at the start of every deflate block.
/// @note Slots 0 and 2 are opaque. Slot 1 is the declared field count.
///       Slots 3..31 are candidate field sizes, 0 meaning "unused".
struct BlockSubHeader {
    std::array<std::uint32_t, kSubHeaderSlotCount> slots{};

    /// @brief Declared field count (slot 1).
    [[nodiscard]] std::uint32_t declaredFieldCount() const noexcept {
        return slots[kDeclaredFieldCountSlot];
    }

    /// @brief Opaque slot 0.
    [[nodiscard]] std::uint32_t opaque0() const noexcept { return slots[0]; }

    /// @brief Opaque slot 2.
    [[nodiscard]] std::uint32_t opaque2() const noexcept { return slots[2]; }

    /// @brief Ordered list of non-zero candidate field sizes.
    [[nodiscard]] std::vector<std::uint32_t> fieldSizes() const;

    /// @brief Decode a sub-header from kSubHeaderSize bytes.
    /// @pre src points at kSubHeaderSize readable bytes.
    [[nodiscard]] static BlockSubHeader parse(const std::uint8_t* src) noexcept;

    /// @brief Encode the sub-header into kSubHeaderSize bytes.
    void serialize(std::uint8_t* dst) const noexcept;
};

static_assert(IndexRecord::kSize == 40, "IndexRecord::kSize must be 40");
static_assert(kSubHeaderSize == 128, "BlockSubHeader must be 128 bytes");

}  // namespace linkx::format

#endif  // LINKX_FORMAT_LINK_FORMAT_H
