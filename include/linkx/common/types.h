// =============================================================================
// linkx - Common Type Definitions
// =============================================================================
// Core type definitions shared by the index reader, block decoder and
// extractor.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef LINKX_COMMON_TYPES_H
#define LINKX_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace linkx {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Type alias for block identifiers.
/// @note Block IDs are 1-based and follow index record order.
using BlockId = std::uint32_t;

/// @brief Owned byte buffer holding one block.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Non-owning view over block bytes.
using ByteSpan = std::span<const std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Invalid block ID sentinel value.
inline constexpr BlockId kInvalidBlockId = 0;

/// @brief First block ID handed out by the extractor.
inline constexpr BlockId kFirstBlockId = 1;

/// @brief Default index file name.
inline constexpr const char* kDefaultIndexFile = "LinkInfo.bin";

/// @brief Default data file name.
inline constexpr const char* kDefaultDataFile = "LinkData.bin";

/// @brief Default output directory.
inline constexpr const char* kDefaultOutputPath = "output";

/// @brief Default extension for extracted block files.
inline constexpr const char* kDefaultOutputExtension = ".bin";

}  // namespace linkx

#endif  // LINKX_COMMON_TYPES_H
