// =============================================================================
// gzchunk - Common Type Definitions
// =============================================================================
// Core type definitions shared by every gzchunk module.
//
// This module defines:
// - OperationMode: compress or decompress
// - SequenceNumber: chunk ordering type
// - Block size and compression level constants
// - The expected extension of compressed files
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef GZC_COMMON_TYPES_H
#define GZC_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gzc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Chunk sequence number.
/// @note Real chunks are numbered from 0; the end-of-stream sentinel carries -1.
using SequenceNumber = std::int64_t;

/// @brief zlib compression level (1-9).
using CompressionLevel = int;

// =============================================================================
// Constants
// =============================================================================

/// @brief Sequence number carried by the end-of-stream sentinel.
inline constexpr SequenceNumber kSentinelSequence = -1;

/// @brief Default number of raw bytes per chunk (1 MiB).
inline constexpr std::size_t kDefaultBlockSize = 1024 * 1024;

/// @brief Smallest accepted block size.
inline constexpr std::size_t kMinBlockSize = 1;

/// @brief Largest accepted block size (64 MiB).
inline constexpr std::size_t kMaxBlockSize = 64 * 1024 * 1024;

/// @brief Default compression level.
inline constexpr CompressionLevel kDefaultCompressionLevel = 6;

/// @brief Minimum compression level.
inline constexpr CompressionLevel kMinCompressionLevel = 1;

/// @brief Maximum compression level.
inline constexpr CompressionLevel kMaxCompressionLevel = 9;

/// @brief Extension a source file must carry to be decompressed.
inline constexpr std::string_view kCompressedExtension = ".gz";

// =============================================================================
// Operation Mode
// =============================================================================

/// @brief Direction of a file operation.
enum class OperationMode : std::uint8_t {
    kCompress = 1,
    kDecompress = 2
};

/// @brief Convert OperationMode to string.
[[nodiscard]] constexpr std::string_view operationModeToString(OperationMode mode) noexcept {
    switch (mode) {
        case OperationMode::kCompress:
            return "compress";
        case OperationMode::kDecompress:
            return "decompress";
    }
    return "unknown";
}

/// @brief Check if a compression level is within [1, 9].
[[nodiscard]] constexpr bool isValidCompressionLevel(CompressionLevel level) noexcept {
    return level >= kMinCompressionLevel && level <= kMaxCompressionLevel;
}

}  // namespace gzc

#endif  // GZC_COMMON_TYPES_H
