#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace compression
{

using Bytes = std::vector<std::uint8_t>;

// Upper bound of deflate's expansion on inflate (1032:1 for a zlib stream).
constexpr std::size_t MAX_DEFLATE_RATIO = 1032;

// Largest output `compressed_size` bytes of zlib data can inflate to.
std::size_t max_inflated_size(std::size_t compressed_size);

// Deflates `in` (zlib stream, best compression).
// Returns nullopt when the result would not be strictly smaller than the
// input; the caller then sends the payload uncompressed.
std::optional<Bytes> compress(const Bytes &in);

// Inflates `in` into exactly `original_size` bytes.
// original_size == 0 means "not compressed": `in` is returned unchanged.
// Returns nullopt on corrupt data, a size mismatch, or an original_size
// larger than `in` can possibly inflate to. Output grows as data inflates.
std::optional<Bytes> decompress(const Bytes &in, std::uint32_t original_size);

}  // namespace compression
