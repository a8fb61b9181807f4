#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/parquet/ParquetMetadata.hpp"
#include "dataset-validator/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dsvalidator {
namespace source {
namespace parquet {

/// Bits needed to represent max_value
DATASET_VALIDATOR_API unsigned bit_width(uint32_t max_value);

/// Decode count values of the RLE / bit-packed hybrid encoding
DATASET_VALIDATOR_API void decode_rle_hybrid(const uint8_t *data, size_t size,
                                             unsigned width, size_t count,
                                             std::vector<uint32_t> &out);

DATASET_VALIDATOR_API std::vector<uint8_t>
snappy_decompress(const uint8_t *src, size_t size);

DATASET_VALIDATOR_API std::vector<uint8_t>
gzip_decompress(const uint8_t *src, size_t size, size_t expected_size);

/// Decompress a page body according to the column codec
DATASET_VALIDATOR_API std::vector<uint8_t>
decompress_page(int32_t codec, std::vector<uint8_t> compressed,
                size_t uncompressed_size);

/// PLAIN-decode count values of the leaf's physical type, converted to
/// cells according to its logical annotation. Returns bytes consumed.
DATASET_VALIDATOR_API size_t decode_plain(const LeafColumn &leaf,
                                          const uint8_t *data, size_t size,
                                          size_t count,
                                          std::vector<CellValue> &out);

} // namespace parquet
} // namespace source
} // namespace dsvalidator
