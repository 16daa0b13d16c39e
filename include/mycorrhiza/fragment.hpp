/**
 * @file fragment.hpp
 * @brief File fragment wire format, the optional metadata block, and the splitter.
 *
 * @details
 * ## Fragment payload (carried in a DATA packet with FLAG_FRAGMENTED)
 * ```
 *  0 ........... 15   16      17      18 ...
 * +----------------+-------+-------+------------------+
 * |  transfer_id   | index | flags |  data (<= 200)   |
 * +----------------+-------+-------+------------------+
 * ```
 * flags: bit0 FINAL (no fragment follows), bit1 META (index 0 only: the
 * reassembled stream starts with a metadata block).
 *
 * A FINAL fragment with no data is a *marker*. It names the final index and
 * carries nothing else: the data for that index still has to arrive, so a
 * sender that learns it is done only after the last data fragment left can
 * close the stream without hiding a lost fragment.
 *
 * ## Metadata block
 * ```
 *  u16 BE length | "filename=<name>\nsize=<bytes>\nmime_type=<type>"
 * ```
 * Unknown keys are skipped on extraction.
 */
#ifndef MYCORRHIZA_FRAGMENT_HPP
#define MYCORRHIZA_FRAGMENT_HPP

#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "etl/string.h"
#include "mycorrhiza/address.hpp"

namespace mycorrhiza {

static constexpr size_t FRAGMENT_HEADER_SIZE = ID_SIZE + 2;  ///< id + index + flags
static constexpr size_t FRAGMENT_DATA_MAX    = 200;
static constexpr size_t MAX_FRAGMENTS        = 256;          ///< index is one byte
static constexpr size_t MAX_TRANSFER_BYTES   = FRAGMENT_DATA_MAX * MAX_FRAGMENTS;

enum : uint8_t {
  FRAG_FINAL = 0x01,
  FRAG_META  = 0x02
};

/// Parsed fragment; @c data points into the caller's buffer.
struct FragmentView {
  TransferId     transfer_id{};
  uint8_t        index{0};
  uint8_t        flags{0};
  const uint8_t* data{nullptr};
  size_t         size{0};

  bool is_final() const  { return (flags & FRAG_FINAL) != 0; }
  bool has_meta() const  { return (flags & FRAG_META) != 0; }
  bool is_marker() const { return is_final() && size == 0; }
};

/**
 * @brief Parse a fragment payload.
 * @retval false  shorter than the 18-byte header or more than 200 data bytes
 */
bool parse_fragment(const uint8_t* payload, size_t n, FragmentView& out);

/// Serialize one fragment into @p out (cleared first). @p n must be <= 200.
void build_fragment(const TransferId& id, uint8_t index, uint8_t flags,
                    const uint8_t* data, size_t n, std::vector<uint8_t>& out);

using FileName = etl::string<255>;
using MimeType = etl::string<64>;

struct FileMetadata {
  FileName filename;
  uint32_t size{0};
  MimeType mime_type;
};

/// Append the metadata block (length prefix included) to @p out.
void encode_metadata(const FileMetadata& meta, std::vector<uint8_t>& out);

/**
 * @brief Read the metadata block at the start of a reassembled stream.
 * @param body_offset  receives the offset of the first file byte
 * @retval false  the length prefix runs past the end of @p data
 */
bool extract_metadata(const uint8_t* data, size_t n, FileMetadata& meta, size_t& body_offset);

/// Fresh transfer id: SHA-256(data || now_ms || 8 random bytes)[:16].
TransferId make_transfer_id(const uint8_t* data, size_t n, uint32_t now_ms);

/// Fragments needed for a stream of @p stream_len bytes (at least one).
size_t fragment_count(size_t stream_len, size_t fragment_size = FRAGMENT_DATA_MAX);

/**
 * @brief Split a file into ready-to-send fragment payloads.
 *
 * The stream is the metadata block (when @p meta is given) followed by the
 * file bytes. Indices run from 0; the last fragment carries FINAL and data.
 *
 * @param fragment_size  data bytes per fragment, clamped to [1, 200]
 * @retval false  the stream is empty, or more than 256 fragments would be
 *                needed; @p out is empty
 */
bool split(const TransferId& id, const uint8_t* data, size_t n, const FileMetadata* meta,
           size_t fragment_size, std::vector<std::vector<uint8_t>>& out);

} // namespace mycorrhiza

#endif // MYCORRHIZA_FRAGMENT_HPP
