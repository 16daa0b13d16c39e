// -----------------------------------------------------------------------------
// fragment.cpp - fragment codec, metadata block, splitter
//
// API & wire layout: see include/mycorrhiza/fragment.hpp
// Tests: tests/test_fragment.cpp
// -----------------------------------------------------------------------------
#include "mycorrhiza/fragment.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include "mycorrhiza/hash.hpp"

namespace mycorrhiza {

bool parse_fragment(const uint8_t* payload, size_t n, FragmentView& out) {
  if (!payload || n < FRAGMENT_HEADER_SIZE) return false;
  if (n - FRAGMENT_HEADER_SIZE > FRAGMENT_DATA_MAX) return false;

  out.transfer_id = TransferId::from_bytes(payload);
  out.index = payload[ID_SIZE];
  out.flags = payload[ID_SIZE + 1];
  out.size  = n - FRAGMENT_HEADER_SIZE;
  out.data  = out.size ? payload + FRAGMENT_HEADER_SIZE : nullptr;
  return true;
}

void build_fragment(const TransferId& id, uint8_t index, uint8_t flags,
                    const uint8_t* data, size_t n, std::vector<uint8_t>& out) {
  if (n > FRAGMENT_DATA_MAX) n = FRAGMENT_DATA_MAX;
  out.clear();
  out.reserve(FRAGMENT_HEADER_SIZE + n);
  out.insert(out.end(), id.bytes.begin(), id.bytes.end());
  out.push_back(index);
  out.push_back(flags);
  if (n) out.insert(out.end(), data, data + n);
}

// ---------- metadata block ----------

namespace {

void append_line(std::vector<uint8_t>& out, const char* key, const char* value, size_t vlen) {
  if (!out.empty() && out.back() != '\n') out.push_back('\n');
  out.insert(out.end(), key, key + strlen(key));
  out.push_back('=');
  out.insert(out.end(), value, value + vlen);
}

} // namespace

void encode_metadata(const FileMetadata& meta, std::vector<uint8_t>& out) {
  std::vector<uint8_t> text;
  char size_buf[12];
  const int size_len = snprintf(size_buf, sizeof(size_buf), "%lu",
                                static_cast<unsigned long>(meta.size));

  append_line(text, "filename", meta.filename.c_str(), meta.filename.size());
  append_line(text, "size", size_buf, size_len > 0 ? static_cast<size_t>(size_len) : 0);
  if (!meta.mime_type.empty()) {
    append_line(text, "mime_type", meta.mime_type.c_str(), meta.mime_type.size());
  }

  const uint16_t len = static_cast<uint16_t>(text.size());
  out.push_back(static_cast<uint8_t>(len >> 8));
  out.push_back(static_cast<uint8_t>(len & 0xFF));
  out.insert(out.end(), text.begin(), text.end());
}

// -----------------------------------------------------------------------------
// extract_metadata()
// PRE:    data points at the start of a reassembled stream flagged META.
// POLICY: lines are key=value separated by '\n'; lines without '=' and
//         unknown keys are skipped; an unparsable size leaves size at 0.
// OUT:    body_offset = 2 + block length.
// -----------------------------------------------------------------------------
bool extract_metadata(const uint8_t* data, size_t n, FileMetadata& meta, size_t& body_offset) {
  if (!data || n < 2) return false;
  const size_t len = (static_cast<size_t>(data[0]) << 8) | data[1];
  if (2 + len > n) return false;

  meta = FileMetadata{};
  const char* p   = reinterpret_cast<const char*>(data + 2);
  const char* end = p + len;
  while (p < end) {
    const char* eol = static_cast<const char*>(memchr(p, '\n', static_cast<size_t>(end - p)));
    if (!eol) eol = end;
    const char* eq = static_cast<const char*>(memchr(p, '=', static_cast<size_t>(eol - p)));
    if (eq) {
      const size_t klen = static_cast<size_t>(eq - p);
      const char*  v    = eq + 1;
      const size_t vlen = static_cast<size_t>(eol - v);
      if (klen == 8 && memcmp(p, "filename", 8) == 0) {
        meta.filename.assign(v, vlen < meta.filename.max_size() ? vlen : meta.filename.max_size());
      } else if (klen == 4 && memcmp(p, "size", 4) == 0) {
        char buf[12] = {0};
        memcpy(buf, v, vlen < sizeof(buf) - 1 ? vlen : sizeof(buf) - 1);
        meta.size = static_cast<uint32_t>(strtoul(buf, nullptr, 10));
      } else if (klen == 9 && memcmp(p, "mime_type", 9) == 0) {
        meta.mime_type.assign(v, vlen < meta.mime_type.max_size() ? vlen : meta.mime_type.max_size());
      }
    }
    p = eol + 1;
  }

  body_offset = 2 + len;
  return true;
}

// ---------- splitter ----------

TransferId make_transfer_id(const uint8_t* data, size_t n, uint32_t now_ms) {
  uint8_t salt[8];
  if (!random_bytes(salt, sizeof(salt))) memset(salt, 0, sizeof(salt));  // data + time still vary
  const uint8_t now_be[4] = {
    static_cast<uint8_t>(now_ms >> 24), static_cast<uint8_t>(now_ms >> 16),
    static_cast<uint8_t>(now_ms >> 8),  static_cast<uint8_t>(now_ms)
  };

  Sha256 h;
  h.update(data, n);
  h.update(now_be, sizeof(now_be));
  h.update(salt, sizeof(salt));
  const Digest d = h.finish();
  return TransferId::from_bytes(d.data());
}

size_t fragment_count(size_t stream_len, size_t fragment_size) {
  if (fragment_size == 0 || fragment_size > FRAGMENT_DATA_MAX) fragment_size = FRAGMENT_DATA_MAX;
  if (stream_len == 0) return 1;
  return (stream_len + fragment_size - 1) / fragment_size;
}

bool split(const TransferId& id, const uint8_t* data, size_t n, const FileMetadata* meta,
           size_t fragment_size, std::vector<std::vector<uint8_t>>& out) {
  out.clear();
  if (fragment_size == 0 || fragment_size > FRAGMENT_DATA_MAX) fragment_size = FRAGMENT_DATA_MAX;

  std::vector<uint8_t> stream;
  if (meta) encode_metadata(*meta, stream);
  if (n) stream.insert(stream.end(), data, data + n);

  if (stream.empty()) return false;                 // nothing a receiver could complete
  const size_t count = fragment_count(stream.size(), fragment_size);
  if (count > MAX_FRAGMENTS) return false;

  out.resize(count);
  for (size_t i = 0; i < count; ++i) {
    const size_t off   = i * fragment_size;
    const size_t chunk = off < stream.size()
                           ? (stream.size() - off < fragment_size ? stream.size() - off : fragment_size)
                           : 0;
    uint8_t flags = 0;
    if (i + 1 == count)   flags |= FRAG_FINAL;
    if (i == 0 && meta)   flags |= FRAG_META;
    build_fragment(id, static_cast<uint8_t>(i), flags,
                   chunk ? stream.data() + off : nullptr, chunk, out[i]);
  }
  return true;
}

} // namespace mycorrhiza
