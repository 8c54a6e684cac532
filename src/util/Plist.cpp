#include "util/Plist.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string_view>

namespace harbor::util {

static std::string decode_entities(std::string_view s) {
  std::string out; out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '&') { out.push_back(s[i]); continue; }
    auto rest = s.substr(i);
    if (rest.starts_with("&amp;"))       { out.push_back('&');  i += 4; }
    else if (rest.starts_with("&lt;"))   { out.push_back('<');  i += 3; }
    else if (rest.starts_with("&gt;"))   { out.push_back('>');  i += 3; }
    else if (rest.starts_with("&quot;")) { out.push_back('"');  i += 5; }
    else if (rest.starts_with("&apos;")) { out.push_back('\''); i += 5; }
    else out.push_back('&');
  }
  return out;
}

static std::optional<PlistDict> parse_xml(std::string_view xml) {
  auto start = xml.find("<dict>");
  if (start == std::string_view::npos || xml.find("<plist") == std::string_view::npos) return std::nullopt;
  PlistDict out;
  std::optional<std::string> pending_key;
  std::optional<std::string> array_key;  // top-level array being read
  int depth = 1;
  size_t pos = start + 6;
  while (depth > 0) {
    auto lt = xml.find('<', pos);
    if (lt == std::string_view::npos) break;
    auto gt = xml.find('>', lt);
    if (gt == std::string_view::npos) break;
    std::string_view tag = xml.substr(lt + 1, gt - lt - 1);
    pos = gt + 1;
    bool self_closing = !tag.empty() && tag.back() == '/';
    if (self_closing) tag.remove_suffix(1);
    auto sp = tag.find(' ');
    if (sp != std::string_view::npos) tag = tag.substr(0, sp);

    if (tag == "key" && !self_closing) {
      auto end = xml.find("</key>", pos);
      if (end == std::string_view::npos) break;
      if (depth == 1) pending_key = decode_entities(xml.substr(pos, end - pos));
      pos = end + 6;
    } else if (tag == "string") {
      std::string value;
      if (!self_closing) {
        auto end = xml.find("</string>", pos);
        if (end == std::string_view::npos) break;
        value = decode_entities(xml.substr(pos, end - pos));
        pos = end + 9;
      }
      if (depth == 1 && pending_key) out.strings[*pending_key] = std::move(value);
      else if (depth == 2 && array_key) out.string_arrays[*array_key].push_back(std::move(value));
      pending_key.reset();
    } else if ((tag == "true" || tag == "false") && self_closing) {
      if (depth == 1 && pending_key) out.bools[*pending_key] = tag == "true";
      pending_key.reset();
    } else if (tag == "dict" || tag == "array") {
      if (depth == 1) {
        if (tag == "array" && pending_key) {
          out.string_arrays[*pending_key];
          if (!self_closing) array_key = *pending_key;
        }
        pending_key.reset();
      }
      if (!self_closing) ++depth;
    } else if (tag == "/dict" || tag == "/array") {
      --depth;
      if (depth == 1) array_key.reset();
    } else if (!tag.empty() && tag.front() != '/' && tag.front() != '!' && tag.front() != '?') {
      if (depth == 1) pending_key.reset();
    }
  }
  return out;
}

namespace {

class BinaryPlist {
public:
  explicit BinaryPlist(const std::vector<unsigned char>& d) : d_(d) {}

  std::optional<PlistDict> parse() {
    if (d_.size() < 8 + 32) return std::nullopt;
    size_t t = d_.size() - 32;
    offset_size_ = d_[t + 6];
    ref_size_ = d_[t + 7];
    num_objects_ = be(t + 8, 8);
    uint64_t top = be(t + 16, 8);
    table_offset_ = be(t + 24, 8);
    if (offset_size_ == 0 || offset_size_ > 8 || ref_size_ == 0 || ref_size_ > 8) return std::nullopt;
    if (table_offset_ > t || num_objects_ > (t - table_offset_) / offset_size_) return std::nullopt;

    auto top_off = object_offset(top);
    if (!top_off || *top_off >= d_.size()) return std::nullopt;
    unsigned char marker = d_[*top_off];
    if ((marker >> 4) != 0xD) return std::nullopt;
    size_t p = *top_off + 1;
    auto count = length(marker, p);
    if (!count) return std::nullopt;
    // lengths come from the file; compare by division so they cannot wrap
    if (p > d_.size() || *count > (d_.size() - p) / (2 * ref_size_)) return std::nullopt;

    PlistDict out;
    for (uint64_t i = 0; i < *count; ++i) {
      auto key = string_at(be(p + i * ref_size_, ref_size_));
      if (!key) continue;
      uint64_t vref = be(p + (*count + i) * ref_size_, ref_size_);
      auto voff = object_offset(vref);
      if (!voff || *voff >= d_.size()) continue;
      unsigned char m = d_[*voff];
      if (m == 0x08 || m == 0x09) {
        out.bools[*key] = m == 0x09;
      } else if ((m >> 4) == 0xA) {
        if (auto items = string_array_at(*voff)) out.string_arrays[*key] = std::move(*items);
      } else if (auto val = string_at(vref)) {
        out.strings[*key] = std::move(*val);
      }
    }
    return out;
  }

private:
  uint64_t be(size_t at, size_t n) const {
    uint64_t v = 0;
    for (size_t i = 0; i < n && at + i < d_.size(); ++i) v = (v << 8) | d_[at + i];
    return v;
  }

  std::optional<size_t> object_offset(uint64_t ref) const {
    if (ref >= num_objects_) return std::nullopt;
    return static_cast<size_t>(be(static_cast<size_t>(table_offset_ + ref * offset_size_), offset_size_));
  }

  // Object length from the low nibble, or from the int object that follows when it is 0xF.
  std::optional<uint64_t> length(unsigned char marker, size_t& p) const {
    uint64_t n = marker & 0x0F;
    if (n != 0x0F) return n;
    if (p >= d_.size() || (d_[p] >> 4) != 0x1) return std::nullopt;
    size_t bytes = size_t{1} << (d_[p] & 0x0F);
    if (bytes > 8 || p + 1 + bytes > d_.size()) return std::nullopt;
    n = be(p + 1, bytes);
    p += 1 + bytes;
    return n;
  }

  std::optional<std::vector<std::string>> string_array_at(size_t off) const {
    size_t p = off + 1;
    auto n = length(d_[off], p);
    if (!n || p > d_.size() || *n > (d_.size() - p) / ref_size_) return std::nullopt;
    std::vector<std::string> out;
    for (uint64_t i = 0; i < *n; ++i) {
      if (auto s = string_at(be(p + i * ref_size_, ref_size_))) out.push_back(std::move(*s));
    }
    return out;
  }

  std::optional<std::string> string_at(uint64_t ref) const {
    auto off = object_offset(ref);
    if (!off || *off >= d_.size()) return std::nullopt;
    unsigned char marker = d_[*off];
    size_t p = *off + 1;
    auto n = length(marker, p);
    if (!n) return std::nullopt;
    if ((marker >> 4) == 0x5) {
      if (p > d_.size() || *n > d_.size() - p) return std::nullopt;
      return std::string(reinterpret_cast<const char*>(d_.data() + p), static_cast<size_t>(*n));
    }
    if ((marker >> 4) == 0x6) {
      if (p > d_.size() || *n > (d_.size() - p) / 2) return std::nullopt;
      std::string out;
      for (uint64_t i = 0; i < *n; ++i) {
        uint32_t cp = static_cast<uint32_t>(be(p + 2 * i, 2));
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < *n) {
          uint32_t lo = static_cast<uint32_t>(be(p + 2 * (i + 1), 2));
          if (lo >= 0xDC00 && lo <= 0xDFFF) { cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00); ++i; }
        }
        append_utf8(out, cp);
      }
      return out;
    }
    return std::nullopt;
  }

  static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) { out.push_back(static_cast<char>(cp)); }
    else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  const std::vector<unsigned char>& d_;
  unsigned offset_size_{};
  unsigned ref_size_{};
  uint64_t num_objects_{};
  uint64_t table_offset_{};
};

} // namespace

auto parse_plist(const std::vector<unsigned char>& data) -> std::optional<PlistDict> {
  if (data.size() >= 8 && std::memcmp(data.data(), "bplist00", 8) == 0) {
    return BinaryPlist(data).parse();
  }
  std::string_view xml(reinterpret_cast<const char*>(data.data()), data.size());
  return parse_xml(xml);
}

auto read_plist(const std::string& path) -> std::optional<PlistDict> {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::vector<unsigned char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return parse_plist(buf);
}

auto parse_plist_strings(const std::vector<unsigned char>& data) -> std::optional<PlistStrings> {
  auto d = parse_plist(data);
  if (!d) return std::nullopt;
  return std::move(d->strings);
}

auto read_plist_strings(const std::string& path) -> std::optional<PlistStrings> {
  auto d = read_plist(path);
  if (!d) return std::nullopt;
  return std::move(d->strings);
}

} // namespace harbor::util
