#include "fuzzcache/match.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fuzzcache {
namespace {

struct SchemePort {
  std::string_view scheme;
  std::string_view default_port;
};

constexpr std::array<SchemePort, 6> kSpecialSchemes = {{
    {"http", "80"},
    {"https", "443"},
    {"ws", "80"},
    {"wss", "443"},
    {"ftp", "21"},
    {"file", ""},
}};

// Opaque hosts may keep '%'; domains are checked after percent-decoding and may not.
constexpr std::string_view kForbiddenHostChars = " #/:<>?@[\\]^|";
constexpr std::string_view kForbiddenDomainChars = " #%/:<>?@[\\]^|";

struct ParsedUrl {
  std::string scheme;
  bool special = false;
  bool has_authority = false;
  bool opaque_path = false;
  std::string username;
  std::string password;
  std::string host;
  std::string port;
  std::string path;
  std::optional<std::string> query;
  std::optional<std::string> fragment;
};

const SchemePort* FindSpecialScheme(std::string_view scheme) {
  for (const auto& entry : kSpecialSchemes) {
    if (entry.scheme == scheme) {
      return &entry;
    }
  }
  return nullptr;
}

std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

std::vector<std::string_view> Split(std::string_view text, char separator) {
  std::vector<std::string_view> parts{};
  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string StripControlAndSpace(std::string_view raw) {
  std::size_t begin = 0;
  std::size_t end = raw.size();
  while (begin < end && static_cast<unsigned char>(raw[begin]) <= 0x20U) {
    ++begin;
  }
  while (end > begin && static_cast<unsigned char>(raw[end - 1]) <= 0x20U) {
    --end;
  }
  std::string out{};
  out.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    const char ch = raw[i];
    if (ch == '\t' || ch == '\n' || ch == '\r') {
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

enum class EncodeSet {
  kC0Control,
  kPath,
  kQuery,
  kSpecialQuery,
  kFragment,
  kUserinfo,
};

bool NeedsEncoding(unsigned char ch, EncodeSet set) {
  if (ch < 0x20U || ch >= 0x7FU) {
    return true;
  }
  if (set == EncodeSet::kC0Control) {
    return false;
  }
  if (ch == ' ' || ch == '"' || ch == '<' || ch == '>') {
    return true;
  }
  switch (set) {
    case EncodeSet::kC0Control:
      return false;
    case EncodeSet::kPath:
      return ch == '`' || ch == '{' || ch == '}';
    case EncodeSet::kQuery:
      return false;
    case EncodeSet::kSpecialQuery:
      return ch == '\'';
    case EncodeSet::kFragment:
      return ch == '`';
    case EncodeSet::kUserinfo:
      return ch == '`' || ch == '{' || ch == '}' || ch == '/' || ch == ':' || ch == ';' || ch == '=' ||
             ch == '@' || ch == '[' || ch == ']' || ch == '\\' || ch == '^' || ch == '|';
  }
  return false;
}

std::string PercentEncode(std::string_view text, EncodeSet set) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out{};
  out.reserve(text.size());
  for (const unsigned char ch : text) {
    if (!NeedsEncoding(ch, set)) {
      out.push_back(static_cast<char>(ch));
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[(ch >> 4U) & 0x0FU]);
    out.push_back(kHex[ch & 0x0FU]);
  }
  return out;
}

// Malformed escapes are kept as-is.
std::string PercentDecode(std::string_view text) {
  std::string out{};
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

bool IsSingleDotSegment(std::string_view segment) {
  const auto lowered = ToLowerAscii(segment);
  return lowered == "." || lowered == "%2e";
}

bool IsDoubleDotSegment(std::string_view segment) {
  const auto lowered = ToLowerAscii(segment);
  return lowered == ".." || lowered == ".%2e" || lowered == "%2e." || lowered == "%2e%2e";
}

std::string RemoveDotSegments(std::string_view path) {
  std::vector<std::string_view> segments{};
  const auto parts = Split(path.empty() || path.front() != '/' ? path : path.substr(1), '/');
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const bool last = i + 1 == parts.size();
    const auto segment = parts[i];
    if (IsDoubleDotSegment(segment)) {
      if (!segments.empty()) {
        segments.pop_back();
      }
      if (last) {
        segments.emplace_back();
      }
    } else if (IsSingleDotSegment(segment)) {
      if (last) {
        segments.emplace_back();
      }
    } else {
      segments.push_back(segment);
    }
  }

  std::string out{};
  out.reserve(path.size() + 1);
  for (const auto segment : segments) {
    out.push_back('/');
    out.append(segment);
  }
  return out.empty() ? std::string("/") : out;
}

bool ParsePort(std::string_view text, const SchemePort* special, std::string& port) {
  if (text.empty()) {
    port.clear();
    return true;
  }
  if (!std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return false;
  }
  const auto first_non_zero = text.find_first_not_of('0');
  const auto trimmed = first_non_zero == std::string_view::npos ? std::string_view("0") : text.substr(first_non_zero);
  if (trimmed.size() > 5 || std::stoul(std::string(trimmed)) > 65535UL) {
    return false;
  }
  if (special != nullptr && trimmed == special->default_port) {
    port.clear();
  } else {
    port = std::string(trimmed);
  }
  return true;
}

// Accepts decimal, 0x-prefixed hex and 0-prefixed octal. Values are capped so oversized
// parts still fail the range checks instead of overflowing.
bool ParseIpv4Number(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }
  int radix = 10;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    radix = 16;
    text.remove_prefix(2);
  } else if (text.size() >= 2 && text[0] == '0') {
    radix = 8;
    text.remove_prefix(1);
  }

  constexpr std::uint64_t kCap = std::uint64_t{1} << 40U;
  value = 0;
  for (const char ch : text) {
    const int digit = HexValue(ch);
    if (digit < 0 || digit >= radix) {
      return false;
    }
    value = std::min(kCap, value * static_cast<std::uint64_t>(radix) + static_cast<std::uint64_t>(digit));
  }
  return true;
}

std::vector<std::string_view> Ipv4Parts(std::string_view host) {
  auto parts = Split(host, '.');
  if (parts.size() > 1 && parts.back().empty()) {
    parts.pop_back();
  }
  return parts;
}

bool EndsInNumber(std::string_view host) {
  const auto parts = Split(host, '.');
  if (parts.back().empty() && parts.size() == 1) {
    return false;
  }
  const auto last = parts.back().empty() ? parts[parts.size() - 2] : parts.back();
  if (!last.empty() &&
      std::all_of(last.begin(), last.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return true;
  }
  std::uint64_t ignored = 0;
  return ParseIpv4Number(last, ignored);
}

bool ParseIpv4(std::string_view host, std::string& out) {
  const auto parts = Ipv4Parts(host);
  if (parts.size() > 4) {
    return false;
  }
  std::vector<std::uint64_t> numbers{};
  for (const auto part : parts) {
    std::uint64_t number = 0;
    if (!ParseIpv4Number(part, number)) {
      return false;
    }
    numbers.push_back(number);
  }
  for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
    if (numbers[i] > 255) {
      return false;
    }
  }
  const auto last_bits = 8U * static_cast<unsigned>(5 - numbers.size());
  if (numbers.back() >= (std::uint64_t{1} << last_bits)) {
    return false;
  }

  std::uint64_t address = numbers.back();
  for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
    address += numbers[i] << (8U * static_cast<unsigned>(3 - i));
  }
  out.clear();
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.append(std::to_string((address >> static_cast<unsigned>(shift)) & 0xFFU));
    if (shift != 0) {
      out.push_back('.');
    }
  }
  return true;
}

bool ParseIpv6(std::string_view input, std::string& out) {
  std::array<std::uint16_t, 8> address{};
  std::size_t piece = 0;
  std::optional<std::size_t> compress{};
  std::size_t pos = 0;
  const auto at = [&](std::size_t i) -> char { return i < input.size() ? input[i] : '\0'; };

  if (at(pos) == ':') {
    if (at(pos + 1) != ':') {
      return false;
    }
    pos += 2;
    compress = ++piece;
  }
  while (pos < input.size()) {
    if (piece == 8) {
      return false;
    }
    if (at(pos) == ':') {
      if (compress.has_value()) {
        return false;
      }
      ++pos;
      compress = ++piece;
      continue;
    }

    unsigned value = 0;
    std::size_t length = 0;
    while (length < 4 && HexValue(at(pos)) >= 0) {
      value = value * 16U + static_cast<unsigned>(HexValue(at(pos)));
      ++pos;
      ++length;
    }

    if (at(pos) == '.') {
      if (length == 0 || piece > 6) {
        return false;
      }
      pos -= length;
      int numbers_seen = 0;
      while (pos < input.size()) {
        if (numbers_seen > 0) {
          if (at(pos) != '.' || numbers_seen >= 4) {
            return false;
          }
          ++pos;
        }
        if (std::isdigit(static_cast<unsigned char>(at(pos))) == 0) {
          return false;
        }
        std::optional<unsigned> ipv4_piece{};
        while (std::isdigit(static_cast<unsigned char>(at(pos))) != 0) {
          const auto digit = static_cast<unsigned>(at(pos) - '0');
          if (!ipv4_piece.has_value()) {
            ipv4_piece = digit;
          } else if (*ipv4_piece == 0) {
            return false;
          } else {
            ipv4_piece = *ipv4_piece * 10U + digit;
          }
          if (*ipv4_piece > 255) {
            return false;
          }
          ++pos;
        }
        address[piece] = static_cast<std::uint16_t>(address[piece] * 0x100U + *ipv4_piece);
        ++numbers_seen;
        if (numbers_seen == 2 || numbers_seen == 4) {
          ++piece;
        }
      }
      if (numbers_seen != 4) {
        return false;
      }
      break;
    }

    if (at(pos) == ':') {
      ++pos;
      if (pos >= input.size()) {
        return false;
      }
    } else if (pos < input.size()) {
      return false;
    }
    address[piece++] = static_cast<std::uint16_t>(value);
  }

  if (compress.has_value()) {
    auto swaps = piece - *compress;
    piece = 7;
    while (piece != 0 && swaps > 0) {
      std::swap(address[piece], address[*compress + swaps - 1]);
      --piece;
      --swaps;
    }
  } else if (piece != 8) {
    return false;
  }

  // Longest run of two or more zero pieces, first one on ties.
  std::optional<std::size_t> zero_run{};
  std::size_t best_length = 1;
  for (std::size_t i = 0; i < 8;) {
    std::size_t j = i;
    while (j < 8 && address[j] == 0) {
      ++j;
    }
    if (j - i > best_length) {
      best_length = j - i;
      zero_run = i;
    }
    i = j == i ? i + 1 : j;
  }

  static constexpr char kHex[] = "0123456789abcdef";
  out = "[";
  bool ignore_zero = false;
  for (std::size_t i = 0; i < 8; ++i) {
    if (ignore_zero && address[i] == 0) {
      continue;
    }
    ignore_zero = false;
    if (zero_run == i) {
      out.append(i == 0 ? "::" : ":");
      ignore_zero = true;
      continue;
    }
    std::string hex{};
    for (unsigned v = address[i];; v >>= 4U) {
      hex.insert(hex.begin(), kHex[v & 0x0FU]);
      if (v < 16U) {
        break;
      }
    }
    out.append(hex);
    if (i != 7) {
      out.push_back(':');
    }
  }
  out.push_back(']');
  return true;
}

// Non-ASCII domains would need IDNA processing and are treated as unparseable.
bool ParseHost(std::string_view input, bool special, std::string& host) {
  if (!input.empty() && input.front() == '[') {
    if (input.back() != ']') {
      return false;
    }
    return ParseIpv6(input.substr(1, input.size() - 2), host);
  }

  if (!special) {
    if (input.find_first_of(kForbiddenHostChars) != std::string_view::npos) {
      return false;
    }
    host = PercentEncode(input, EncodeSet::kC0Control);
    return true;
  }

  const auto decoded = PercentDecode(input);
  if (decoded.empty()) {
    return false;
  }
  for (const unsigned char ch : decoded) {
    if (ch < 0x20U || ch >= 0x7FU) {
      return false;
    }
  }
  const auto domain = ToLowerAscii(decoded);
  if (domain.find_first_of(kForbiddenDomainChars) != std::string::npos) {
    return false;
  }
  if (EndsInNumber(domain)) {
    return ParseIpv4(domain, host);
  }
  host = domain;
  return true;
}

bool ParseAuthority(std::string_view authority, ParsedUrl& url) {
  const auto at = authority.rfind('@');
  const bool has_credentials = at != std::string_view::npos;
  if (has_credentials) {
    const auto credentials = authority.substr(0, at);
    const auto colon = credentials.find(':');
    url.username = PercentEncode(credentials.substr(0, colon), EncodeSet::kUserinfo);
    if (colon != std::string_view::npos) {
      url.password = PercentEncode(credentials.substr(colon + 1), EncodeSet::kUserinfo);
    }
    authority.remove_prefix(at + 1);
  }

  std::string_view host = authority;
  std::string_view port{};
  bool has_port = false;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    host = authority.substr(0, close + 1);
    const auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return false;
      }
      port = tail.substr(1);
      has_port = true;
    }
  } else if (const auto colon = authority.find(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
    has_port = true;
  }

  if (host.empty()) {
    if (url.special || has_credentials || has_port) {
      return false;
    }
    url.host.clear();
    return true;
  }
  if (!ParseHost(host, url.special, url.host)) {
    return false;
  }
  return ParsePort(port, url.special ? FindSpecialScheme(url.scheme) : nullptr, url.port);
}

bool IsWindowsDriveLetter(std::string_view text) {
  return text.size() == 2 && std::isalpha(static_cast<unsigned char>(text[0])) != 0 &&
         (text[1] == ':' || text[1] == '|');
}

bool ParseFileRest(std::string_view rest, ParsedUrl& url) {
  url.has_authority = true;
  std::string path{};
  if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
    rest.remove_prefix(2);
    const auto slash = rest.find('/');
    const auto host = rest.substr(0, slash);
    const auto tail = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
    if (IsWindowsDriveLetter(host)) {
      path = "/" + std::string(1, host[0]) + ":" + std::string(tail);
    } else {
      if (!host.empty()) {
        if (!ParseHost(host, true, url.host)) {
          return false;
        }
        if (url.host == "localhost") {
          url.host.clear();
        }
      }
      path = std::string(tail);
    }
  } else if (!rest.empty() && rest.front() == '/') {
    path = std::string(rest);
  } else {
    path = "/" + std::string(rest);
  }
  url.path = PercentEncode(RemoveDotSegments(path), EncodeSet::kPath);
  return true;
}

std::optional<ParsedUrl> ParseUrl(std::string_view raw) {
  const auto input = StripControlAndSpace(raw);
  if (input.empty() || std::isalpha(static_cast<unsigned char>(input.front())) == 0) {
    return std::nullopt;
  }

  const auto colon = input.find(':');
  if (colon == std::string::npos) {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < colon; ++i) {
    const auto ch = static_cast<unsigned char>(input[i]);
    if (std::isalnum(ch) == 0 && ch != '+' && ch != '-' && ch != '.') {
      return std::nullopt;
    }
  }

  ParsedUrl url{};
  url.scheme = ToLowerAscii(std::string_view(input).substr(0, colon));
  url.special = FindSpecialScheme(url.scheme) != nullptr;

  std::string_view rest = std::string_view(input).substr(colon + 1);
  if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
    url.fragment = PercentEncode(rest.substr(hash + 1), EncodeSet::kFragment);
    rest = rest.substr(0, hash);
  }
  if (const auto question = rest.find('?'); question != std::string_view::npos) {
    url.query = PercentEncode(rest.substr(question + 1), url.special ? EncodeSet::kSpecialQuery : EncodeSet::kQuery);
    rest = rest.substr(0, question);
  }

  if (url.special) {
    std::string normalized_rest(rest);
    std::replace(normalized_rest.begin(), normalized_rest.end(), '\\', '/');
    if (url.scheme == "file") {
      if (!ParseFileRest(normalized_rest, url)) {
        return std::nullopt;
      }
      return url;
    }

    std::string_view remainder = normalized_rest;
    while (!remainder.empty() && remainder.front() == '/') {
      remainder.remove_prefix(1);
    }
    const auto slash = remainder.find('/');
    url.has_authority = true;
    if (!ParseAuthority(remainder.substr(0, slash), url)) {
      return std::nullopt;
    }
    const auto path = slash == std::string_view::npos ? std::string_view{} : remainder.substr(slash);
    url.path = PercentEncode(RemoveDotSegments(path), EncodeSet::kPath);
    return url;
  }

  if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
    rest.remove_prefix(2);
    const auto slash = rest.find('/');
    url.has_authority = true;
    if (!ParseAuthority(rest.substr(0, slash), url)) {
      return std::nullopt;
    }
    if (slash != std::string_view::npos) {
      url.path = PercentEncode(RemoveDotSegments(rest.substr(slash)), EncodeSet::kPath);
    }
    return url;
  }

  if (!rest.empty() && rest.front() == '/') {
    url.path = PercentEncode(RemoveDotSegments(rest), EncodeSet::kPath);
    return url;
  }

  // Opaque path, e.g. mailto:someone@example.com.
  url.opaque_path = true;
  url.path = PercentEncode(rest, EncodeSet::kC0Control);
  return url;
}

std::string Serialize(const ParsedUrl& url) {
  std::string out = url.scheme;
  out.push_back(':');
  if (url.has_authority) {
    out.append("//");
    if (!url.username.empty() || !url.password.empty()) {
      out.append(url.username);
      if (!url.password.empty()) {
        out.push_back(':');
        out.append(url.password);
      }
      out.push_back('@');
    }
    out.append(url.host);
    if (!url.port.empty()) {
      out.push_back(':');
      out.append(url.port);
    }
  } else if (!url.opaque_path && url.path.size() >= 2 && url.path[0] == '/' && url.path[1] == '/') {
    // Keeps a hostless "//x" path from reading back as an authority.
    out.append("/.");
  }
  out.append(url.path);
  if (url.query.has_value()) {
    out.push_back('?');
    out.append(*url.query);
  }
  if (url.fragment.has_value()) {
    out.push_back('#');
    out.append(*url.fragment);
  }
  return out;
}

}  // namespace

std::string NormalizeUrl(const std::string& raw, const ExactUrlSpec& spec) {
  auto parsed = ParseUrl(raw);
  if (!parsed.has_value()) {
    return raw;
  }
  if (spec.exclude_hash) {
    parsed->fragment.reset();
    if (parsed->opaque_path && !parsed->query.has_value()) {
      while (!parsed->path.empty() && parsed->path.back() == ' ') {
        parsed->path.pop_back();
      }
    }
  }
  return Serialize(*parsed);
}

}  // namespace fuzzcache
