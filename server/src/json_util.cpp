#include "json_util.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <limits>

namespace sendkey::server {

namespace {

class FlatParser {
 public:
  explicit FlatParser(std::string_view text) : text_(text) {}

  bool Parse(FlatJsonObject& out, std::string& error) {
    out.clear();
    SkipSpace();
    if (!Consume('{')) {
      error = "json object expected";
      return false;
    }
    SkipSpace();
    if (Consume('}')) {
      return Finish(error);
    }
    while (true) {
      SkipSpace();
      std::string key;
      if (!ParseString(key)) {
        error = "json key invalid";
        return false;
      }
      SkipSpace();
      if (!Consume(':')) {
        error = "json colon expected";
        return false;
      }
      SkipSpace();
      FlatJsonValue value;
      if (!ParseValue(value, error)) {
        return false;
      }
      if (!out.emplace(std::move(key), std::move(value)).second) {
        error = "json duplicate key";
        return false;
      }
      SkipSpace();
      if (Consume(',')) {
        continue;
      }
      if (Consume('}')) {
        return Finish(error);
      }
      error = "json separator expected";
      return false;
    }
  }

 private:
  bool Finish(std::string& error) {
    SkipSpace();
    if (pos_ != text_.size()) {
      error = "json trailing data";
      return false;
    }
    return true;
  }

  void SkipSpace() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' ||
            text_[pos_] == '\r')) {
      pos_++;
    }
  }

  bool Consume(char ch) {
    if (pos_ < text_.size() && text_[pos_] == ch) {
      pos_++;
      return true;
    }
    return false;
  }

  bool ConsumeLiteral(std::string_view lit) {
    if (text_.substr(pos_, lit.size()) == lit) {
      pos_ += lit.size();
      return true;
    }
    return false;
  }

  bool ParseValue(FlatJsonValue& out, std::string& error) {
    if (pos_ >= text_.size()) {
      error = "json value expected";
      return false;
    }
    const char ch = text_[pos_];
    if (ch == '"') {
      out.kind = FlatJsonValue::Kind::kString;
      if (!ParseString(out.text)) {
        error = "json string invalid";
        return false;
      }
      return true;
    }
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
      out.kind = FlatJsonValue::Kind::kNumber;
      if (!ParseNumber(out.text)) {
        error = "json number invalid";
        return false;
      }
      return true;
    }
    if (ConsumeLiteral("true")) {
      out.kind = FlatJsonValue::Kind::kBool;
      out.boolean = true;
      return true;
    }
    if (ConsumeLiteral("false")) {
      out.kind = FlatJsonValue::Kind::kBool;
      out.boolean = false;
      return true;
    }
    if (ConsumeLiteral("null")) {
      out.kind = FlatJsonValue::Kind::kNull;
      return true;
    }
    if (ch == '{' || ch == '[') {
      error = "json nested value not supported";
      return false;
    }
    error = "json value invalid";
    return false;
  }

  bool ParseNumber(std::string& out) {
    const std::size_t start = pos_;
    Consume('-');
    if (pos_ >= text_.size()) {
      return false;
    }
    if (text_[pos_] == '0') {
      pos_++;
    } else if (!ReadDigits()) {
      return false;
    }
    if (Consume('.')) {
      if (!ReadDigits()) {
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      pos_++;
      if (!Consume('+')) {
        Consume('-');
      }
      if (!ReadDigits()) {
        return false;
      }
    }
    out.assign(text_.substr(start, pos_ - start));
    return true;
  }

  bool ReadDigits() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() &&
           std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      pos_++;
    }
    return pos_ > start;
  }

  bool ReadHex4(std::uint32_t& out) {
    if (text_.size() - pos_ < 4) {
      return false;
    }
    out = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = text_[pos_++];
      out <<= 4;
      if (c >= '0' && c <= '9') {
        out |= static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        out |= static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        out |= static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        return false;
      }
    }
    return true;
  }

  static void AppendUtf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
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

  bool ParseString(std::string& out) {
    out.clear();
    if (!Consume('"')) {
      return false;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        return false;
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        return false;
      }
      const char esc = text_[pos_++];
      switch (esc) {
        case '"':
        case '\\':
        case '/':
          out.push_back(esc);
          break;
        case 'b':
          out.push_back('\b');
          break;
        case 'f':
          out.push_back('\f');
          break;
        case 'n':
          out.push_back('\n');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!ReadHex4(cp)) {
            return false;
          }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t low = 0;
            if (!Consume('\\') || !Consume('u') || !ReadHex4(low) ||
                low < 0xDC00 || low > 0xDFFF) {
              return false;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            return false;
          }
          AppendUtf8(cp, out);
          break;
        }
        default:
          return false;
      }
    }
    return false;
  }

  std::string_view text_;
  std::size_t pos_{0};
};

}  // namespace

void WriteJsonEscaped(std::ostream& os, std::string_view value) {
  os << '"';
  for (const char ch : value) {
    switch (ch) {
      case '\\':
        os << "\\\\";
        break;
      case '"':
        os << "\\\"";
        break;
      case '\b':
        os << "\\b";
        break;
      case '\f':
        os << "\\f";
        break;
      case '\n':
        os << "\\n";
        break;
      case '\r':
        os << "\\r";
        break;
      case '\t':
        os << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(ch)));
          os << buf;
        } else {
          os << ch;
        }
        break;
    }
  }
  os << '"';
}

std::string FormatRfc3339(Timestamp t) {
  const std::time_t secs = static_cast<std::time_t>(ToUnixSeconds(t));
  std::tm tm{};
  if (gmtime_r(&secs, &tm) == nullptr) {
    return {};
  }
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ",
                                      &tm);
  return std::string(buf, n);
}

bool FlatJsonValue::AsInt64(std::int64_t& out) const {
  out = 0;
  if (kind != Kind::kNumber || text.empty()) {
    return false;
  }
  std::size_t i = 0;
  bool negative = false;
  if (text[0] == '-') {
    negative = true;
    i = 1;
  }
  if (i >= text.size()) {
    return false;
  }
  std::uint64_t value = 0;
  const std::uint64_t limit =
      negative ? static_cast<std::uint64_t>(
                     std::numeric_limits<std::int64_t>::max()) + 1
               : static_cast<std::uint64_t>(
                     std::numeric_limits<std::int64_t>::max());
  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (value > (limit - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  if (negative) {
    out = value == limit ? std::numeric_limits<std::int64_t>::min()
                         : -static_cast<std::int64_t>(value);
  } else {
    out = static_cast<std::int64_t>(value);
  }
  return true;
}

bool ParseFlatJsonObject(std::string_view text, FlatJsonObject& out,
                         std::string& error) {
  error.clear();
  FlatParser parser(text);
  if (!parser.Parse(out, error)) {
    out.clear();
    return false;
  }
  return true;
}

}  // namespace sendkey::server
