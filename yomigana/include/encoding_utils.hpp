#pragma once

#include <iconv.h>
#include <string>

namespace Yomigana {
namespace encoding {

bool isUtf8Charset(const std::string &charset);

// iconv conversion descriptor for one direction. Conversions reset the
// shift state first, so one converter can be reused for many strings, but
// only by one thread at a time.
class CharsetConverter {
public:
  CharsetConverter(const std::string &fromCharset, const std::string &toCharset);
  ~CharsetConverter();

  CharsetConverter(const CharsetConverter &) = delete;
  CharsetConverter &operator=(const CharsetConverter &) = delete;

  bool isOpen() const { return identity_ || cd_ != invalidDescriptor(); }
  bool isIdentity() const { return identity_; }

  // 失敗時は false を返し output は変更しない
  bool convert(const std::string &input, std::string &output);

private:
  static iconv_t invalidDescriptor() { return reinterpret_cast<iconv_t>(-1); }

  iconv_t cd_;
  bool identity_;
};

} // namespace encoding
} // namespace Yomigana
