#include "encoding_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>

namespace Yomigana {
namespace encoding {

namespace {

std::string normalizeCharset(const std::string &charset) {
  std::string n;
  for (char c : charset) {
    if (c == '-' || c == '_')
      continue;
    n += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return n;
}

} // namespace

bool isUtf8Charset(const std::string &charset) {
  return charset.empty() || normalizeCharset(charset) == "UTF8";
}

CharsetConverter::CharsetConverter(const std::string &fromCharset,
                                   const std::string &toCharset)
    : cd_(invalidDescriptor()),
      identity_(normalizeCharset(fromCharset) == normalizeCharset(toCharset) ||
                (isUtf8Charset(fromCharset) && isUtf8Charset(toCharset))) {
  if (!identity_)
    cd_ = iconv_open(toCharset.c_str(), fromCharset.c_str());
}

CharsetConverter::~CharsetConverter() {
  if (cd_ != invalidDescriptor())
    iconv_close(cd_);
}

bool CharsetConverter::convert(const std::string &input, std::string &output) {
  if (identity_) {
    output = input;
    return true;
  }
  if (cd_ == invalidDescriptor())
    return false;

  iconv(cd_, nullptr, nullptr, nullptr, nullptr);

  std::string result(std::max<size_t>(input.size() * 2, 16), '\0');
  char *inBuf = const_cast<char *>(input.data());
  size_t inBytesLeft = input.size();
  size_t written = 0;

  while (inBytesLeft > 0) {
    char *outBuf = &result[written];
    size_t outBytesLeft = result.size() - written;

    size_t rc = iconv(cd_, &inBuf, &inBytesLeft, &outBuf, &outBytesLeft);
    written = result.size() - outBytesLeft;

    if (rc != static_cast<size_t>(-1))
      continue;
    if (errno != E2BIG)
      return false; // EILSEQ / EINVAL

    result.resize(result.size() * 2);
  }

  // シフト状態を終端させる
  for (;;) {
    char *outBuf = &result[written];
    size_t outBytesLeft = result.size() - written;
    size_t rc = iconv(cd_, nullptr, nullptr, &outBuf, &outBytesLeft);
    written = result.size() - outBytesLeft;
    if (rc != static_cast<size_t>(-1))
      break;
    if (errno != E2BIG)
      return false;
    result.resize(result.size() * 2);
  }

  result.resize(written);
  output = std::move(result);
  return true;
}

} // namespace encoding
} // namespace Yomigana
