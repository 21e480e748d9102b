#pragma once

#include "analyzer.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace Yomigana {

// Reads Content-Length framed request payloads and writes one framed
// response per request, until the input ends.
class RequestServer {
public:
  // これを超える Content-Length は不正なヘッダーとして扱う
  static constexpr size_t kMaxContentLength = 64 * 1024 * 1024;

  RequestServer(std::istream &in, std::ostream &out, const Analyzer &analyzer);

  // 処理したリクエスト数を返す
  size_t run();

private:
  std::istream &in_;
  std::ostream &out_;
  const Analyzer &analyzer_;

  bool readMessage(std::string &payload);
  void reply(const std::string &payload);
};

} // namespace Yomigana
