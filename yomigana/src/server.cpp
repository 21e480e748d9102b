#include "server.hpp"
#include "protocol.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace Yomigana {

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("YOMIGANA_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

// 符号なし10進数のみ受け付ける (std::stoul は "-1" も受理してしまう)
static bool parseContentLength(const std::string &value, size_t &length) {
  size_t begin = value.find_first_not_of(" \t");
  size_t end = value.find_last_not_of(" \t");
  if (begin == std::string::npos)
    return false;

  size_t result = 0;
  for (size_t i = begin; i <= end; ++i) {
    unsigned char c = static_cast<unsigned char>(value[i]);
    if (!std::isdigit(c))
      return false;
    result = result * 10 + (c - '0');
    if (result > RequestServer::kMaxContentLength)
      return false;
  }
  length = result;
  return true;
}

RequestServer::RequestServer(std::istream &in, std::ostream &out,
                             const Analyzer &analyzer)
    : in_(in), out_(out), analyzer_(analyzer) {}

bool RequestServer::readMessage(std::string &payload) {
  // ヘッダー: Content-Length、空行、本文の順
  std::string line;
  size_t contentLength = 0;
  bool sawHeader = false;

  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("Content-Length:", 0) == 0) {
      if (!parseContentLength(line.substr(15), contentLength)) {
        if (isDebugEnabled()) {
          std::cerr << "[DEBUG] bad Content-Length header: " << line
                    << std::endl;
        }
        return false;
      }
      sawHeader = true;
    }
    if (line.empty()) {
      if (sawHeader)
        break; // 空行はヘッダー終了を示す
    }
  }

  if (!sawHeader || !in_.good())
    return false;

  payload.assign(contentLength, '\0');
  if (contentLength == 0)
    return true;
  in_.read(&payload[0], static_cast<std::streamsize>(contentLength));
  return in_.gcount() == static_cast<std::streamsize>(contentLength);
}

void RequestServer::reply(const std::string &payload) {
  out_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
  out_.flush();
}

size_t RequestServer::run() {
  size_t handled = 0;
  std::string payload;
  while (readMessage(payload)) {
    std::string response = protocol::analyzeBytes(analyzer_, payload);
    if (isDebugEnabled() && protocol::isErrorResponse(response)) {
      std::cerr << "[DEBUG] request failed: " << response << std::endl;
    }
    reply(response);
    ++handled;
  }
  return handled;
}

} // namespace Yomigana
