#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string_view>
#include <utility>

#include "respress/body-frame.hpp"
#include "respress/compression-middleware.hpp"
#include "respress/encoding.hpp"
#include "respress/http-body.hpp"
#include "respress/http-headers.hpp"
#include "respress/http-response.hpp"

using namespace respress;

// Compresses stdin to stdout as an HTTP response body would be.
// Usage: respress-compress-stdin ['<Accept-Encoding value>'] ['<Content-Type>'] < input > output
// The resulting response headers are printed on stderr.
int main(int argc, char **argv) {
  std::string_view acceptEncoding = argc > 1 ? argv[1] : "gzip, br, zstd";
  std::string_view contentType = argc > 2 ? argv[2] : "text/plain";

  try {
    CompressionMiddleware middleware;

    auto body = std::make_unique<ChunkedBody>();
    ChunkedBody *producer = body.get();

    HttpResponse response;
    response.headers.header("Content-Type", contentType);
    response.body = std::move(body);

    auto compressed = middleware.wrap(HttpHeaders{{"Accept-Encoding", acceptEncoding}}, std::move(response));

    char buf[1 << 14];
    bool headersPrinted = false;
    for (bool inputDone = false;;) {
      if (!inputDone) {
        const std::size_t nbRead = std::fread(buf, 1, sizeof(buf), stdin);
        if (nbRead != 0) {
          producer->write(std::string_view(buf, nbRead));
        }
        if (nbRead < sizeof(buf)) {
          if (std::ferror(stdin) != 0) {
            producer->fail("read error on stdin");
          } else {
            producer->close();
          }
          inputDone = true;
        }
      }
      BodyFrame frame = compressed.poll();
      if (!headersPrinted && compressed.headersCommitted()) {
        for (const auto &[name, value] : compressed.headers()) {
          std::cerr << name << ": " << value << '\n';
        }
        headersPrinted = true;
      }
      if (frame.isData()) {
        std::cout.write(frame.data().data(), static_cast<std::streamsize>(frame.data().size()));
      } else if (frame.isError()) {
        std::cerr << "Compression failed: " << frame.error().message << '\n';
        return EXIT_FAILURE;
      } else if (frame.isEnd()) {
        break;
      }
    }
    std::cout.flush();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
