#include "respress/compression-middleware.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "respress/body-frame.hpp"
#include "respress/compression-body.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-test-helpers.hpp"
#include "respress/encoding.hpp"
#include "respress/features.hpp"
#include "respress/http-body.hpp"
#include "respress/http-headers.hpp"
#include "respress/http-response.hpp"
#include "respress/scripted-body.hpp"

namespace respress {

namespace {

HttpResponse MakeResponse(HttpHeaders headers, std::unique_ptr<HttpBody> body) {
  HttpResponse response;
  response.headers = std::move(headers);
  response.body = std::move(body);
  return response;
}

test::DrainResult DrainResponse(CompressedResponse &response) {
  return test::Drain([&response] { return response.poll(); });
}

}  // namespace

class CompressionMiddlewareTest : public ::testing::Test {
 protected:
  CompressionMiddleware middleware;
};

TEST(CompressionMiddlewareConfigTest, InvalidConfigThrows) {
  CompressionConfig config;
  config.encoderChunkSize = 0;
  EXPECT_THROW(CompressionMiddleware{config}, std::invalid_argument);

  config = CompressionConfig{};
  config.preferredFormats = {Encoding::none};
  EXPECT_THROW(CompressionMiddleware{config}, std::invalid_argument);
}

TEST_F(CompressionMiddlewareTest, KnownLengthAboveThresholdIsCompressedWithBrotli) {
  if constexpr (!brotliEnabled()) {
    GTEST_SKIP();
  }
  const std::string payload = test::MakePatternedPayload(2000);
  auto response = middleware.wrap(
      {{"Accept-Encoding", "gzip, br"}},
      MakeResponse({{"Content-Type", "text/plain"}, {"Content-Length", "2000"}}, std::make_unique<StringBody>(payload)));

  EXPECT_EQ(response.decision().encoding, Encoding::br);
  EXPECT_TRUE(response.headersCommitted());
  EXPECT_EQ(response.headers().headerValue("Content-Encoding"), "br");
  EXPECT_FALSE(response.headers().contains("Content-Length"));
  EXPECT_EQ(response.headers().headerValue("Vary"), "Accept-Encoding");
  EXPECT_EQ(response.headers().headerValue("Content-Type"), "text/plain");
  EXPECT_EQ(response.status(), http::StatusCodeOK);

  const auto result = DrainResponse(response);
  ASSERT_TRUE(result.ended);
  EXPECT_EQ(test::Decompress(Encoding::br, result.data), payload);
}

TEST_F(CompressionMiddlewareTest, ImagesAreNotCompressed) {
  const std::string payload = test::MakeRandomPayload(5000);
  const HttpHeaders headers{{"Content-Type", "image/png"}, {"Content-Length", "5000"}};
  auto response =
      middleware.wrap({{"Accept-Encoding", "gzip"}}, MakeResponse(headers, std::make_unique<StringBody>(payload)));

  EXPECT_FALSE(response.decision().compress());
  EXPECT_EQ(response.headers(), headers);
  EXPECT_TRUE(response.headersCommitted());

  const auto result = DrainResponse(response);
  EXPECT_EQ(result.data, payload);
}

TEST_F(CompressionMiddlewareTest, SvgIsCompressed) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  const std::string payload = test::MakePatternedPayload(5000);
  auto response = middleware.wrap({{"Accept-Encoding", "gzip"}},
                                  MakeResponse({{"Content-Type", "image/svg+xml"}, {"Content-Length", "5000"}},
                                               std::make_unique<StringBody>(payload)));

  EXPECT_EQ(response.headers().headerValue("Content-Encoding"), "gzip");
  const auto result = DrainResponse(response);
  EXPECT_TRUE(test::HasGzipMagic(result.data));
  EXPECT_EQ(test::Decompress(Encoding::gzip, result.data), payload);
}

TEST_F(CompressionMiddlewareTest, SmallKnownLengthPassesThroughWithVary) {
  auto response =
      middleware.wrap({{"Accept-Encoding", "gzip, br, zstd"}},
                      MakeResponse({{"Content-Length", "5"}, {"Vary", "Origin"}}, std::make_unique<StringBody>("hello")));

  EXPECT_FALSE(response.decision().compress());
  EXPECT_FALSE(response.headers().contains("Content-Encoding"));
  EXPECT_EQ(response.headers().headerValue("Content-Length"), "5");
  if constexpr (zlibEnabled() || brotliEnabled() || zstdEnabled()) {
    EXPECT_EQ(response.headers().headerValue("Vary"), "Origin, Accept-Encoding");
  }
  EXPECT_EQ(DrainResponse(response).data, "hello");
}

TEST_F(CompressionMiddlewareTest, AlreadyEncodedBodyIsUntouched) {
  const std::string payload = test::MakeRandomPayload(3000);
  const HttpHeaders headers{{"Content-Encoding", "gzip"}, {"Content-Length", "3000"}, {"Accept-Ranges", "bytes"}};
  auto response = middleware.wrap({{"Accept-Encoding", "gzip, br, zstd"}},
                                  MakeResponse(headers, std::make_unique<StringBody>(payload)));

  EXPECT_EQ(response.headers(), headers);
  EXPECT_EQ(DrainResponse(response).data, payload);
}

TEST_F(CompressionMiddlewareTest, RangeResponseIsNeverCompressed) {
  const std::string payload = test::MakePatternedPayload(1000);
  auto response = middleware.wrap(
      {{"Accept-Encoding", "gzip, br, zstd"}},
      MakeResponse({{"Content-Range", "bytes 0-999/10000"}, {"Content-Length", "1000"}},
                   std::make_unique<StringBody>(payload)));

  EXPECT_FALSE(response.headers().contains("Content-Encoding"));
  EXPECT_EQ(DrainResponse(response).data, payload);
}

TEST_F(CompressionMiddlewareTest, UnknownLengthBelowThresholdRevertsHeaders) {
  if (middleware.encodingSelector().preferenceOrdered().empty()) {
    GTEST_SKIP();
  }
  const Encoding encoding = middleware.encodingSelector().preferenceOrdered().front();
  auto body = std::make_unique<ChunkedBody>();
  auto *producer = body.get();
  auto response = middleware.wrap({{"Accept-Encoding", GetEncodingStr(encoding)}},
                                  MakeResponse({{"Content-Type", "text/html"}}, std::move(body)));

  EXPECT_EQ(response.headers().headerValue("Content-Encoding"), GetEncodingStr(encoding));
  EXPECT_FALSE(response.headersCommitted());

  producer->write("<html>");
  EXPECT_TRUE(response.poll().isPending());
  EXPECT_FALSE(response.headersCommitted());

  producer->write("</html>");
  producer->close();
  auto frame = response.poll();
  ASSERT_TRUE(frame.isData());
  EXPECT_EQ(frame.data(), "<html></html>");
  EXPECT_TRUE(response.headersCommitted());
  EXPECT_EQ(response.headers(), (HttpHeaders{{"Content-Type", "text/html"}, {"Vary", "Accept-Encoding"}}));
  EXPECT_TRUE(response.poll().isEnd());
}

TEST_F(CompressionMiddlewareTest, IdentityFallbackMatchesSkippedResponseHeaders) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  auto response = middleware.wrap(
      {{"Accept-Encoding", "gzip"}},
      MakeResponse({{"Content-Type", "text/plain"}, {"Accept-Ranges", "bytes"}},
                   test::MakeChunkedBody({"0123456789"}, HttpHeaders{{"x-checksum", "abcd"}})));

  EXPECT_FALSE(response.headers().contains("Accept-Ranges"));

  const auto result = DrainResponse(response);
  ASSERT_TRUE(result.ended);
  EXPECT_EQ(result.data, "0123456789");
  EXPECT_EQ(result.nbTrailers, 1U);
  EXPECT_FALSE(response.headers().contains("Content-Encoding"));
  EXPECT_FALSE(response.headers().contains("Content-Length"));
  EXPECT_EQ(response.headers().headerValue("Accept-Ranges"), "bytes");
  EXPECT_EQ(response.headers().headerValue("Content-Type"), "text/plain");
  EXPECT_EQ(response.headers().headerValue("Vary"), "Accept-Encoding");
}

TEST_F(CompressionMiddlewareTest, UnknownLengthAboveThresholdKeepsCompressionHeaders) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  const std::string payload = test::MakePatternedPayload(4000);
  auto response = middleware.wrap({{"Accept-Encoding", "gzip"}},
                                  MakeResponse({{"Content-Type", "application/json"}},
                                               test::MakeChunkedBody(test::SplitPayload(payload, 500))));

  EXPECT_FALSE(response.headersCommitted());
  const auto result = DrainResponse(response);
  EXPECT_TRUE(response.headersCommitted());
  EXPECT_EQ(response.headers().headerValue("Content-Encoding"), "gzip");
  EXPECT_FALSE(response.headers().contains("Content-Length"));
  EXPECT_EQ(test::Decompress(Encoding::gzip, result.data), payload);
}

TEST_F(CompressionMiddlewareTest, EventStreamIsCompressedAndFlushed) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  std::vector<std::string> events;
  std::string payload;
  for (int eventPos = 0; eventPos < 40; ++eventPos) {
    std::string event(48, static_cast<char>('a' + eventPos % 26));
    event.append("\n\n");
    payload.append(event);
    events.push_back(std::move(event));
  }
  auto state = std::make_shared<test::ScriptState>();
  auto response = middleware.wrap(
      {{"Accept-Encoding", "gzip"}},
      MakeResponse({{"Content-Type", "text/event-stream"}}, test::MakeChunkedBody(events, std::nullopt, state)));

  EXPECT_TRUE(response.decision().forceFlush);
  auto first = response.poll();
  ASSERT_TRUE(first.isData());
  EXPECT_EQ(state->nbPolls, 18U);
  EXPECT_TRUE(response.headersCommitted());
  EXPECT_EQ(response.headers().headerValue("Content-Encoding"), "gzip");

  std::string compressed(first.data());
  const auto rest = DrainResponse(response);
  ASSERT_TRUE(rest.ended);
  for (bool flush : rest.flushes) {
    EXPECT_TRUE(flush);
  }
  EXPECT_EQ(rest.chunks.size(), events.size() - 18U + 1U);
  compressed.append(rest.data);
  EXPECT_EQ(test::Decompress(Encoding::gzip, compressed), payload);
}

TEST_F(CompressionMiddlewareTest, GrpcIsNeverCompressed) {
  auto response = middleware.wrap({{"Accept-Encoding", "gzip, br, zstd"}},
                                  MakeResponse({{"Content-Type", "application/grpc"}},
                                               std::make_unique<StringBody>(test::MakePatternedPayload(5000),
                                                                            HttpHeaders{{"grpc-status", "0"}})));

  EXPECT_FALSE(response.decision().compress());
  EXPECT_EQ(response.mode(), CompressionBody::Mode::Passthrough);
  const auto result = DrainResponse(response);
  EXPECT_EQ(result.data, test::MakePatternedPayload(5000));
  EXPECT_EQ(result.nbTrailers, 1U);
}

TEST_F(CompressionMiddlewareTest, GrpcWebIsCompressedFlushedAndKeepsTrailers) {
  if constexpr (!brotliEnabled()) {
    GTEST_SKIP();
  }
  const std::string payload = test::MakePatternedPayload(3000);
  auto response = middleware.wrap(
      {{"Accept-Encoding", "br"}},
      MakeResponse({{"Content-Type", "application/grpc-web+proto"}},
                   test::MakeChunkedBody(test::SplitPayload(payload, 1000), HttpHeaders{{"grpc-status", "0"}})));

  EXPECT_EQ(response.decision().encoding, Encoding::br);
  EXPECT_TRUE(response.decision().forceFlush);
  const auto result = DrainResponse(response);
  ASSERT_TRUE(result.ended);
  EXPECT_EQ(result.nbTrailers, 1U);
  EXPECT_FALSE(result.dataAfterTrailers);
  EXPECT_EQ(result.trailers->headerValue("grpc-status"), "0");
  for (bool flush : result.flushes) {
    EXPECT_TRUE(flush);
  }
  EXPECT_EQ(test::Decompress(Encoding::br, result.data), payload);
}

TEST_F(CompressionMiddlewareTest, UpstreamErrorSurfacesAsErrorFrame) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  auto body = std::make_unique<ChunkedBody>();
  body->write(test::MakePatternedPayload(2000));
  body->fail("upstream timeout");
  auto response = middleware.wrap({{"Accept-Encoding", "gzip"}}, MakeResponse({}, std::move(body)));

  const auto result = DrainResponse(response);
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->kind, BodyError::Kind::Upstream);
  EXPECT_EQ(result.error->message, "upstream timeout");
  EXPECT_TRUE(response.poll().isError());
}

TEST_F(CompressionMiddlewareTest, CancelStopsOutput) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  auto state = std::make_shared<test::ScriptState>();
  auto response = middleware.wrap(
      {{"Accept-Encoding", "gzip"}},
      MakeResponse({{"Content-Length", "100000"}},
                   test::MakeChunkedBody(test::SplitPayload(test::MakePatternedPayload(100000), 1000), std::nullopt,
                                         state)));

  response.cancel();
  EXPECT_TRUE(state->destroyed);
  EXPECT_TRUE(response.poll().isEnd());
  EXPECT_TRUE(response.poll().isEnd());
}

TEST_F(CompressionMiddlewareTest, NullBodyWithUnknownLength) {
  if constexpr (!zlibEnabled()) {
    GTEST_SKIP();
  }
  auto response = middleware.wrap({{"Accept-Encoding", "gzip"}}, MakeResponse({}, nullptr));

  EXPECT_TRUE(response.poll().isEnd());
  EXPECT_TRUE(response.headersCommitted());
  EXPECT_FALSE(response.headers().contains("Content-Encoding"));
  EXPECT_FALSE(response.headers().contains("Content-Length"));
}

TEST(CompressionMiddlewareCustomTest, PreferredFormatsAndVaryDisabled) {
  if constexpr (!zlibEnabled() || !brotliEnabled()) {
    GTEST_SKIP();
  }
  CompressionConfig config;
  config.preferredFormats = {Encoding::gzip, Encoding::br};
  config.addVaryHeader = false;
  config.minBytes = 10;
  CompressionMiddleware middleware(std::move(config));
  EXPECT_EQ(middleware.config().minBytes, 10U);
  EXPECT_EQ(middleware.encodingSelector().preferenceOrdered().size(), 2U);

  auto response = middleware.wrap({{"Accept-Encoding", "br, zstd, gzip"}},
                                  MakeResponse({{"Content-Length", "100"}},
                                               std::make_unique<StringBody>(test::MakePatternedPayload(100))));
  EXPECT_EQ(response.decision().encoding, Encoding::gzip);
  EXPECT_FALSE(response.headers().contains("Vary"));
  EXPECT_EQ(test::Decompress(Encoding::gzip, DrainResponse(response).data), test::MakePatternedPayload(100));
}

}  // namespace respress
