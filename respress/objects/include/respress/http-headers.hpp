#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respress {

namespace http {

struct HeaderView {
  std::string_view name;
  std::string_view value;
};

}  // namespace http

// Ordered list of HTTP header fields (also used for trailer fields).
// Insertion order and original name casing are preserved; all lookups by name are case-insensitive
// (RFC 9110 §5.1). Values are stored trimmed of surrounding optional whitespace.
class HttpHeaders {
 public:
  struct Field {
    std::string name;
    std::string value;

    bool operator==(const Field &) const noexcept = default;
  };

  using const_iterator = std::vector<Field>::const_iterator;

  HttpHeaders() noexcept = default;

  HttpHeaders(std::initializer_list<http::HeaderView> headers);

  // Append a header line (duplicates allowed).
  HttpHeaders &addHeader(std::string_view name, std::string_view value);

  // Add or replace a header value ensuring at most one instance.
  // The original casing of the first occurrence is preserved, later duplicates are removed.
  HttpHeaders &header(std::string_view name, std::string_view value);

  // Append a value to the first occurrence of a header, inserting the header if it is currently missing.
  // The existing value is expanded in-place by inserting `separator` followed by `value`.
  HttpHeaders &appendHeaderValue(std::string_view name, std::string_view value, std::string_view separator = ", ");

  // Removes all occurrences of the given header, returning the number of removed fields.
  std::size_t removeHeader(std::string_view name);

  // Value of the first occurrence of the given header, or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Value of the first occurrence of the given header, or an empty view if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    const auto optValue = headerValue(name);
    return optValue ? *optValue : std::string_view{};
  }

  // Values of all occurrences of the given header joined with ", " (RFC 9110 §5.3 list combination).
  [[nodiscard]] std::string combinedValue(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return headerValue(name).has_value(); }

  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.end(); }

  bool operator==(const HttpHeaders &) const noexcept = default;

 private:
  std::vector<Field> _fields;
};

}  // namespace respress
